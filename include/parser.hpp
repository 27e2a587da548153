#pragma once

#include <instructions.hpp>
#include <source_range.hpp>

#include <nlohmann/json.hpp>

#include <string_view>
#include <variant>
#include <iosfwd>
#include <string>

namespace hack
{

// names of the grammar rules a syntax error can expect
namespace rule
{
  constexpr std::string_view label = "label";
  constexpr std::string_view symbol = "symbol";
  constexpr std::string_view at_operand = "literal or symbol";
  constexpr std::string_view destination = "destination";
  constexpr std::string_view computation = "computation";
  constexpr std::string_view jump = "jump";
  constexpr std::string_view end_of_line = "end of line";
}

struct syntax_error
{
  source_range loc;
  std::string_view expected;

  // error record as produced by diagnostic_db, ready for the diagnostics_manager
  nlohmann::json diag;

  std::string message() const;
};

using parse_result = std::variant<program, syntax_error>;

struct parser
{
  // Whole-or-nothing: either every line parses or the first error is returned.
  static parse_result parse_text(const std::string& text, std::string module = "#TXT#");
  static parse_result parse_stream(std::istream& is, std::string module);
};

}
