#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <ostream>
#include <string>

struct source_range
{
  std::string module;

  std::size_t column_beg;
  std::size_t row_beg;

  std::size_t column_end;
  std::size_t row_end;

  source_range() = default;

  source_range(std::string module, std::size_t column_beg, std::size_t row_beg,
                                   std::size_t column_end, std::size_t row_end);

  source_range& widen(const source_range& range);
  source_range& operator+=(const source_range& range);

  // module:row:col
  std::string to_string() const;

  friend std::ostream& operator<<(std::ostream& os, const source_range& src_range);
};

source_range operator+(const source_range& left, const source_range& right);

bool operator==(const source_range& lhs, const source_range& rhs);
bool operator!=(const source_range& lhs, const source_range& rhs);

void to_json(nlohmann::json& j, const source_range& s);
void from_json(const nlohmann::json& j, source_range& s);
