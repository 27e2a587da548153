#pragma once

#include <instructions.hpp>
#include <source_range.hpp>
#include <parser.hpp>
#include <token.hpp>

#include <optional>
#include <cstdio>
#include <iosfwd>
#include <vector>
#include <string>
#include <array>

namespace hack
{

class base_reader
{
protected:
  base_reader(std::istream& stream, std::string module);

  // yields the next char that is neither space nor tab, '\n' at the end of each terminated line
  int getc();

  // drops the rest of the current line, the newline itself is still delivered
  void skip_line();
protected:
  std::string module;
  std::istream& is;

  std::string linebuf;
  bool line_terminated { false };

  std::size_t col;
  std::size_t row;
};

class reader : base_reader
{
public:
  // current token plus two, enough for `r op r`
  static constexpr std::size_t lookahead_size = 2;

  static std::vector<token> tokenize(const std::string& text, std::string module = "#TXT#");

  static parse_result read(std::istream& is, std::string module);
  static parse_result read_text(const std::string& text, std::string module = "#TXT#");

private:
  reader(std::istream& is, std::string module) : base_reader(is, std::move(module))
  {
    for(std::size_t i = 0; i < next_toks.size(); ++i)
      consume();

    // need one additional consume to initialize `current`
    consume();
  }

  token gett();

  void consume();

  // "soft error"    -> only consumes if ==
  bool accept(token_kind kind);
  // "hard error"    -> records the error and stops
  template<typename F>
  bool expect(token_kind kind, std::string_view rule, F&& f);

  // records the first error only, the parse ends with it
  template<typename F>
  std::nullopt_t mk_error(const token& at, std::string_view rule, F&& f);

  parse_result read_program();
private:
  std::optional<instruction> parse_instruction();
  std::optional<instruction> parse_label();
  std::optional<instruction> parse_at_instruction();
  std::optional<instruction> parse_c_instruction();

  std::optional<std::vector<reg>> parse_destination();
  std::optional<computation> parse_computation();
  std::optional<jump_kind> parse_jump();

  // ordered alternatives of a computation, none consumes unless it matches
  std::optional<computation> match_constant();
  std::optional<computation> match_unary();
  std::optional<computation> match_binary();
  std::optional<computation> match_register();

  const token& peek(std::size_t n) const;
private:
  token old;
  token current;
  std::array<token, lookahead_size> next_toks;

  std::optional<syntax_error> error;
};

// A, D or M in any case, only single letter symbols qualify
std::optional<reg> register_of(const token& tok);
std::optional<reg> register_of(char ch);

// one of the seven mnemonics in any case
std::optional<jump_kind> jump_of(const token& tok);

}
