#include <reader.hpp>
#include <diagnostic.hpp>
#include <diagnostic_db.hpp>

#include <tsl/robin_map.h>

#include <algorithm>
#include <sstream>
#include <cctype>

using namespace std::literals::string_view_literals;

namespace hack
{

static const auto register_map = tsl::robin_map<char, reg>({
  { 'A', reg::A },
  { 'D', reg::D },
  { 'M', reg::M },
});

static const auto jump_map = tsl::robin_map<std::string_view, jump_kind>({
  { "JMP"sv, jump_kind::JMP },
  { "JGT"sv, jump_kind::JGT },
  { "JEQ"sv, jump_kind::JEQ },
  { "JLT"sv, jump_kind::JLT },
  { "JGE"sv, jump_kind::JGE },
  { "JLE"sv, jump_kind::JLE },
  { "JNE"sv, jump_kind::JNE },
});

std::optional<reg> register_of(char ch)
{
  auto it = register_map.find(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
  if(it == register_map.end())
    return std::nullopt;
  return it->second;
}

std::optional<reg> register_of(const token& tok)
{
  if(tok.kind != token_kind::Symbol || tok.data.size() != 1)
    return std::nullopt;
  return register_of(tok.data.front());
}

std::optional<jump_kind> jump_of(const token& tok)
{
  if(tok.kind != token_kind::Symbol || tok.data.size() != 3)
    return std::nullopt;

  // compare on an upper case copy, the token keeps its spelling
  std::string upper = tok.data;
  std::transform(upper.begin(), upper.end(), upper.begin(),
      [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  auto it = jump_map.find(std::string_view(upper));
  if(it == jump_map.end())
    return std::nullopt;
  return it->second;
}

std::string syntax_error::message() const
{ return diag["message"].get<std::string>(); }


void reader::consume()
{
  old = current;
  current = next_toks[0];

  for(std::size_t i = 0, j = 1; j < next_toks.size(); ++i, ++j)
    std::swap(next_toks[i], next_toks[j]);

  next_toks.back() = gett();
}

const token& reader::peek(std::size_t n) const
{ return n == 0 ? current : next_toks[n - 1]; }

bool reader::accept(token_kind kind)
{
  if(current.kind != kind)
    return false;
  consume();
  return true;
}

template<typename F>
bool reader::expect(token_kind kind, std::string_view rule, F&& f)
{
  if(current.kind != kind)
  {
    mk_error(current, rule, std::forward<F>(f));
    return false;
  }
  consume();
  return true;
}

template<typename F>
std::nullopt_t reader::mk_error(const token& at, std::string_view rule, F&& f)
{
  if(error)
    return std::nullopt;

  // a character no rule accepts is reported as such, whatever rule was expected
  auto diag = at.kind == token_kind::Undef
    ? diagnostic_db::parser::unknown_token(at.loc, at.spelling())
    : f(at.loc, at.spelling());

  error = syntax_error { at.loc, rule, std::move(diag) };
  return std::nullopt;
}

// l := `(` symbol `)`
std::optional<instruction> reader::parse_label()
{
  consume(); // (

  if(!expect(token_kind::Symbol, rule::symbol, diagnostic_db::parser::label_expects_symbol))
    return std::nullopt;
  auto name = old.data;

  if(!expect(token_kind::RParen, rule::label, diagnostic_db::parser::label_expects_rparen))
    return std::nullopt;

  return label { symbol { std::move(name) } };
}

// a := `@` literal
//    | `@` symbol
std::optional<instruction> reader::parse_at_instruction()
{
  consume(); // @

  if(accept(token_kind::Literal))
    return at_instruction { literal { old.data } };
  if(accept(token_kind::Symbol))
    return at_instruction { symbol { old.data } };

  return mk_error(current, rule::at_operand, diagnostic_db::parser::at_expects_operand);
}

// c := [dest `=`] comp [`;` jump]
std::optional<instruction> reader::parse_c_instruction()
{
  auto dest = parse_destination();
  if(!dest)
    return std::nullopt;

  auto comp = parse_computation();
  if(!comp)
    return std::nullopt;

  std::optional<jump_kind> jump;
  if(accept(token_kind::Semi))
  {
    jump = parse_jump();
    if(!jump)
      return std::nullopt;
  }

  return c_instruction { std::move(*dest), *comp, jump };
}

// dest := reg{1,3}, written as one token and only present if `=` follows
std::optional<std::vector<reg>> reader::parse_destination()
{
  std::vector<reg> dest;
  if(current.kind != token_kind::Symbol || peek(1).kind != token_kind::Equal)
    return dest;

  if(current.data.size() > 3)
    return mk_error(current, rule::destination, diagnostic_db::parser::destination_too_long);

  for(char ch : current.data)
  {
    auto r = register_of(ch);
    if(!r)
      return mk_error(current, rule::destination, diagnostic_db::parser::not_a_register);
    dest.push_back(*r);
  }
  consume(); // dest
  consume(); // =

  return dest;
}

// comp := constant | unary | binary | reg      first match wins
std::optional<computation> reader::parse_computation()
{
  if(auto c = match_constant())
    return c;
  if(auto u = match_unary())
    return u;
  if(auto b = match_binary())
    return b;
  if(auto r = match_register())
    return r;

  return mk_error(current, rule::computation, diagnostic_db::parser::computation_expected);
}

// constant := `0` | `1` | `-` `1`
std::optional<computation> reader::match_constant()
{
  if(current.kind == token_kind::Literal && (current.data == "0" || current.data == "1"))
  {
    consume();
    return constant { static_cast<std::int_fast8_t>(old.data == "1" ? 1 : 0) };
  }
  if(current.kind == token_kind::Minus && peek(1).kind == token_kind::Literal && peek(1).data == "1")
  {
    consume();
    consume();
    return constant { -1 };
  }
  return std::nullopt;
}

// unary := `!` reg | `-` reg | reg `+` `1` | reg `-` `1`
std::optional<computation> reader::match_unary()
{
  if(current.kind == token_kind::Bang || current.kind == token_kind::Minus)
  {
    auto operand = register_of(peek(1));
    if(!operand)
      return std::nullopt;

    auto kind = current.kind == token_kind::Bang ? unary_kind::Not : unary_kind::Neg;
    consume();
    consume();
    return unary { kind, *operand };
  }

  auto operand = register_of(current);
  if(!operand)
    return std::nullopt;
  if((peek(1).kind == token_kind::Plus || peek(1).kind == token_kind::Minus)
      && peek(2).kind == token_kind::Literal && peek(2).data == "1")
  {
    auto kind = peek(1).kind == token_kind::Plus ? unary_kind::Inc : unary_kind::Dec;
    consume();
    consume();
    consume();
    return unary { kind, *operand };
  }
  return std::nullopt;
}

// binary := reg (`+` | `|` | `-` | `&`) reg
std::optional<computation> reader::match_binary()
{
  auto lhs = register_of(current);
  auto rhs = register_of(peek(2));
  if(!lhs || !rhs)
    return std::nullopt;

  binary_op op;
  switch(peek(1).kind)
  {
  default: return std::nullopt;
  case token_kind::Plus: op = binary_op::Add; break;
  case token_kind::Pipe: op = binary_op::Or; break;
  case token_kind::Minus: op = binary_op::Sub; break;
  case token_kind::Ampersand: op = binary_op::And; break;
  }
  consume();
  consume();
  consume();
  return binary { *lhs, op, *rhs };
}

std::optional<computation> reader::match_register()
{
  auto r = register_of(current);
  if(!r)
    return std::nullopt;
  consume();
  return *r;
}

// jump := JMP | JGT | JEQ | JLT | JGE | JLE | JNE    in any case
std::optional<jump_kind> reader::parse_jump()
{
  auto j = jump_of(current);
  if(!j)
    return mk_error(current, rule::jump, diagnostic_db::parser::jump_expected);
  consume();
  return j;
}

std::optional<instruction> reader::parse_instruction()
{
  switch(current.kind)
  {
  case token_kind::LParen: return parse_label();
  case token_kind::At: return parse_at_instruction();
  default: return parse_c_instruction();
  }
}

// program := line (`\n` line)*
// line    := [instruction] [comment]       comments never reach the token stream
parse_result reader::read_program()
{
  std::vector<instruction> instructions;
  while(current.kind != token_kind::EndOfFile)
  {
    if(accept(token_kind::Newline))
      continue;

    auto instr = parse_instruction();
    if(!instr)
      return *error;

    if(current.kind != token_kind::EndOfFile
        && !expect(token_kind::Newline, rule::end_of_line, diagnostic_db::parser::end_of_line_expected))
      return *error;

    instructions.emplace_back(std::move(*instr));
  }
  return program(std::move(instructions));
}

parse_result reader::read(std::istream& is, std::string module)
{
  reader r(is, std::move(module));

  return r.read_program();
}

parse_result reader::read_text(const std::string& text, std::string module)
{
  std::stringstream ss(text);
  reader r(ss, std::move(module));

  return r.read_program();
}


parse_result parser::parse_text(const std::string& text, std::string module)
{ return reader::read_text(text, std::move(module)); }

parse_result parser::parse_stream(std::istream& is, std::string module)
{ return reader::read(is, std::move(module)); }

}
