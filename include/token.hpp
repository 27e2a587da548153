#pragma once

#include <source_range.hpp>

#include <nlohmann/json.hpp>

#include <string_view>
#include <cstdint>
#include <cstdio>
#include <string>

namespace hack
{

enum class token_kind : std::int8_t
{
  Symbol = 1,
  Literal = 2,
  Newline = '\n',
  At = '@',
  LParen = '(',
  RParen = ')',
  Equal = '=',
  Semi = ';',
  Plus = '+',
  Minus = '-',
  Bang = '!',
  Pipe = '|',
  Ampersand = '&',
  Undef = 0,
  EndOfFile = EOF
};

NLOHMANN_JSON_SERIALIZE_ENUM( token_kind, {
  { token_kind::Undef, "Undefined" },
  { token_kind::Symbol, "Symbol" },
  { token_kind::Literal, "Literal" },
  { token_kind::Newline, "Newline" },
  { token_kind::At, "At" },
  { token_kind::LParen, "LParen" },
  { token_kind::RParen, "RParen" },
  { token_kind::Equal, "Equal" },
  { token_kind::Semi, "Semicolon" },
  { token_kind::Plus, "Plus" },
  { token_kind::Minus, "Minus" },
  { token_kind::Bang, "Bang" },
  { token_kind::Pipe, "Pipe" },
  { token_kind::Ampersand, "Ampersand" },
  { token_kind::EndOfFile, "EOF" },
})

std::string_view kind_to_str(token_kind kind);

struct token
{
  token(token_kind kind, std::string data, source_range range)
    : kind(kind), data(std::move(data)), loc(std::move(range))
  {  }

  token()
    : kind(token_kind::Undef), data(""), loc()
  {  }

  // text for diagnostics, newline and EOF have no printable data
  std::string_view spelling() const;

  token_kind kind;
  std::string data;
  source_range loc;
};

void to_json(nlohmann::json& j, const token& t);

}
