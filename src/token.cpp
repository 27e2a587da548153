#include <token.hpp>

namespace hack
{

std::string_view kind_to_str(token_kind kind)
{
  switch(kind)
  {
  default:
  case token_kind::EndOfFile: return "EOF";
  case token_kind::Symbol: return "Symbol";
  case token_kind::Literal: return "Literal";
  case token_kind::Newline: return "Newline";
  case token_kind::At: return "At";
  case token_kind::LParen: return "LParen";
  case token_kind::RParen: return "RParen";
  case token_kind::Equal: return "Equal";
  case token_kind::Semi: return "Semicolon";
  case token_kind::Plus: return "Plus";
  case token_kind::Minus: return "Minus";
  case token_kind::Bang: return "Bang";
  case token_kind::Pipe: return "Pipe";
  case token_kind::Ampersand: return "Ampersand";
  case token_kind::Undef: return "Undefined";
  }
}

std::string_view token::spelling() const
{
  switch(kind)
  {
  case token_kind::Newline: return "end of line";
  case token_kind::EndOfFile: return "end of file";
  default: return data;
  }
}

void to_json(nlohmann::json& j, const token& t)
{
  j = nlohmann::json{
    { "kind", t.kind },
    { "data", t.data },
    { "range", t.loc },
  };
}

}
