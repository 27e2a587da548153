#include <reader.hpp>

#include <tsl/robin_map.h>

#include <istream>
#include <sstream>
#include <cctype>

namespace hack
{

static const auto operator_symbols_map = tsl::robin_map<char, token_kind>({
  {'@', token_kind::At},
  {'(', token_kind::LParen},
  {')', token_kind::RParen},
  {'=', token_kind::Equal},
  {';', token_kind::Semi},
  {'+', token_kind::Plus},
  {'-', token_kind::Minus},
  {'!', token_kind::Bang},
  {'|', token_kind::Pipe},
  {'&', token_kind::Ampersand},
});

constexpr static bool is_symbol_special(char c)
{ return c == '.' || c == '_' || c == '$' || c == '%' || c == '#'; }

static bool is_symbol_start(char c)
{ return std::isalpha(static_cast<unsigned char>(c)) || is_symbol_special(c); }

static bool is_symbol_char(char c)
{ return std::isalnum(static_cast<unsigned char>(c)) || is_symbol_special(c); }

base_reader::base_reader(std::istream& stream, std::string module)
  : module(std::move(module)), is(stream), linebuf(), col(1), row(0)
{  }

int base_reader::getc()
{
  while(true)
  {
    // col == linebuf.size() + 1 means the line including its newline is used up
    if(col > linebuf.size())
    {
      if(!std::getline(is, linebuf))
      {
        line_terminated = false;
        col = linebuf.size() + 1;
        return EOF;
      }
      row++;
      col = 0;

      // the last line has no '\n', getline hits eof on it
      line_terminated = !is.eof();
      if(!linebuf.empty() && linebuf.back() == '\r')
        linebuf.pop_back();
    }
    if(col == linebuf.size())
    {
      col++;
      if(line_terminated)
        return '\n';
      continue;
    }
    char ch = linebuf[col++];
    if(ch == ' ' || ch == '\t')
      continue;
    return static_cast<unsigned char>(ch);
  }
}

void base_reader::skip_line()
{ col = linebuf.size(); }


///// Tokenization

token reader::gett()
{
restart_get:
  std::string data;
  token_kind kind = token_kind::Undef;

  int ch = getc();
  const std::size_t beg_row = row;
  const std::size_t beg_col = col;

  switch(ch)
  {
  default:
    if(is_symbol_start(static_cast<char>(ch)))
    {
      data.push_back(static_cast<char>(ch));
      // don't use getc() here, whitespace ends a symbol
      while(col < linebuf.size() && is_symbol_char(linebuf[col]))
        data.push_back(linebuf[col++]);

      kind = token_kind::Symbol;
    }
    else if(auto it = operator_symbols_map.find(static_cast<char>(ch)); it != operator_symbols_map.end())
    {
      data.push_back(static_cast<char>(ch));
      kind = it->second;
    }
    else
    {
      // no rule starts with this character, the grammar reports it
      data.push_back(static_cast<char>(ch));
      kind = token_kind::Undef;
    }
    break;

  case '0': case '1': case '2': case '3': case '4':
  case '5': case '6': case '7': case '8': case '9':
    {
      // literals are digits only, "12ab" is the literal "12" followed by the symbol "ab"
      data.push_back(static_cast<char>(ch));
      while(col < linebuf.size() && std::isdigit(static_cast<unsigned char>(linebuf[col])))
        data.push_back(linebuf[col++]);

      kind = token_kind::Literal;
    } break;

  case '/':
    {
      if(col < linebuf.size() && linebuf[col] == '/')
      {
        skip_line();
        goto restart_get;
      }
      data = "/";
      kind = token_kind::Undef;
    } break;

  case '\n':
    kind = token_kind::Newline;
    break;

  case EOF:
    kind = token_kind::EndOfFile;
    break;
  }
  return token(kind, std::move(data), {module, beg_col, beg_row, col + 1, row});
}

std::vector<token> reader::tokenize(const std::string& text, std::string module)
{
  std::stringstream ss(text);
  reader r(ss, std::move(module));

  // the constructor already pulled the first tokens into the lookahead
  std::vector<token> toks;
  while(r.current.kind != token_kind::EndOfFile)
  {
    toks.push_back(r.current);
    r.consume();
  }
  toks.push_back(r.current);
  return toks;
}

}
