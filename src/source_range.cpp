#include <source_range.hpp>

#include <algorithm>
#include <utility>

source_range::source_range(std::string module, std::size_t column_beg, std::size_t row_beg,
                                               std::size_t column_end, std::size_t row_end)
  : module(std::move(module)), column_beg(column_beg), row_beg(row_beg), column_end(column_end), row_end(row_end)
{  }

source_range& source_range::widen(const source_range& other)
{
  // rows dominate, the column only matters on the same row
  if(other.row_beg < row_beg || (other.row_beg == row_beg && other.column_beg < column_beg))
  {
    row_beg = other.row_beg;
    column_beg = other.column_beg;
  }
  if(other.row_end > row_end || (other.row_end == row_end && other.column_end > column_end))
  {
    row_end = other.row_end;
    column_end = other.column_end;
  }
  return *this;
}

source_range& source_range::operator+=(const source_range& other)
{ return this->widen(other); }

std::string source_range::to_string() const
{
  return module + ":"
    + std::to_string(row_beg) + ":"
    + std::to_string(column_beg);
}

std::ostream& operator<<(std::ostream& os, const source_range& src_range)
{
  return os << src_range.to_string();
}

source_range operator+(const source_range& left, const source_range& right)
{
  source_range range = left;

  range.widen(right);

  return range;
}

bool operator==(const source_range& lhs, const source_range& rhs)
{
  return lhs.module == rhs.module
      && lhs.column_beg == rhs.column_beg && lhs.row_beg == rhs.row_beg
      && lhs.column_end == rhs.column_end && lhs.row_end == rhs.row_end;
}

bool operator!=(const source_range& lhs, const source_range& rhs)
{ return !(lhs == rhs); }


void to_json(nlohmann::json& j, const source_range& s)
{
  j = nlohmann::json{
    { "module", s.module },
    { "col_beg", s.column_beg },
    { "row_beg", s.row_beg },
    { "col_end", s.column_end },
    { "row_end", s.row_end },
  };
}

void from_json(const nlohmann::json& j, source_range& s)
{
  s = source_range { j["module"].get<std::string>(),
                     j["col_beg"].get<std::size_t>(),
                     j["row_beg"].get<std::size_t>(),
                     j["col_end"].get<std::size_t>(),
                     j["row_end"].get<std::size_t>()
  };
}
