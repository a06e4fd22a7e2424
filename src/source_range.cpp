#include <source_range.hpp>

#include <algorithm>

namespace ktree
{

source_range::source_range(std::string_view module, std::size_t column_beg, std::size_t row_beg,
                                                    std::size_t column_end, std::size_t row_end)
  : module(module), column_beg(column_beg), row_beg(row_beg), column_end(column_end), row_end(row_end)
{  }

source_range source_range::from_offsets(std::string_view module, std::string_view text,
                                        std::size_t beg, std::size_t end)
{
  beg = std::min(beg, text.size());
  end = std::clamp(end, beg, text.size());

  source_range range { module, 1, 1, 1, 1 };
  for(std::size_t i = 0; i < end; ++i)
  {
    if(i == beg)
    {
      range.row_beg = range.row_end;
      range.column_beg = range.column_end;
    }
    if(text[i] == '\n')
    {
      ++range.row_end;
      range.column_end = 1;
    }
    else
      ++range.column_end;
  }
  if(beg == end)
  {
    range.row_beg = range.row_end;
    range.column_beg = range.column_end;
  }
  return range;
}

source_range& source_range::widen(const source_range& other)
{
  if(std::make_pair(other.row_beg, other.column_beg) < std::make_pair(row_beg, column_beg))
  {
    row_beg = other.row_beg;
    column_beg = other.column_beg;
  }
  if(std::make_pair(row_end, column_end) < std::make_pair(other.row_end, other.column_end))
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
  return std::string(module) + ":"
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

}
