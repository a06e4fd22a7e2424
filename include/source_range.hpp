#pragma once

#include <nlohmann/json.hpp>
#include <string_view>
#include <cstdint>
#include <ostream>
#include <string>

namespace ktree
{

struct source_range
{
  std::string_view module { "<ast>" };

  std::size_t column_beg { 0 };
  std::size_t row_beg { 0 };

  std::size_t column_end { 0 };
  std::size_t row_end { 0 };

  source_range() = default;

  source_range(std::string_view module, std::size_t column_beg, std::size_t row_beg,
                                  std::size_t column_end, std::size_t row_end);

  // Rows and columns are 1-based, offsets are byte offsets into `text`.
  static source_range from_offsets(std::string_view module, std::string_view text,
                                   std::size_t beg, std::size_t end);

  source_range& widen(const source_range& range);
  source_range& operator+=(const source_range& range);

  std::string to_string() const;

  friend std::ostream& operator<<(std::ostream& os, const source_range& src_range);
};

source_range operator+(const source_range& left, const source_range& right);

void to_json(nlohmann::json& j, const source_range& s);

}
