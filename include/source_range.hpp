#pragma once

#include <symbol.hpp>

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

// Where a node came from: the module and the rows and columns it spans.
struct source_range
{
  symbol module;

  std::size_t column_beg { 0 };
  std::size_t row_beg { 0 };

  std::size_t column_end { 0 };
  std::size_t row_end { 0 };

  source_range() = default;

  source_range(symbol module, std::size_t column_beg, std::size_t row_beg,
                              std::size_t column_end, std::size_t row_end);
};

void to_json(nlohmann::json& j, const source_range& s);
