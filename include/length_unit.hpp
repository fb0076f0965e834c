#pragma once

#include <string_view>
#include <optional>
#include <cstdint>

enum class length_unit : std::int_fast8_t
{
  pt,
  mm,
  cm,
  in,
};

std::string_view to_string(length_unit unit);
std::optional<length_unit> length_unit_from_string(std::string_view str);
