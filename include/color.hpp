#pragma once

#include <string_view>
#include <optional>
#include <cstdint>
#include <string>

struct rgba_color
{
  std::uint8_t r { 0 };
  std::uint8_t g { 0 };
  std::uint8_t b { 0 };
  std::uint8_t a { 255 };

  // Accepts "#rgb", "#rgba", "#rrggbb" and "#rrggbbaa", the leading '#' is optional.
  static std::optional<rgba_color> from_hex(std::string_view hex);

  // "#rrggbb", or "#rrggbbaa" when not fully opaque
  std::string to_string() const;

  bool operator==(const rgba_color& other) const
  { return r == other.r && g == other.g && b == other.b && a == other.a; }
  bool operator!=(const rgba_color& other) const
  { return !(*this == other); }
};
