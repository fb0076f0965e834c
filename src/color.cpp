#include <color.hpp>

#include <fmt/format.h>

#include <array>

namespace
{

std::optional<std::uint8_t> hex_digit(char c)
{
  if(c >= '0' && c <= '9')
    return static_cast<std::uint8_t>(c - '0');
  if(c >= 'a' && c <= 'f')
    return static_cast<std::uint8_t>(c - 'a' + 10);
  if(c >= 'A' && c <= 'F')
    return static_cast<std::uint8_t>(c - 'A' + 10);
  return std::nullopt;
}

}

std::optional<rgba_color> rgba_color::from_hex(std::string_view hex)
{
  if(!hex.empty() && hex.front() == '#')
    hex.remove_prefix(1);

  const bool short_form = hex.size() == 3 || hex.size() == 4;
  const bool long_form = hex.size() == 6 || hex.size() == 8;
  if(!short_form && !long_form)
    return std::nullopt;

  std::array<std::uint8_t, 4> channels = { 0, 0, 0, 255 };

  const std::size_t width = short_form ? 1 : 2;
  for(std::size_t i = 0; i * width < hex.size(); ++i)
  {
    auto hi = hex_digit(hex[i * width]);
    auto lo = hex_digit(hex[i * width + width - 1]);
    if(!hi || !lo)
      return std::nullopt;

    // "#f8c" is shorthand for "#ff88cc"
    channels[i] = static_cast<std::uint8_t>(*hi * 16 + *lo);
  }

  return rgba_color { channels[0], channels[1], channels[2], channels[3] };
}

std::string rgba_color::to_string() const
{
  if(a != 255)
    return fmt::format("#{:02x}{:02x}{:02x}{:02x}", r, g, b, a);
  return fmt::format("#{:02x}{:02x}{:02x}", r, g, b);
}
