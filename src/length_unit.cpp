#include <length_unit.hpp>

using namespace std::string_view_literals;

std::string_view to_string(length_unit unit)
{
  switch(unit)
  {
  case length_unit::pt: return "pt"sv;
  case length_unit::mm: return "mm"sv;
  case length_unit::cm: return "cm"sv;
  case length_unit::in: return "in"sv;
  }
  return ""sv;
}

std::optional<length_unit> length_unit_from_string(std::string_view str)
{
  if(str == "pt") return length_unit::pt;
  if(str == "mm") return length_unit::mm;
  if(str == "cm") return length_unit::cm;
  if(str == "in") return length_unit::in;
  return std::nullopt;
}
