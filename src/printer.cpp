#include <printer.hpp>

#include <cstdlib>

namespace syntax
{

std::string format_float(double value)
{
  // fmt picks the shortest representation that round-trips, but switches
  // to exponent notation once that is shorter: "1e+20", "1.5e-07"
  std::string repr = fmt::format("{}", value);

  const auto e = repr.find('e');
  if(e == std::string::npos)
    return repr;

  std::string mantissa = repr.substr(0, e);
  const long exponent = std::strtol(repr.c_str() + e + 1, nullptr, 10);

  std::string sign;
  if(!mantissa.empty() && mantissa.front() == '-')
  {
    sign = "-";
    mantissa.erase(0, 1);
  }

  std::string digits;
  long int_digits = static_cast<long>(mantissa.size());
  for(std::size_t i = 0; i < mantissa.size(); ++i)
  {
    if(mantissa[i] == '.')
      int_digits = static_cast<long>(i);
    else
      digits.push_back(mantissa[i]);
  }

  // position of the decimal point relative to the start of `digits`
  const long point = int_digits + exponent;
  const long size = static_cast<long>(digits.size());

  if(point <= 0)
    return sign + "0." + std::string(static_cast<std::size_t>(-point), '0') + digits;
  if(point >= size)
    return sign + digits + std::string(static_cast<std::size_t>(point - size), '0');
  return sign + digits.substr(0, point) + "." + digits.substr(point);
}

void printer::write_float(double value)
{ push_str(format_float(value)); }

void printer::write_escaped(std::string_view str)
{
  push('"');
  for(std::size_t i = 0; i < str.size(); ++i)
  {
    const char c = str[i];

    // U+0080..U+009F are encoded as 0xc2 0x80..0x9f
    const auto next = i + 1 < str.size() ? static_cast<unsigned char>(str[i + 1]) : 0;
    if(static_cast<unsigned char>(c) == 0xc2 && next >= 0x80 && next <= 0x9f)
    {
      write("\\u{{{:x}}}", next);
      ++i;
      continue;
    }

    switch(c)
    {
    case '"':  push_str("\\\""); break;
    case '\\': push_str("\\\\"); break;
    case '\n': push_str("\\n"); break;
    case '\r': push_str("\\r"); break;
    case '\t': push_str("\\t"); break;
    case '\0': push_str("\\0"); break;
    default:
      {
        const auto byte = static_cast<unsigned char>(c);
        if(byte < 0x20 || byte == 0x7f)
          write("\\u{{{:x}}}", byte);
        else
          push(c);
      } break;
    }
  }
  push('"');
}

}
