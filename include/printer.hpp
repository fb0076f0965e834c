#pragma once

#include <fmt/format.h>

#include <string_view>
#include <iterator>
#include <utility>
#include <string>

namespace syntax
{

// Accumulates the surface syntax of one print call.
class printer
{
public:
  void push_str(std::string_view str)
  { buf.append(str.data(), str.size()); }

  void push(char c)
  { buf.push_back(c); }

  template<typename... Args>
  void write(fmt::format_string<Args...> fmt_str, Args&&... args)
  { fmt::format_to(std::back_inserter(buf), fmt_str, std::forward<Args>(args)...); }

  void write_float(double value);
  // quoted, with control characters (C0, DEL and C1) written as escapes
  void write_escaped(std::string_view str);

  template<typename It, typename F>
  void join(It first, It last, std::string_view joiner, F&& f)
  {
    for(auto it = first; it != last; ++it)
    {
      if(it != first)
        push_str(joiner);
      f(*it, *this);
    }
  }

  template<typename Container, typename F>
  void join(const Container& items, std::string_view joiner, F&& f)
  { join(std::begin(items), std::end(items), joiner, std::forward<F>(f)); }

  const std::string& str() const
  { return buf; }

  std::string finish()
  { return std::move(buf); }
private:
  std::string buf;
};

// Shortest decimal that reads back as `value`, never in exponent notation.
//   2.50 -> "2.5", 1e2 -> "100", 1e-7 -> "0.0000001"
std::string format_float(double value);

}
