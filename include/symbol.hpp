#pragma once

#include <string_view>
#include <cstdint>
#include <string>

// Interned string. Two symbols are equal iff they were made from equal strings.
// The intern table is shared by all threads, a symbol made on one thread can be
// read on any other.
struct symbol
{
  symbol();
  symbol(std::string_view str);
  symbol(const std::string& str);
  symbol(const char* str);

  const std::string& get_string() const;
  std::size_t get_hash() const;

  bool empty() const { return str->empty(); }
private:
  static const std::string* lookup_or_emplace(std::string_view str);
private:
  const std::string* str;
};

bool operator==(const symbol& a, const symbol& b);
bool operator!=(const symbol& a, const symbol& b);
