#include <symbol.hpp>

#include <tsl/robin_map.h>

#include <functional>
#include <deque>
#include <mutex>

namespace
{

struct intern_table
{
  std::mutex mut;

  // deque never relocates its elements, so the views used as keys and the
  // pointers handed out to symbols stay valid
  std::deque<std::string> strings;
  tsl::robin_map<std::string_view, const std::string*> lookup;
};

intern_table& table()
{
  static intern_table tab;
  return tab;
}

}

symbol::symbol()
  : str(lookup_or_emplace(""))
{  }

symbol::symbol(std::string_view str)
  : str(lookup_or_emplace(str))
{  }

symbol::symbol(const std::string& str)
  : str(lookup_or_emplace(str))
{  }

symbol::symbol(const char* str)
  : str(lookup_or_emplace(str))
{  }

const std::string* symbol::lookup_or_emplace(std::string_view str)
{
  auto& tab = table();
  std::lock_guard<std::mutex> guard(tab.mut);

  auto it = tab.lookup.find(str);
  if(it != tab.lookup.end())
    return it->second;

  const std::string& stored = tab.strings.emplace_back(str);
  tab.lookup.emplace(std::string_view(stored), &stored);
  return &stored;
}

std::size_t symbol::get_hash() const
{ return std::hash<const std::string*>()(str); }

const std::string& symbol::get_string() const
{ return *str; }

bool operator==(const symbol& a, const symbol& b)
{
  return &a.get_string() == &b.get_string();
}

bool operator!=(const symbol& a, const symbol& b)
{
  return !(a == b);
}
