#pragma once

#include <source_range.hpp>
#include <symbol.hpp>

#include <nlohmann/json.hpp>
#include <tsl/robin_map.h>
#include <fmt/format.h>

#include <string_view>
#include <functional>
#include <cstdio>
#include <vector>
#include <mutex>

enum class diag_level : unsigned char
{
  error = 1,
  info  = 1 << 1,
  warn  = 1 << 2,
};

NLOHMANN_JSON_SERIALIZE_ENUM( diag_level, {
  { diag_level::error, "error" },
  { diag_level::info, "info" },
  { diag_level::warn, "warn" },
})

namespace mk_diag
{
nlohmann::json error(const source_range& range,
                     std::uint_fast16_t mrc, const std::string_view& message);

nlohmann::json warn(const source_range& range,
                    std::uint_fast16_t mrc, const std::string_view& message);

nlohmann::json info(const source_range& range, const std::string_view& message);
}

namespace detail
{
  struct position
  {
    symbol module;
    std::size_t row;
    std::size_t col;

    bool operator==(const position& other) const
    { return module == other.module && row == other.row && col == other.col; }
  };
  inline position make_position(symbol module, std::size_t row, std::size_t col)
  {
    return position { module, row, col };
  }
}
namespace std
{
  template<>
  struct hash<::detail::position>
  {
    std::size_t operator()(const ::detail::position& p) const
    {
      return ((p.module.get_hash()
               ^ (std::hash<std::size_t>()(p.row) << 1)) >> 1)
               ^ (std::hash<std::size_t>()(p.col) << 2);
    }
  };
}

// Collects the diagnostics of all modules. Safe to feed from several threads.
struct diagnostics_manager
{
private:
  diagnostics_manager()  {  }
public:
  ~diagnostics_manager();

  static diagnostics_manager& make()
  {
    static diagnostics_manager diag;
    return diag;
  }

  diagnostics_manager& operator<<=(const nlohmann::json& msg);

  // true if nothing but info messages have been recorded
  bool empty() const;

  void print(std::FILE* file);
  int error_code() const;

  void reset();

  // all recorded messages, ordered by module, row and column
  std::vector<nlohmann::json> messages() const;
private:
  std::vector<::detail::position> sorted_positions() const;
private:
  tsl::robin_map<::detail::position, std::vector<nlohmann::json>> data;

  int err { 0 };
  std::size_t problems { 0 };
  mutable std::mutex mut;

#ifndef MARQ_TESTING
  bool printed { false };
#else
  bool printed { true  };
#endif
};

inline diagnostics_manager& diagnostic = diagnostics_manager::make();
