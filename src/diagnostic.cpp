#include <diagnostic.hpp>

#include <fmt/color.h>

#include <algorithm>
#include <cassert>
#include <tuple>

namespace mk_diag
{

nlohmann::json warn(const source_range& range,
                    std::uint_fast16_t mrc, const std::string_view& message)
{
  nlohmann::json j;

  j["range"] = range;

  j["level"] = diag_level::warn;

  j["mrc"] = mrc;
  j["message"] = message;

  return j;
}

nlohmann::json error(const source_range& range,
                     std::uint_fast16_t mrc, const std::string_view& message)
{
  nlohmann::json j;

  j["range"] = range;

  j["level"] = diag_level::error;

  j["mrc"] = mrc;
  j["message"] = message;

  return j;
}

nlohmann::json info(const source_range& range, const std::string_view& message)
{
  nlohmann::json j;

  j["range"] = range;

  j["level"] = diag_level::info;
  j["message"] = message;

  return j;
}

}

diagnostics_manager::~diagnostics_manager()
{ assert(printed && "Messages have been printed."); }

diagnostics_manager& diagnostics_manager::operator<<=(const nlohmann::json& msg)
{
  std::lock_guard<std::mutex> guard(mut);

  const auto level = msg["level"].get<diag_level>();
  if(level == diag_level::error)
    err = 1;
  if(level != diag_level::info)
    ++problems;

  auto row = msg["range"]["row_beg"].get<std::size_t>();
  auto col = msg["range"]["col_beg"].get<std::size_t>();

  data[::detail::make_position(symbol(msg["range"]["module"].get<std::string>()), row, col)].push_back(msg);
#ifndef MARQ_TESTING
  printed = false;
#endif

  return *this;
}

bool diagnostics_manager::empty() const
{
  std::lock_guard<std::mutex> guard(mut);
  return problems == 0;
}

std::vector<::detail::position> diagnostics_manager::sorted_positions() const
{
  std::vector<::detail::position> positions;
  positions.reserve(data.size());
  for(auto& w : data)
    positions.push_back(w.first);

  std::sort(positions.begin(), positions.end(), [](auto& lhs, auto& rhs)
    {
      return std::forward_as_tuple(lhs.module.get_string(), lhs.row, lhs.col)
           < std::forward_as_tuple(rhs.module.get_string(), rhs.row, rhs.col);
    });
  return positions;
}

std::vector<nlohmann::json> diagnostics_manager::messages() const
{
  std::lock_guard<std::mutex> guard(mut);

  std::vector<nlohmann::json> msgs;
  for(auto& pos : sorted_positions())
  {
    auto& at = data.at(pos);
    msgs.insert(msgs.end(), at.begin(), at.end());
  }
  return msgs;
}

void diagnostics_manager::print(std::FILE* file)
{
  std::lock_guard<std::mutex> guard(mut);
  if(printed)
    return;
  for(auto& pos : sorted_positions())
  {
    for(auto& v : data.at(pos))
    {
      fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}:{}:{}: ",
          v["range"]["module"].get<std::string>(),
          v["range"]["row_beg"].get<std::size_t>(),
          v["range"]["col_beg"].get<std::size_t>());

      auto lv = v["level"].get<diag_level>();

      switch(lv)
      {
      default:
      case diag_level::error:
        {
          fmt::print(file, fg(fmt::color::cornsilk), "(ME-{}) ", v["mrc"].get<std::uint_fast16_t>());
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::red), "error: ");
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", v["message"].get<std::string>());
        } break;

      case diag_level::info:
        {
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::gray), "info: ");
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", v["message"].get<std::string>());
        } break;

      case diag_level::warn:
        {
          fmt::print(file, fg(fmt::color::cornsilk), "(ME-{}) ", v["mrc"].get<std::uint_fast16_t>());
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::alice_blue), "warning: ");
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", v["message"].get<std::string>());
        } break;
      }
      fmt::print(file, fg(fmt::color::white), "\n");
    }
  }
  printed = true;
}

int diagnostics_manager::error_code() const
{
  std::lock_guard<std::mutex> guard(mut);
  return err;
}

void diagnostics_manager::reset()
{
  std::lock_guard<std::mutex> guard(mut);
  err = 0;
  problems = 0;
  data.clear();
#ifdef MARQ_TESTING
  printed = true;
#endif
}
