#include <ast_pretty_printer.hpp>
#include <diagnostic.hpp>
#include <ast_json.hpp>
#include <driver.hpp>
#include <reader.hpp>
#include <tmp.hpp>

#include <fmt/format.h>

#include <functional>
#include <algorithm>
#include <future>
#include <cstdio>
#include <variant>
#include <vector>
#include <deque>
#include <map>

namespace
{

std::string pretty(const document& doc)
{
  return std::visit(base_visitor {
    [](const syntax::tree& nodes)          { return syntax::pretty(nodes); },
    [](const spanned<syntax::expr>& e)     { return syntax::pretty(e.v); },
  }, doc);
}

nlohmann::json dump(const document& doc)
{
  return std::visit(base_visitor {
    [](const syntax::tree& nodes)          { return syntax::dump(nodes, true); },
    [](const spanned<syntax::expr>& e)     { return syntax::dump(e, true); },
  }, doc);
}

const std::map<emit_classes, std::function<std::string(const document&)>> emitter =
{
  { emit_classes::pretty, [](const document& doc) { return pretty(doc) + "\n"; } },
  { emit_classes::json,   [](const document& doc) { return dump(doc).dump(2) + "\n"; } },
};

}

std::optional<std::string> driver::run(std::string_view module)
{
  if(config.verbose)
    diagnostic <<= mk_diag::info(source_range { symbol(module), 0, 0, 0, 0 }, fmt::format("Processing module \"{}\".", module));

  auto doc = ast_reader::read(module);
  if(!doc)
    return std::nullopt; // <- diagnostic will contain an error

  auto it = emitter.find(config.emit_class);
  if(it == emitter.end())
    return std::nullopt;
  return it->second(*doc);
}

void driver::go(std::FILE* out)
{
  std::vector<std::string_view> tasks;
  if(config.files.empty())
    tasks = { "STDIN" };
  else
    tasks = config.files;

  const std::size_t cores = std::max(config.num_cores, std::size_t(1));

  // at most `cores` modules in flight, printed oldest first
  std::deque<std::future<std::optional<std::string>>> runners;
  for(auto tit = tasks.begin(); tit != tasks.end() || !runners.empty(); )
  {
    for(; tit != tasks.end() && runners.size() < cores; ++tit)
    {
      auto t = *tit;
      runners.emplace_back(std::async(std::launch::async, [t]() { return run(t); }));
    }

    auto result = runners.front().get();
    runners.pop_front();

    if(result)
      fmt::print(out, "{}", *result);
  }
}
