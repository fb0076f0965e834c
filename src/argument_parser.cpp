#include <arguments_parser.hpp>
#include <diagnostic_db.hpp>
#include <diagnostic.hpp>
#include <config.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <optional>
#include <thread>

void print_emit_classes(std::FILE* f)
{
  fmt::print(f, "emit classes: ");

  for(auto it = std::begin(emit_classes_list); it != std::end(emit_classes_list); ++it)
  {
    if(std::next(it) == std::end(emit_classes_list))
      fmt::print(f, "{}\n", nlohmann::json(*it).get<std::string>());
    else
      fmt::print(f, "{}, ", nlohmann::json(*it).get<std::string>());
  }
}

namespace
{

source_range args_range()
{ return source_range { symbol("args"), 0, 0, 0, 0 }; }

std::optional<std::size_t> to_number(std::string_view str)
{
  std::size_t v = 0;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), v);
  if(ec != std::errc() || ptr != str.data() + str.size())
  {
    diagnostic <<= diagnostic_db::args::not_a_number(args_range(), std::string(str));
    return std::nullopt;
  }
  return v;
}

}

namespace arguments
{

void parse(int argc, const char** argv, std::FILE* out)
{
  detail::CmdOptions options("marq", "Canonical printer for markup syntax trees.");
  options.add_options()
    ("h,?,-help", "Prints this text.", std::make_any<bool>(false), "false", 0, [](auto) { return std::make_any<bool>(true); })
    ("v,-verbose", "Reports every module that is processed.", std::make_any<bool>(false), "false", 0,
      [](auto) { return std::make_any<bool>(true); })
    (",f,-files", "Accepts arbitrary list of files.", std::make_any<std::vector<std::string_view>>(), "STDIN", -1,
      [](auto x) { return std::make_any<std::vector<std::string_view>>(x); })
    ("-emit=", "Choose what to emit. Set to \"help\" to get a list.", std::make_any<emit_classes>(emit_classes::pretty), "pretty", 1,
      [](auto x)
      {
        auto& v = x.front();

        if(v.empty()) return emit_classes::help;

        nlohmann::json easy_conversion = std::string(v);
        if(easy_conversion.get<emit_classes>() != emit_classes::undef)
          return easy_conversion.get<emit_classes>();

        diagnostic <<= diagnostic_db::args::emit_not_present(args_range());
        return emit_classes::help;
      })
    ("j,-num-cores", "Number of cores to use for processing modules. \"*\" to determine automatically.", std::make_any<std::size_t>(1), "1", 1,
      [](auto x)
      {
        const auto hw = static_cast<std::size_t>(std::thread::hardware_concurrency());
        if(x.front() == "*")
          return std::max(hw, std::size_t(1));

        auto v = to_number(x.front());
        if(!v)
          return std::size_t(1);

        if(*v == 0)
        {
          diagnostic <<= diagnostic_db::args::num_cores_too_small(args_range());
          return std::size_t(1);
        }
        else if(hw != 0 && *v > hw)
          diagnostic <<= diagnostic_db::args::num_cores_too_large(args_range());
        return *v;
      })
    ("-max-depth=", "Trees nested deeper than this are rejected.", std::make_any<std::size_t>(256), "256", 1,
      [](auto x)
      {
        auto v = to_number(x.front());
        if(!v)
          return std::size_t(256);

        if(*v == 0)
        {
          diagnostic <<= diagnostic_db::args::max_depth_too_small(args_range());
          return std::size_t(256);
        }
        return *v;
      })
    ;

  auto map = options.parse(argc, argv);

  if(std::any_cast<bool>(map["h"]))
  {
    options.print_help(out);
    config.print_help = true;
  }
  config.verbose = std::any_cast<bool>(map["v"]);
  if(const auto& files = std::any_cast<std::vector<std::string_view>>(map["f"]); !files.empty())
  {
    config.files = files;
  }
  config.num_cores = std::any_cast<std::size_t>(map["j"]);
  config.max_depth = std::any_cast<std::size_t>(map["-max-depth="]);
  config.emit_class = std::any_cast<emit_classes>(map["-emit="]);
  if(config.emit_class == emit_classes::help)
  {
    print_emit_classes(out);
    config.print_help = true;
  }
}

namespace detail
{

CmdOptions::CmdOptionsAdder& CmdOptions::CmdOptionsAdder::operator()(std::string_view opt_list, std::string_view description,
    std::any default_value, std::string_view default_value_str, int argc,
    const std::function<std::any(const std::vector<std::string_view>&)>& f)
{
  bool has_equals = false;
  std::vector<std::string_view> opts;

  const auto add = [&opts, &has_equals](std::string_view opt)
    {
      if(!opt.empty() && opt.back() == '=')
      {
        opt.remove_suffix(1); // <- get rid of equals
        has_equals = true;
      }
      opts.emplace_back(opt);
    };

  for(auto it = opt_list.find(','); it != std::string_view::npos; it = opt_list.find(','))
  {
    add(opt_list.substr(0, it));
    opt_list.remove_prefix(it + 1); // + 1 to remove comma
  }
  if(!opt_list.empty())
    add(opt_list);

  ot->data.push_back(CmdOption { opts, description, std::move(default_value), default_value_str, f, argc, has_equals });
  return *this;
}

CmdOptions::CmdOptionsAdder CmdOptions::add_options()
{ return { this }; }


struct CmdParse
{
  CmdParse(const std::vector<std::string_view>& args, std::map<std::string, std::any>& map, const CmdOptions& cmdopts)
    : args(&args), map(&map), cmdopts(&cmdopts)
  {
    reset_cur_opt();
  }

  operator std::map<std::string, std::any>&()
  { return parse(); }
private:
  void reset_cur_opt()
  {
    cur_opt = nullptr;
    implicit = true;
    opt_args.clear();

    for(auto& v : cmdopts->data)
    {
      for(auto f : v.opt)
      {
        if(f.empty()) // if we have an implicit argument, make this the initial current option
          cur_opt = &v;
      }
    }
  }

  std::map<std::string, std::any>& parse()
  {
    for(auto& str : *args)
    {
      // an option still waiting for its value takes anything, even "-3"
      const bool wants_value = cur_opt != nullptr && cur_opt->argc > 0 && !implicit;
      if(!wants_value && str.size() > 1 && str[0] == '-')
        parse_option(str);
      else
        parse_arg(str);
    }
    finish_option();

    for(auto& [opt, values] : variadic_args)
      store(*opt, values);

    return *map;
  }

  void parse_arg(std::string_view str)
  {
    if(cur_opt == nullptr)
    {
      diagnostic <<= diagnostic_db::args::unknown_arg(args_range(), std::string(str));
      return;
    }

    if(cur_opt->argc < 0)
    {
      variadic_args[cur_opt].push_back(str);
      return;
    }

    opt_args.push_back(str);
    if(opt_args.size() == static_cast<std::size_t>(cur_opt->argc))
    {
      store(*cur_opt, opt_args);
      reset_cur_opt();
    }
  }

  void parse_option(std::string_view str)
  {
    finish_option();

    cur_opt = nullptr;
    implicit = false;
    for(auto& v : cmdopts->data)
    {
      for(auto f : v.opt)
      {
        if(!f.empty() && str.substr(1) == f) // first char of str is `-`, after that it should match
          cur_opt = &v;
      }
    }
    if(cur_opt == nullptr)
    {
      diagnostic <<= diagnostic_db::args::unknown_arg(args_range(), std::string(str));
      reset_cur_opt();
    }
    else if(cur_opt->argc == 0)
    {
      store(*cur_opt, {});
      reset_cur_opt();
    }
  }

  // an option that stopped short of its values
  void finish_option()
  {
    if(cur_opt != nullptr && !implicit && cur_opt->argc > 0)
      diagnostic <<= diagnostic_db::args::missing_value(args_range(), std::string(cur_opt->opt.back()));
    reset_cur_opt();
  }

  void store(const CmdOption& opt, const std::vector<std::string_view>& values)
  {
    std::any a = opt.parser(values);
    for(auto& o : opt.opt)
      (*map)[static_cast<std::string>(o) + (opt.has_equals ? "=" : "")] = a;
  }

private:
  const std::vector<std::string_view>* args;
  std::map<std::string, std::any>* map; // <- not a string_view, since we need to append '=' sometimes

  const CmdOptions* cmdopts;

  std::vector<std::string_view> opt_args;
  std::map<const CmdOption*, std::vector<std::string_view>> variadic_args;

  const CmdOption* cur_opt;
  bool implicit;
};

std::map<std::string, std::any> CmdOptions::parse(int argc, const char** argv)
{
  std::map<std::string, std::any> map;
  for(auto& v : data)
  {
    for(auto f : v.opt)
    {
      map[static_cast<std::string>(f) + (v.has_equals ? "=" : "")] = v.default_value;
    }
  }
  if(argc - 1 <= 0)
    return map;

  std::vector<std::string_view> args;
  args.reserve(argc - 1);

  for(int i = 1; i < argc; ++i)
  {
    // We want to split options at equals, "--emit=json" is "--emit json"
    std::string_view v = argv[i];
    if(auto it = v.find('='); !v.empty() && v.front() == '-' && it != std::string_view::npos)
    {
      args.push_back(v.substr(0, it));
      args.push_back(v.substr(it + 1));
    }
    else
      args.push_back(v);
  }

  return CmdParse(args, map, *this);
}

void CmdOptions::print_help(std::FILE* f) const
{
  fmt::print(f, "{}  -  {}\n", name, description);

  for(auto& v : data)
  {
    std::string args;
    for(auto o : v.opt)
    {
      if(o.empty())
        continue;
      if(!args.empty())
        args += " or ";
      args += '-';
      args += o;
      if(v.has_equals)
        args += '=';
    }
    fmt::print(f, "{}    {} [default={}]\n", args, v.description, v.default_value_str);
  }
}

}

}
