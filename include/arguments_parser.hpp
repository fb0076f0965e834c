#pragma once

#include <string_view>
#include <functional>
#include <cstdio>
#include <string>
#include <vector>
#include <any>
#include <map>

namespace arguments
{

// Fills `config` from the command line. Help texts go to `out`.
void parse(int argc, const char** argv, std::FILE* out);

namespace detail
{

  struct CmdOption
  {
    std::vector<std::string_view> opt;
    std::string_view description;

    std::any default_value;
    std::string_view default_value_str;

    std::function<std::any(const std::vector<std::string_view>&)> parser;

    // number of values taken: 0 for flags, -1 for "everything up to the next option"
    int argc;

    bool has_equals;
  };
  struct CmdOptions
  {
  private:
    struct CmdOptionsAdder
    {
      CmdOptionsAdder& operator()(std::string_view opts, std::string_view description,
          std::any default_value, std::string_view default_value_str, int argc,
          const std::function<std::any(const std::vector<std::string_view>&)>& f);

      CmdOptions* ot;
    };
  public:
    CmdOptions(std::string_view name, std::string_view description)
      : name(name), description(description)
    {  }

    CmdOptionsAdder add_options();

    std::map<std::string, std::any> parse(int argc, const char** argv);

    void print_help(std::FILE* f) const;
  private:
    friend struct CmdParse;

    std::string_view name;
    std::string_view description;

    std::vector<CmdOption> data;
  };

}

}
