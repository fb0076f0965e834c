#pragma once

#include <config.hpp>

#include <string_view>
#include <cstdio>
#include <optional>
#include <string>

struct driver
{
  // Processes every module of `config.files`, or STDIN if there are none.
  // Outputs are written to `out` in the order the modules were given.
  void go(std::FILE* out = stdout);

  // Output of the current emit class for one module, nothing if it failed to load.
  static std::optional<std::string> run(std::string_view module);
};
