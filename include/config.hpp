#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <cstdio>
#include <vector>

enum class emit_classes
{
  undef,
  help,
  pretty,
  json,
};

NLOHMANN_JSON_SERIALIZE_ENUM( emit_classes, {
  { emit_classes::undef, "undef" },
  { emit_classes::help, "help" },
  { emit_classes::pretty, "pretty" },
  { emit_classes::json, "json" },
})

const static auto emit_classes_list = {
  emit_classes::help,
  emit_classes::pretty,
  emit_classes::json,
};

void print_emit_classes(std::FILE* f);

struct config_t
{
  bool print_help { false };
  bool verbose { false };

  emit_classes emit_class { emit_classes::pretty };
  std::size_t num_cores { 1 };

  // trees nested deeper than this are rejected while reading
  std::size_t max_depth { 256 };

  std::vector<std::string_view> files;
};

inline config_t config;
