#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <cstdio>
#include <string>
#include <vector>

enum class emit_classes
{
  undef,
  help,
  tokens,
  print,
  json,
  labels,
};

NLOHMANN_JSON_SERIALIZE_ENUM( emit_classes, {
  { emit_classes::undef, "undef" },
  { emit_classes::help, "help" },
  { emit_classes::tokens, "tokens" },
  { emit_classes::print, "print" },
  { emit_classes::json, "json" },
  { emit_classes::labels, "labels" },
})

const static auto emit_classes_list = {
  emit_classes::help,
  emit_classes::tokens,
  emit_classes::print,
  emit_classes::json,
  emit_classes::labels,
};

void print_emit_classes(std::FILE* f);

struct config_t
{
  bool print_help { false };

  emit_classes emit_class { emit_classes::print };
  std::size_t num_cores { 1 };

  std::vector<std::string> files;
};

inline config_t config;
