#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <cstdio>
#include <vector>

namespace kestrel
{

enum class emit_classes
{
  undef,
  help,
  tokens,
  ast_print,
  check,
};

NLOHMANN_JSON_SERIALIZE_ENUM( emit_classes, {
  { emit_classes::undef, "undef" },
  { emit_classes::help, "help" },
  { emit_classes::tokens, "tokens" },
  { emit_classes::ast_print, "ast-print" },
  { emit_classes::check, "check" },
})

const static auto emit_classes_list = {
  emit_classes::help,
  emit_classes::tokens,
  emit_classes::ast_print,
  emit_classes::check,
};

void print_emit_classes(std::FILE* f);

struct config_t
{
  bool print_help { false };
  bool verbose { false };
  bool print_codes { false };
  bool json_diagnostics { false };

  emit_classes emit_class { emit_classes::ast_print };
  std::size_t num_cores { 1 };

  std::vector<std::string_view> files;
};

inline config_t config;

}
