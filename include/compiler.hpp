#pragma once

#include <config.hpp>

#include <string_view>

namespace kestrel
{

struct compiler
{
  // Runs the configured emitter over every input module.
  void go();

  static void emit(emit_classes cls, std::string_view module);
};

}
