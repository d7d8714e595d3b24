#include <arguments_parser.hpp>
#include <diagnostic.hpp>
#include <compiler.hpp>
#include <config.hpp>

#include <cstdio>

int main(int argc, const char** argv)
{
  using namespace kestrel;

  arguments::parse(argc, argv, stdout);

  if(diagnostic.error_code() == 0 && !config.print_help)
  {
    compiler comp;
    comp.go();
  }

  diagnostic.print_codes(config.print_codes);
  if(config.json_diagnostics)
    diagnostic.print_json(stderr);
  else
    diagnostic.print(stderr);

  return diagnostic.error_code();
}
