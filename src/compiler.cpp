#include <source_lookup.hpp>
#include <diagnostic_db.hpp>
#include <diagnostic.hpp>
#include <compiler.hpp>
#include <reader.hpp>
#include <token.hpp>
#include <ast.hpp>

#include <fmt/format.h>

#include <functional>
#include <future>
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>
#include <mutex>
#include <map>

namespace kestrel
{

static std::mutex output_mut;

static void flush_output(const std::string& out)
{
  std::lock_guard<std::mutex> lock(output_mut);

  fmt::print(stdout, "{}", out);
  std::fflush(stdout);
}

static void report_declarations(const std::vector<decl>& decls)
{
  if(!config.verbose)
    return;

  for(auto& d : decls)
    diagnostic <<= diagnostic_db::driver::found_declaration(d.loc(), d.id.name, d.predicates.size());
}

static const std::map<emit_classes, std::function<void(std::string_view, std::string_view)>> emitter =
{
  { emit_classes::help, [](auto, auto){ print_emit_classes(stdout); } },
  { emit_classes::tokens, [](std::string_view module, std::string_view text)
    {
      auto w = reader::read<token>(module, text);
      if(is_error(w))
      {
        diagnostic <<= std::get<parse_error>(w);
        return;
      }

      std::string out;
      for(auto& tok : std::get<std::vector<token>>(w))
      {
        out += fmt::format("Token '{}' at {} with data \"{}\".\n",
                           kind_to_str(tok.lex.kind), tok.loc.to_string(), tok.lex.text);
      }
      flush_output(out);
    } },
  { emit_classes::ast_print, [](std::string_view module, std::string_view text)
    {
      auto w = reader::read<decl>(module, text);
      if(is_error(w))
      {
        diagnostic <<= std::get<parse_error>(w);
        return;
      }
      auto& decls = std::get<std::vector<decl>>(w);
      report_declarations(decls);

      std::string out;
      for(auto& d : decls)
        out += to_string(d) + "\n";
      flush_output(out);
    } },
  { emit_classes::check, [](std::string_view module, std::string_view text)
    {
      auto w = reader::read<decl>(module, text);
      if(is_error(w))
      {
        diagnostic <<= std::get<parse_error>(w);
        return;
      }
      report_declarations(std::get<std::vector<decl>>(w));
    } },
};

void compiler::emit(emit_classes cls, std::string_view module)
{
  auto text = source_lookup[module];
  if(!text.has_value())
    return; // <- diagnostic will contain an error

  emitter.at(cls)(module, *text);

  source_lookup.drop(module);
}

void compiler::go()
{
  std::vector<std::string_view> tasks;
  if(config.files.empty())
    tasks = { "STDIN" };
  else
    tasks = config.files;

  const auto cls = config.emit_class;

  std::vector<std::future<void>> runners;
  for(auto tit = tasks.begin(); tit != tasks.end(); )
  {
    for(std::size_t i = runners.size(); tit != tasks.end() && i < config.num_cores; ++i)
    {
      auto t = *tit;

      runners.emplace_back(std::async(std::launch::async, [cls, t]() { emit(cls, t); }));

      ++tit;
    }
    for(auto rit = runners.begin(); rit != runners.end(); )
    {
      if(rit->wait_for(std::chrono::nanoseconds(100)) == std::future_status::ready)
      {
        rit->get();
        rit = runners.erase(rit);
      }
      else
        ++rit;
    }
  }
  for(auto& r : runners)
    r.get();
}

}
