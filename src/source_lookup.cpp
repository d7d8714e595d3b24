#include <source_lookup.hpp>
#include <diagnostic_db.hpp>
#include <diagnostic.hpp>

#include <iostream>
#include <fstream>
#include <sstream>

namespace kestrel
{

std::optional<std::string_view> source_lookup_t::operator[](std::string_view module)
{
  std::lock_guard<std::mutex> lock(mut);

  const std::string key(module);
  if(auto it = texts.find(key); it != texts.end())
  {
    it->second.users++;
    return std::string_view(it->second.text);
  }

  auto text = load(module);
  if(!text.has_value())
  {
    diagnostic <<= diagnostic_db::args::cannot_open_file(location { module, 1, 0 }, module);
    return std::nullopt;
  }
  // element references of an unordered_map survive rehashing
  auto [it, inserted] = texts.emplace(key, entry { std::move(*text), 1 });
  return std::string_view(it->second.text);
}

void source_lookup_t::drop(std::string_view module)
{
  std::lock_guard<std::mutex> lock(mut);

  auto it = texts.find(std::string(module));
  if(it == texts.end())
    return;

  auto& e = it->second;
  if(e.users > 0)
    e.users--;
  if(e.users == 0 && !e.pinned)
    texts.erase(it);
}

std::optional<std::string> source_lookup_t::load(std::string_view module)
{
  std::ostringstream ss;
  if(module == "STDIN")
  {
    ss << std::cin.rdbuf();
    return ss.str();
  }
  std::ifstream file { std::string(module), std::ios::binary };
  if(!file.is_open())
    return std::nullopt;

  ss << file.rdbuf();
  return ss.str();
}

#ifdef KESTREL_TESTING
void source_lookup_t::write_test(std::string_view str)
{
  std::lock_guard<std::mutex> lock(mut);

  auto& e = texts["TESTSTREAM"];
  e.text = std::string(str);
  e.pinned = true;
}
#endif

}
