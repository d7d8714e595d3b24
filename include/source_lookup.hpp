#pragma once

#include <unordered_map>
#include <string_view>
#include <optional>
#include <string>
#include <mutex>

namespace kestrel
{

// Owns the text of every module. Tokens and AST nodes borrow from it, so
// a module must not be dropped while its parse results are alive. Every
// lookup has to be paired with a drop, the text is released with the last one.
struct source_lookup_t
{
  // Reads the module on first use. "STDIN" reads the standard input.
  std::optional<std::string_view> operator[](std::string_view module);
  void drop(std::string_view module);

#ifdef KESTREL_TESTING
  void write_test(std::string_view str);
#endif
private:
  std::optional<std::string> load(std::string_view module);
private:
  struct entry
  {
    std::string text;
    std::size_t users { 0 };

    // test modules stay until they are overwritten
    bool pinned { false };
  };

  std::unordered_map<std::string, entry> texts;

  std::mutex mut;
};

inline source_lookup_t source_lookup;

}
