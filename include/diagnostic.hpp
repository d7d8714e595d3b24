#pragma once

#include <source_location.hpp>
#include <parse_error.hpp>

#include <nlohmann/json.hpp>
#include <tsl/robin_map.h>

#include <string_view>
#include <functional>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>
#include <mutex>

namespace kestrel
{

namespace mk_diag
{
nlohmann::json error(const location& loc,
                     std::uint_fast16_t hrc, const std::string_view& message);

nlohmann::json warn(const location& loc,
                    std::uint_fast16_t hrc, const std::string_view& message);

nlohmann::json info(const location& loc,
                    std::uint_fast16_t hrc, const std::string_view& message);

nlohmann::json from(const parse_error& err);
}

namespace detail
{
  struct position
  {
    std::string module;
    std::size_t line;
    std::size_t col;

    bool operator==(const position& other) const
    { return module == other.module && line == other.line && col == other.col; }
  };
  inline bool operator<(const position& lhs, const position& rhs)
  {
    if(lhs.module != rhs.module)
      return lhs.module < rhs.module;
    return lhs.line < rhs.line || (lhs.line == rhs.line && lhs.col < rhs.col);
  }

  struct position_hasher
  {
    std::size_t operator()(const position& p) const
    {
      return std::hash<std::string>()(p.module)
        ^ ((std::hash<std::size_t>()(p.line)
        ^ (std::hash<std::size_t>()(p.col) << 1)) >> 1);
    }
  };
}

// Collects every diagnostic of a run and prints them once at the end.
struct diagnostics_manager
{
private:
  diagnostics_manager()  {  }
public:
  static diagnostics_manager& make()
  {
    static diagnostics_manager diag;
    return diag;
  }

  diagnostics_manager& operator<<=(const nlohmann::json& msg);
  diagnostics_manager& operator<<=(const parse_error& err);

  bool empty() const { return data.empty(); }
  std::size_t size() const;

  void print(std::FILE* file);
  void print_json(std::FILE* file);
  int error_code() const;

  void print_codes(bool b) { _print_codes = b; }

  void reset();
private:
  std::vector<detail::position> sorted_positions() const;
private:
  tsl::robin_map<detail::position, std::vector<nlohmann::json>, detail::position_hasher> data;

  int err { 0 };
  bool _print_codes { false };
  mutable std::mutex mut;
};

inline diagnostics_manager& diagnostic = diagnostics_manager::make();

}
