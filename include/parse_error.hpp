#pragma once

#include <source_location.hpp>

#include <nlohmann/json.hpp>

#include <string_view>
#include <optional>
#include <variant>
#include <cstdint>
#include <string>

namespace kestrel
{

enum class diag_level : unsigned char
{
  error = 1,
  info  = 1 << 1,
  warn  = 1 << 2,
};

NLOHMANN_JSON_SERIALIZE_ENUM( diag_level, {
  { diag_level::error, "error" },
  { diag_level::info, "info" },
  { diag_level::warn, "warning" },
})

std::string_view level_to_str(diag_level level);

struct parse_error
{
  static parse_error error(const location& loc, std::uint_fast16_t hrc, std::string message);
  static parse_error warn(const location& loc, std::uint_fast16_t hrc, std::string message);
  static parse_error info(const location& loc, std::uint_fast16_t hrc, std::string message);

  // `<file>:<line>:<col>: <level>: <message>`
  std::string to_string() const;

  friend std::ostream& operator<<(std::ostream& os, const parse_error& err);

  location loc;
  diag_level level { diag_level::error };
  std::string message;

  std::uint_fast16_t hrc { 0 };
};

// Either a value or the error that prevented it.
template<typename T>
using result = std::variant<T, parse_error>;

// Grammar rules may also report that they did not match. In that case
// (`std::monostate`) they must not have consumed anything.
template<typename T>
using maybe = std::variant<std::monostate, T, parse_error>;

// The outcome of an operation without a payload, empty on success.
using status = std::optional<parse_error>;

template<typename... Ts>
inline bool is_error(const std::variant<Ts...>& v)
{ return std::holds_alternative<parse_error>(v); }

template<typename... Ts>
inline bool no_match(const std::variant<Ts...>& v)
{ return std::holds_alternative<std::monostate>(v); }

}
