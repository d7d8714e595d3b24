#include <parse_error.hpp>

#include <fmt/format.h>

namespace kestrel
{

std::string_view level_to_str(diag_level level)
{
  switch(level)
  {
  case diag_level::info: return "info";
  case diag_level::warn: return "warning";
  default:
  case diag_level::error: return "error";
  }
}

parse_error parse_error::error(const location& loc, std::uint_fast16_t hrc, std::string message)
{ return parse_error { loc, diag_level::error, std::move(message), hrc }; }

parse_error parse_error::warn(const location& loc, std::uint_fast16_t hrc, std::string message)
{ return parse_error { loc, diag_level::warn, std::move(message), hrc }; }

parse_error parse_error::info(const location& loc, std::uint_fast16_t hrc, std::string message)
{ return parse_error { loc, diag_level::info, std::move(message), hrc }; }

std::string parse_error::to_string() const
{
  return fmt::format("{}: {}: {}", loc.to_string(), level_to_str(level), message);
}

std::ostream& operator<<(std::ostream& os, const parse_error& err)
{
  return os << err.to_string();
}

}
