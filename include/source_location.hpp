#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <cstdint>
#include <ostream>
#include <string>

namespace kestrel
{

// A position inside of a module. Lines start at 1, columns at 0.
struct location
{
  std::string_view filename;

  std::size_t line { 1 };
  std::size_t column { 0 };

  location() = default;

  location(std::string_view filename, std::size_t line, std::size_t column);

  std::string to_string() const;

  bool operator==(const location& other) const
  { return filename == other.filename && line == other.line && column == other.column; }
  bool operator!=(const location& other) const
  { return !(*this == other); }

  friend std::ostream& operator<<(std::ostream& os, const location& loc);
};

inline bool operator<(const location& lhs, const location& rhs)
{
  if(lhs.filename != rhs.filename)
    return lhs.filename < rhs.filename;
  return lhs.line < rhs.line || (lhs.line == rhs.line && lhs.column < rhs.column);
}

void to_json(nlohmann::json& j, const location& loc);

}
