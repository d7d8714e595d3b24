#include <source_location.hpp>

namespace kestrel
{

location::location(std::string_view filename, std::size_t line, std::size_t column)
  : filename(filename), line(line), column(column)
{  }

std::string location::to_string() const
{
  return std::string(filename) + ":"
    + std::to_string(line) + ":"
    + std::to_string(column);
}

std::ostream& operator<<(std::ostream& os, const location& loc)
{
  return os << loc.to_string();
}

void to_json(nlohmann::json& j, const location& loc)
{
  j = nlohmann::json{
    { "module", std::string(loc.filename) },
    { "line", loc.line },
    { "col", loc.column },
  };
}

}
