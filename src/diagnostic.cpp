#include <diagnostic.hpp>

#include <fmt/color.h>

#include <algorithm>

namespace kestrel
{

namespace mk_diag
{

static nlohmann::json make(const location& loc, diag_level level,
                           std::uint_fast16_t hrc, const std::string_view& message)
{
  nlohmann::json j;

  j["range"] = loc;

  j["level"] = level;

  j["hrc"] = hrc;
  j["message"] = std::string(message);

  return j;
}

nlohmann::json error(const location& loc,
                     std::uint_fast16_t hrc, const std::string_view& message)
{ return make(loc, diag_level::error, hrc, message); }

nlohmann::json warn(const location& loc,
                    std::uint_fast16_t hrc, const std::string_view& message)
{ return make(loc, diag_level::warn, hrc, message); }

nlohmann::json info(const location& loc,
                    std::uint_fast16_t hrc, const std::string_view& message)
{ return make(loc, diag_level::info, hrc, message); }

nlohmann::json from(const parse_error& err)
{ return make(err.loc, err.level, err.hrc, err.message); }

}

diagnostics_manager& diagnostics_manager::operator<<=(const nlohmann::json& msg)
{
  std::lock_guard<std::mutex> guard(mut);

  if(msg["level"].get<diag_level>() == diag_level::error)
    err = 1;

  auto line = msg["range"]["line"].get<std::size_t>();
  auto col = msg["range"]["col"].get<std::size_t>();

  data[detail::position { msg["range"]["module"].get<std::string>(), line, col }].push_back(msg);

  return *this;
}

diagnostics_manager& diagnostics_manager::operator<<=(const parse_error& e)
{ return *this <<= mk_diag::from(e); }

std::size_t diagnostics_manager::size() const
{
  std::lock_guard<std::mutex> guard(mut);

  std::size_t n = 0;
  for(auto& w : data)
    n += w.second.size();
  return n;
}

std::vector<detail::position> diagnostics_manager::sorted_positions() const
{
  std::vector<detail::position> positions;
  positions.reserve(data.size());
  for(auto& w : data)
    positions.push_back(w.first);

  std::sort(positions.begin(), positions.end());
  return positions;
}

void diagnostics_manager::print(std::FILE* file)
{
  std::lock_guard<std::mutex> guard(mut);
  for(auto& pos : sorted_positions())
  {
    for(auto& v : data.at(pos))
    {
      fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}:{}:{}: ",
          v["range"]["module"].get<std::string>(),
          v["range"]["line"].get<std::size_t>(),
          v["range"]["col"].get<std::size_t>());

      if(_print_codes)
        fmt::print(file, fg(fmt::color::cornsilk), "(KE-{}) ", v["hrc"].get<std::uint_fast16_t>());

      auto lv = v["level"].get<diag_level>();

      switch(lv)
      {
      default:
      case diag_level::error:
        fmt::print(file, fmt::emphasis::bold | fg(fmt::color::red), "error: ");
        break;

      case diag_level::info:
        fmt::print(file, fmt::emphasis::bold | fg(fmt::color::gray), "info: ");
        break;

      case diag_level::warn:
        fmt::print(file, fmt::emphasis::bold | fg(fmt::color::alice_blue), "warning: ");
        break;
      }
      fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}\n", v["message"].get<std::string>());
    }
  }
}

void diagnostics_manager::print_json(std::FILE* file)
{
  std::lock_guard<std::mutex> guard(mut);

  auto all = nlohmann::json::array();
  for(auto& pos : sorted_positions())
  {
    for(auto& v : data.at(pos))
      all.push_back(v);
  }
  fmt::print(file, "{}\n", all.dump(2));
}

int diagnostics_manager::error_code() const
{
  std::lock_guard<std::mutex> guard(mut);
  return err;
}

void diagnostics_manager::reset()
{
  std::lock_guard<std::mutex> guard(mut);

  err = 0;
  data.clear();
}

}
