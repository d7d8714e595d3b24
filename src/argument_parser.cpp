#include <arguments_parser.hpp>
#include <diagnostic_db.hpp>
#include <diagnostic.hpp>
#include <config.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <optional>
#include <typeinfo>
#include <thread>

namespace kestrel
{

static const location args_loc { "args", 1, 0 };

void print_emit_classes(std::FILE* f)
{
  fmt::print(f, "emit classes: ");

  for(auto it = std::begin(emit_classes_list); it != std::end(emit_classes_list); ++it)
  {
    if(std::next(it) == std::end(emit_classes_list))
      fmt::print(f, "{}\n", nlohmann::json(*it).get<std::string>());
    else
      fmt::print(f, "{}, ", nlohmann::json(*it).get<std::string>());
  }
}

namespace arguments
{

void parse(int argc, const char** argv, std::FILE* out)
{
  detail::CmdOptions options("kestrel", "Lexer and parser for the kestrel language.");
  options.add_options()
    ("h,?,-help", "Prints this text.", std::make_any<bool>(false), "false", [](auto) { return std::make_any<bool>(true); })
    (",f,-files", "Accepts arbitrary list of files.", std::make_any<std::vector<std::string_view>>(), "STDIN",
      [](auto x) { return std::make_any<std::vector<std::string_view>>(x.begin(), x.end()); })
    ("-emit=", "Choose what to emit. Set to \"help\" to get a list.", std::make_any<emit_classes>(emit_classes::ast_print), "ast-print",
      [](auto x)
      {
        auto& v = x.front();

        if(v.empty()) return emit_classes::help;

        nlohmann::json easy_conversion = std::string(v);
        if(easy_conversion.get<emit_classes>() != emit_classes::undef)
          return easy_conversion.get<emit_classes>();

        diagnostic <<= diagnostic_db::args::emit_not_present(args_loc);
        return emit_classes::help;
      })
    ("j,-num-cores", "Number of cores to use for processing modules. \"*\" to determine automatically.", std::make_any<std::size_t>(1), "1",
      [](auto x)
      {
        auto& v = x.front();
        if(v == "*")
          return static_cast<std::size_t>(std::max(1U, std::thread::hardware_concurrency()));

        std::size_t n = 0;
        auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
        if(ec != std::errc() || ptr != v.data() + v.size())
        {
          diagnostic <<= diagnostic_db::args::num_cores_not_a_number(args_loc, v);
          return static_cast<std::size_t>(1);
        }

        if(n == 0)
          diagnostic <<= diagnostic_db::args::num_cores_too_small(args_loc);
        else if(n > std::thread::hardware_concurrency())
          diagnostic <<= diagnostic_db::args::num_cores_too_large(args_loc);
        return std::max(n, static_cast<std::size_t>(1));
      })
    ("v,-verbose", "Reports every declaration that was found.", std::make_any<bool>(false), "false",
      [](auto) { return std::make_any<bool>(true); })
    ("-print-codes", "Prints the code of each diagnostic.", std::make_any<bool>(false), "false",
      [](auto) { return std::make_any<bool>(true); })
    ("-diagnostics-json", "Prints diagnostics as json.", std::make_any<bool>(false), "false",
      [](auto) { return std::make_any<bool>(true); })
    ;

  auto map = options.parse(argc, argv);

  if(std::any_cast<bool>(map["h"]))
  {
    options.print_help(out);
    config.print_help = true;
  }
  if(const auto& files = std::any_cast<std::vector<std::string_view>>(map["f"]); !files.empty())
  {
    config.files = files;
  }
  config.num_cores = std::any_cast<std::size_t>(map["j"]);
  config.verbose = std::any_cast<bool>(map["v"]);
  config.print_codes = std::any_cast<bool>(map["-print-codes"]);
  config.json_diagnostics = std::any_cast<bool>(map["-diagnostics-json"]);
  config.emit_class = std::any_cast<emit_classes>(map["-emit="]);
  if(config.emit_class == emit_classes::help)
  {
    print_emit_classes(out);
    config.print_help = true;
  }
}

namespace detail
{

CmdOptions::CmdOptionsAdder& CmdOptions::CmdOptionsAdder::operator()(std::string_view opt_list, std::string_view description,
    std::any default_value, std::string_view default_value_str, const option_parser& f)
{
  bool has_equals = false;
  std::vector<std::string_view> opts;
  while(true)
  {
    auto it = opt_list.find(',');

    std::string_view opt = opt_list.substr(0, it);
    if(!opt.empty() && opt.back() == '=')
    {
      opt.remove_suffix(1); // <- get rid of equals
      has_equals = true;
    }
    opts.emplace_back(opt);

    if(it == std::string_view::npos)
      break;
    opt_list.remove_prefix(it + 1); // + 1 to remove comma
  }
  const bool is_flag = default_value.type() == typeid(bool);

  ot->data.push_back(CmdOption { opts, description, default_value, default_value_str, f, has_equals, is_flag });
  return *this;
}

CmdOptions::CmdOptionsAdder CmdOptions::add_options()
{ return { this }; }


struct CmdParse
{
  CmdParse(const std::vector<std::string_view>& args, std::map<std::string, std::any>& map, CmdOptions& cmdopts)
    : args(&args), map(&map), cmdopts(&cmdopts)
  {
    for(auto& v : cmdopts.data)
    {
      if(takes_many(v))
        sink = v;
    }
    reset_cur_opt();
  }

  operator std::map<std::string, std::any>&()
  { return parse(); }
private:
  // the option with an empty name collects all bare arguments
  static bool takes_many(const CmdOption& opt)
  { return std::find(opt.opt.begin(), opt.opt.end(), "") != opt.opt.end(); }

  void reset_cur_opt()
  { cur_opt = sink; }

  std::map<std::string, std::any>& parse()
  {
    for(auto str : *args)
    {
      if(str.size() > 1 && str[0] == '-')
        parse_option(str);
      else
        parse_arg(str);
    }
    if(sink.has_value() && !many_args.empty())
      store(*sink, sink->parser(many_args));

    return *map;
  }

  void store(const CmdOption& opt, std::any a)
  {
    for(auto& o : opt.opt)
    {
      if(!o.empty())
        (*map)[static_cast<std::string>(o) + (opt.has_equals ? "=" : "")] = a;
    }
  }

  void parse_arg(std::string_view str)
  {
    if(!cur_opt.has_value())
    {
      diagnostic <<= diagnostic_db::args::unknown_arg(args_loc, str);
      return;
    }
    if(takes_many(*cur_opt))
    {
      many_args.push_back(str);
      return;
    }
    // everything else takes exactly one argument
    store(*cur_opt, cur_opt->parser({ str }));
    reset_cur_opt();
  }

  void parse_option(std::string_view str)
  {
    if(str.back() == '=')
      str.remove_suffix(1);

    std::optional<CmdOption> found;
    for(auto& v : cmdopts->data)
    {
      for(auto f : v.opt)
      {
        if(!f.empty() && str.substr(1) == f) // first char of str is `-`, after that it should match
          found = v;
      }
    }
    if(!found.has_value())
    {
      diagnostic <<= diagnostic_db::args::unknown_arg(args_loc, str);
      reset_cur_opt();
      return;
    }
    if(found->is_flag)
    {
      store(*found, found->parser({}));
      reset_cur_opt();
      return;
    }
    cur_opt = found;
  }

private:
  const std::vector<std::string_view>* args;
  std::map<std::string, std::any>* map; // <- not a string_view, since we need to append '=' sometimes

  CmdOptions* cmdopts;

  std::vector<std::string_view> many_args;
  std::optional<CmdOption> sink;
  std::optional<CmdOption> cur_opt;
};

std::map<std::string, std::any> CmdOptions::parse(int argc, const char** argv)
{
  std::map<std::string, std::any> map;
  for(auto& v : data)
  {
    for(auto f : v.opt)
    {
      if(!f.empty())
        map[static_cast<std::string>(f) + (v.has_equals ? "=" : "")] = v.default_value;
    }
  }
  if(argc - 1 <= 0)
    return map;

  std::vector<std::string_view> args;
  args.reserve(argc - 1);

  for(int i = 1; i < argc; ++i)
  {
    // We want to split at equals
    std::string_view v = argv[i];
    if(auto it = v.find('='); !v.empty() && v[0] == '-' && it != std::string_view::npos)
    {
      // grab the option, keeping the equals so that it matches `-emit=`
      args.push_back(v.substr(0, it + 1));

      // grab its argument
      args.push_back(v.substr(it + 1));
    }
    else
      args.push_back(v);
  }

  return CmdParse(args, map, *this);
}

void CmdOptions::print_help(std::FILE* f) const
{
  fmt::print(f, "{}  -  {}\n", name, description);

  for(auto& v : data)
  {
    std::string args;
    for(auto o : v.opt)
    {
      if(o.empty())
        continue;
      if(!args.empty())
        args += " or ";
      args += "-";
      args += o;
      if(v.has_equals)
        args += "=";
    }
    fmt::print(f, "{}    {} [default={}]\n", args, v.description, v.default_value_str);
  }
}

}

}

}
