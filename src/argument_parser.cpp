#include <arguments_parser.hpp>
#include <diagnostic_db.hpp>
#include <diagnostic.hpp>
#include <config.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <thread>

using namespace std::string_view_literals;

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
  detail::CmdOptions options("hackparse", "Parser for the Hack assembly language.");
  options.add_options()
    ("h,?,-help", "Prints this text.", std::make_any<bool>(false), "false", [](auto x){ return std::make_any<bool>(true); })
    (",f,-files", "Accepts arbitrary list of files.", std::make_any<std::vector<std::string>>(), "STDIN",
      [](auto x){ std::vector<std::string> w; for(auto v : x) w.emplace_back(v); return w; })
    ("-emit=", "Choose what to emit. Set to \"help\" to get a list.", std::make_any<emit_classes>(emit_classes::print), "print",
      [](auto x)
      {
        auto& v = x.front();

        if(v.empty()) return emit_classes::help;

        nlohmann::json easy_conversion = v;
        if(easy_conversion.get<emit_classes>() != emit_classes::undef)
          return easy_conversion.get<emit_classes>();

        diagnostic <<= diagnostic_db::args::emit_not_present(source_range { "args", 0, 0, 0, 0 }, v);
        return emit_classes::help;
      })
    ("j,-num-cores", "Number of cores to use for processing files. \"*\" to determine automatically.", std::make_any<std::size_t>(1), "1",
      [](auto x)
      {
        if(x.front() == "*")
          return std::max<std::size_t>(1, std::thread::hardware_concurrency());

        std::size_t v = 0;
        for(char c : x.front())
        {
          if(c < '0' || c > '9')
          {
            diagnostic <<= diagnostic_db::args::missing_value(source_range { "args", 0, 0, 0, 0 }, "--num-cores"sv);
            return std::size_t { 1 };
          }
          v = v * 10 + static_cast<std::size_t>(c - '0');
        }
        return std::max<std::size_t>(1, v);
      })
    ;

  auto map = options.parse(argc, argv);

  if(std::any_cast<bool>(map["h"]))
  {
    options.print_help(out);
    config.print_help = true;
  }
  if(const auto& files = std::any_cast<std::vector<std::string>>(map["f"]); !files.empty())
  {
    config.files = files;
  }
  config.num_cores = std::any_cast<std::size_t>(map["j"]);
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
    std::any default_value, std::string_view default_value_str, const std::function<std::any(const std::vector<std::string_view>&)>& f)
{
  bool has_equals = false;
  std::vector<std::string_view> opts;
  auto it = opt_list.find(',');
  while(it != std::string_view::npos)
  {
    std::string_view opt = opt_list.substr(0, it);
    opt_list.remove_prefix(it + 1); // + 1 to remove comma

    opts.emplace_back(opt);
    it = opt_list.find(',');
  }
  if(!opt_list.empty() && opt_list.back() == '=')
  {
    opt_list.remove_suffix(1); // <- get rid of equals
    has_equals = true;
  }
  opts.emplace_back(opt_list);

  ot->data.push_back(CmdOption { opts, description, default_value, default_value_str, f, has_equals });
  return *this;
}

CmdOptions::CmdOptionsAdder CmdOptions::add_options()
{ return { this }; }


struct CmdParse
{
  CmdParse(const std::vector<std::string_view>& args, std::map<std::string, std::any>& map, CmdOptions& cmdopts)
    : args(&args), map(&map), cmdopts(&cmdopts)
  {
    reset_cur_opt();
  }

  operator std::map<std::string, std::any>&()
  { return parse(); }
private:
  void reset_cur_opt()
  {
    cur_opt = std::nullopt;
    cur_name = ""sv;

    for(auto& v : this->cmdopts->data)
    {
      for(auto f : v.opt)
      {
        if(f.empty()) // if we have an implicit argument, make this the initial current option
          cur_opt = v;
      }
    }
  }

  void store(const CmdOption& opt, const std::any& a)
  {
    for(auto& o : opt.opt)
      (*map)[static_cast<std::string>(o) + (opt.has_equals ? "=" : "")] = a;
  }

  std::map<std::string, std::any>& parse()
  {
    for(auto it = args->begin(); it != args->end(); ++it)
    {
      auto& str = *it;
      if(str.size() > 1 && str[0] == '-')
        parse_option(str);
      else
        parse_arg(str, std::next(it) == args->end() ? ""sv : *std::next(it));
    }
    // an option was named but never got its argument
    if(!cur_name.empty() && cur_opt.has_value())
      diagnostic <<= diagnostic_db::args::missing_value(source_range { "args", 0, 0, 0, 0 }, cur_name);

    return *map;
  }

  void parse_arg(const std::string_view& str, const std::string_view& next)
  {
    if(!cur_opt.has_value())
    {
      diagnostic <<= diagnostic_db::args::unknown_arg(source_range { "args", 0, 0, 0, 0 }, str);
      return;
    }
    opt_args.push_back(str);

    // parse option arguments only if we hit the end or another option
    //    .... or if we have an equals option currently, since it only supports one arg
    if(next.empty() || next[0] == '-' || cur_opt->has_equals)
    {
      store(*cur_opt, cur_opt->parser(opt_args));

      reset_cur_opt();
      opt_args.clear();
    }
  }

  void parse_option(const std::string_view& str)
  {
    if(!cur_name.empty() && cur_opt.has_value())
      diagnostic <<= diagnostic_db::args::missing_value(source_range { "args", 0, 0, 0, 0 }, cur_name);

    cur_opt = std::nullopt;
    opt_args.clear();
    for(auto& v : cmdopts->data)
    {
      for(auto f : v.opt)
      {
        if(!f.empty() && str.find(f) == 1 && str.size() - 1 == f.size()) // first char of str is `-`, after that it should match
          cur_opt = v;
      }
    }
    if(!cur_opt.has_value())
    {
      diagnostic <<= diagnostic_db::args::unknown_arg(source_range { "args", 0, 0, 0, 0 }, str);
      return;
    }
    cur_name = str;

    // flags don't wait for arguments
    if(cur_opt->is_flag())
    {
      store(*cur_opt, cur_opt->parser(opt_args));
      reset_cur_opt();
    }
  }

private:
  const std::vector<std::string_view>* args;
  std::map<std::string, std::any>* map; // <- not a string_view, since we need to append '=' sometimes

  CmdOptions* cmdopts;

  std::vector<std::string_view> opt_args;
  std::optional<CmdOption> cur_opt;
  std::string_view cur_name;
};

std::map<std::string, std::any> CmdOptions::parse(int argc, const char** argv)
{
  std::map<std::string, std::any> map;
  for(auto& v : data)
  {
    for(auto f : v.opt)
    {
      map[static_cast<std::string>(f) + (v.has_equals ? "=" : "")] = v.default_value;
    }
  }
  if(argc - 1 == 0)
    return map;

  std::vector<std::string_view> args;
  args.reserve(argc - 1);

  for(int i = 1; i < argc; ++i)
  {
    // We want to split at equals
    std::string_view v = argv[i];
    if(auto it = v.find('='); it != std::string_view::npos && !v.empty() && v[0] == '-')
    {
      // grab the option
      args.push_back(v.substr(0, it));

      // grab its argument
      args.push_back(v.substr(it + 1));
    }
    else
      args.push_back(v);
  }

  CmdParse parser(args, map, *this);
  return static_cast<std::map<std::string, std::any>&>(parser);
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
    fmt::print(f, "  {:<24} {} [default={}]\n", args, v.description, v.default_value_str);
  }
}

}

}
