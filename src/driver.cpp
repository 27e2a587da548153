#include <diagnostic_db.hpp>
#include <diagnostic.hpp>
#include <driver.hpp>
#include <parser.hpp>
#include <reader.hpp>
#include <token.hpp>

#include <fmt/format.h>

#include <functional>
#include <iostream>
#include <iterator>
#include <fstream>
#include <sstream>
#include <cassert>
#include <optional>
#include <future>
#include <cstdio>
#include <vector>
#include <map>

static const std::map<emit_classes, std::function<std::string(const hack::program&)>> emitter =
{
  { emit_classes::print, [](const hack::program& prog)
    {
      std::stringstream ss;
      ss << prog;
      return ss.str();
    } },
  { emit_classes::json, [](const hack::program& prog)
    {
      return nlohmann::json(prog).dump(2) + "\n";
    } },
  { emit_classes::labels, [](const hack::program& prog)
    {
      std::string out;
      for(auto& p : prog.label_positions())
        out += fmt::format("{:<24} {}\n", p.first, p.second);
      return out;
    } },
};

static std::string emit_tokens(const std::string& text, std::string_view module)
{
  std::string out;
  for(auto& tok : hack::reader::tokenize(text, std::string(module)))
  {
    out += fmt::format("Token '{}' at {} with data \"{}\".\n",
                       hack::kind_to_str(tok.kind), tok.loc.to_string(), tok.data);
  }
  return out;
}

std::string driver::run(const std::string& text, std::string_view module)
{
  if(config.emit_class == emit_classes::tokens)
    return emit_tokens(text, module);

  auto result = hack::parser::parse_text(text, std::string(module));
  if(auto* err = std::get_if<hack::syntax_error>(&result))
  {
    diagnostic <<= err->diag;
    return "";
  }
  auto& prog = std::get<hack::program>(result);
  if(prog.empty())
    diagnostic <<= diagnostic_db::driver::empty_program(source_range { std::string(module), 1, 1, 1, 1 });

  auto it = emitter.find(config.emit_class);
  assert(it != emitter.end() && "help is handled before any file is read");
  return it->second(prog);
}

static std::optional<std::string> slurp(const std::string& file)
{
  if(file == "STDIN")
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());

  std::ifstream is(file);
  if(!is)
    return std::nullopt;
  return std::string(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

void driver::go()
{
  std::vector<std::string> tasks;
  if(config.files.empty())
    tasks = { "STDIN" };
  else
    tasks = config.files;

  // every file is parsed on its own, results are printed in input order
  std::vector<std::future<std::string>> runners;
  auto flush = [&runners]()
  {
    for(auto& r : runners)
      fmt::print(stdout, "{}", r.get());
    runners.clear();
  };

  for(auto& t : tasks)
  {
    auto text = slurp(t);
    if(!text)
    {
      diagnostic <<= diagnostic_db::args::cannot_open_file(source_range { "args", 0, 0, 0, 0 }, t);
      continue;
    }
    runners.emplace_back(std::async(std::launch::async, [t, src = std::move(*text)]() { return run(src, t); }));

    if(runners.size() >= config.num_cores)
      flush();
  }
  flush();
}
