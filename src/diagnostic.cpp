#include <diagnostic.hpp>

#include <fmt/color.h>

#include <algorithm>
#include <cassert>

namespace mk_diag
{

nlohmann::json warn(const source_range& range,
                    std::uint_fast16_t hrc, const std::string_view& message)
{
  nlohmann::json j;

  j["range"] = range;

  j["level"] = diag_level::warn;

  j["hrc"] = hrc;
  j["message"] = message;

  return j;
}

nlohmann::json error(const source_range& range,
                     std::uint_fast16_t hrc, const std::string_view& message)
{
  nlohmann::json j;

  j["range"] = range;

  j["level"] = diag_level::error;

  j["hrc"] = hrc;
  j["message"] = message;

  return j;
}

nlohmann::json info(const source_range& range, const std::string_view& message)
{
  nlohmann::json j;

  j["range"] = range;

  j["level"] = diag_level::info;
  j["message"] = message;

  return j;
}

}

diagnostics_manager::~diagnostics_manager()
{ assert(printed && "Messages have been printed."); }

diagnostics_manager& diagnostics_manager::operator<<=(const nlohmann::json& msg)
{
  std::lock_guard<std::mutex> guard(mut);

  if(msg["level"].get<diag_level>() == diag_level::error)
    err = 1;

  auto row = msg["range"]["row_beg"].get<std::size_t>();
  auto col = msg["range"]["col_beg"].get<std::size_t>();

  data[::detail::make_position(msg["range"]["module"].get<std::string>(), row, col)].push_back(msg);

  return *this;
}

std::size_t diagnostics_manager::size() const
{
  std::lock_guard<std::mutex> guard(mut);

  std::size_t n = 0;
  for(auto& w : data)
    n += w.second.size();
  return n;
}

std::vector<nlohmann::json> diagnostics_manager::messages() const
{
  std::lock_guard<std::mutex> guard(mut);

  std::vector<std::pair<::detail::position, const std::vector<nlohmann::json>*>> sorted;
  sorted.reserve(data.size());
  for(auto& w : data)
    sorted.emplace_back(w.first, &w.second);

  std::sort(sorted.begin(), sorted.end(), [](auto& lhs, auto& rhs) { return lhs.first < rhs.first; });

  std::vector<nlohmann::json> out;
  for(auto& w : sorted)
    out.insert(out.end(), w.second->begin(), w.second->end());
  return out;
}

void diagnostics_manager::print(std::FILE* file)
{
  if(printed)
    return;
  for(auto& v : messages())
  {
    fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}:{}:{}: ",
        v["range"]["module"].get<std::string>(),
        v["range"]["row_beg"].get<std::size_t>(),
        v["range"]["col_beg"].get<std::size_t>());

    auto lv = v["level"].get<diag_level>();

    switch(lv)
    {
    default:
    case diag_level::error:
      {
        fmt::print(file, fg(fmt::color::cornsilk), "(HE-{}) ", v["hrc"].get<std::uint_fast16_t>());
        fmt::print(file, fmt::emphasis::bold | fg(fmt::color::red), "error: ");
        fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", v["message"].get<std::string>());
      } break;

    case diag_level::info:
      {
        fmt::print(file, fmt::emphasis::bold | fg(fmt::color::gray), "info: ");
        fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", v["message"].get<std::string>());
      } break;

    case diag_level::warn:
      {
        fmt::print(file, fg(fmt::color::cornsilk), "(HE-{}) ", v["hrc"].get<std::uint_fast16_t>());
        fmt::print(file, fmt::emphasis::bold | fg(fmt::color::alice_blue), "warning: ");
        fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", v["message"].get<std::string>());
      } break;
    }
    fmt::print(file, fg(fmt::color::white), "\n");
  }
  std::lock_guard<std::mutex> guard(mut);
  printed = true;
}

int diagnostics_manager::error_code() const
{
  return err;
}
