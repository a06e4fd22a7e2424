#include <diagnostic.hpp>

#include <fmt/color.h>

namespace ktree
{

namespace mk_diag
{

static nlohmann::json make(const source_range& range, diag_level level,
                           std::uint_fast16_t code, const std::string_view& message)
{
  nlohmann::json j;

  j["range"] = range;

  j["level"] = level;

  j["code"] = code;
  j["message"] = message;

  return j;
}

nlohmann::json warn(const source_range& range,
                    std::uint_fast16_t code, const std::string_view& message)
{ return make(range, diag_level::warn, code, message); }

nlohmann::json error(const source_range& range,
                     std::uint_fast16_t code, const std::string_view& message)
{ return make(range, diag_level::error, code, message); }

nlohmann::json info(const source_range& range,
                    std::uint_fast16_t code, const std::string_view& message)
{ return make(range, diag_level::info, code, message); }

}

diagnostics_manager& diagnostics_manager::operator<<=(const nlohmann::json& msg)
{
  std::lock_guard<std::mutex> guard(mut);

  if(msg["level"].get<diag_level>() == diag_level::error)
    err = 1;

  detail::position pos { msg["range"]["module"].get<std::string>(),
                         msg["range"]["row_beg"].get<std::size_t>(),
                         msg["range"]["col_beg"].get<std::size_t>() };

  auto it = data.find(pos);
  if(it == data.end())
  {
    order.push_back(pos);
    data[pos].push_back(msg);
  }
  else
    it.value().push_back(msg);

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

  std::vector<nlohmann::json> result;
  for(auto& pos : order)
  {
    auto& msgs = data.at(pos);
    result.insert(result.end(), msgs.begin(), msgs.end());
  }
  return result;
}

void diagnostics_manager::reset()
{
  std::lock_guard<std::mutex> guard(mut);

  err = 0;
  data.clear();
  order.clear();
}

void diagnostics_manager::print(std::FILE* file)
{
  std::lock_guard<std::mutex> guard(mut);
  for(auto& pos : order)
  {
    for(auto& v : data.at(pos))
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
          fmt::print(file, fg(fmt::color::cornsilk), "(KT-{}) ", v["code"].get<std::uint_fast16_t>());
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
          fmt::print(file, fg(fmt::color::cornsilk), "(KT-{}) ", v["code"].get<std::uint_fast16_t>());
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::alice_blue), "warning: ");
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", v["message"].get<std::string>());
        } break;
      }
      fmt::print(file, fg(fmt::color::white), "\n");
    }
  }
  data.clear();
  order.clear();
}

}
