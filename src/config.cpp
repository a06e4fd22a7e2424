#include <config.hpp>
#include <diagnostic_db.hpp>
#include <errors.hpp>

#include <type_traits>
#include <string_view>
#include <algorithm>
#include <array>

namespace ktree
{

static constexpr std::array<std::string_view, 5> config_keys = {
  "collapse_blank_lines", "dump_verbose", "writing", "record_diagnostics", "record_info"
};

void to_json(nlohmann::json& j, const config_t& c)
{
  j = nlohmann::json{
    { "collapse_blank_lines", c.collapse_blank_lines },
    { "dump_verbose", c.dump_verbose },
    { "writing", c.writing },
    { "record_diagnostics", c.record_diagnostics },
    { "record_info", c.record_info },
  };
}

template<typename T>
static void read_key(const nlohmann::json& j, const char* key, const char* expects, T& out)
{
  auto it = j.find(key);
  if(it == j.end())
    return;
  if constexpr(std::is_same_v<T, bool>)
  {
    if(!it->is_boolean())
      raise<invariant_violation>(diagnostic_db::config::bad_value(source_range{}, key, expects));
    out = it->template get<bool>();
  }
  else
  {
    // NLOHMANN_JSON_SERIALIZE_ENUM maps unknown strings to the first entry.
    if(!it->is_string() || nlohmann::json(it->template get<T>()) != *it)
      raise<invariant_violation>(diagnostic_db::config::bad_value(source_range{}, key, expects));
    out = it->template get<T>();
  }
}

void from_json(const nlohmann::json& j, config_t& c)
{
  read_key(j, "collapse_blank_lines", "a boolean", c.collapse_blank_lines);
  read_key(j, "dump_verbose", "a boolean", c.dump_verbose);
  read_key(j, "writing", "\"heuristic\" or \"verbatim\"", c.writing);
  read_key(j, "record_diagnostics", "a boolean", c.record_diagnostics);
  read_key(j, "record_info", "a boolean", c.record_info);
}

void load_config(const nlohmann::json& j)
{
  if(!j.is_object())
    raise<invariant_violation>(diagnostic_db::config::bad_value(source_range{}, "<root>", "an object"));

  for(auto& item : j.items())
  {
    if(std::find(config_keys.begin(), config_keys.end(), item.key()) == config_keys.end())
      record(diagnostic_db::config::unknown_key(source_range{}, item.key()));
  }
  config_t updated = config;
  from_json(j, updated);
  config = updated;
}

}
