#pragma once

#include <nlohmann/json.hpp>

namespace ktree
{

enum class write_mode
{
  heuristic,
  verbatim,
};

NLOHMANN_JSON_SERIALIZE_ENUM( write_mode, {
  { write_mode::heuristic, "heuristic" },
  { write_mode::verbatim, "verbatim" },
})

struct config_t
{
  // Whitespace with two or more line breaks becomes a blank_lines extra.
  bool collapse_blank_lines { false };

  bool dump_verbose { false };

  // verbatim: no heuristic tokens are inserted when an extras map is given.
  write_mode writing { write_mode::heuristic };

  bool record_diagnostics { true };

  // Info level messages (trivia placement notes) are only kept when set.
  bool record_info { false };
};

void to_json(nlohmann::json& j, const config_t& c);
void from_json(const nlohmann::json& j, config_t& c);

// Applies the keys present in `j` to `config`. Unknown keys are reported as warnings.
void load_config(const nlohmann::json& j);

inline config_t config;

}
