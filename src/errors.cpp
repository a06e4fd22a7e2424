#include <errors.hpp>
#include <diagnostic_db.hpp>
#include <config.hpp>

namespace ktree
{

static std::string what_of(const nlohmann::json& diag)
{
  return fmt::format("KT-{}: {}", diag["code"].get<std::uint_fast16_t>(),
                                  diag["message"].get<std::string>());
}

error::error(const nlohmann::json& diag)
  : std::runtime_error(what_of(diag)), diag(diag)
{  }

std::uint_fast16_t error::code() const
{ return diag["code"].get<std::uint_fast16_t>(); }

diag_level error::level() const
{ return diag["level"].get<diag_level>(); }

parse_error::parse_error(std::vector<entry> entries, const source_range& range)
  : error(diagnostic_db::convert::parse_failed(range, entries.size())), errors(std::move(entries))
{  }

void record(const nlohmann::json& diag)
{
  if(!config.record_diagnostics)
    return;
  if(diag["level"].get<diag_level>() == diag_level::info && !config.record_info)
    return;
  diagnostic <<= diag;
}

}
