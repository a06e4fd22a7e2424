#pragma once

#include <diagnostic.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <cstdint>
#include <string>
#include <vector>

namespace ktree
{

// Base of everything the library throws. Carries the diagnostic it was raised with.
struct error : std::runtime_error
{
  explicit error(const nlohmann::json& diag);

  const nlohmann::json& diagnostic() const { return diag; }
  std::uint_fast16_t code() const;
  diag_level level() const;
private:
  nlohmann::json diag;
};

// A node was constructed with an inconsistent combination of fields.
struct invariant_violation : error { using error::error; };

// The converter met a construct it recognizes but does not model.
struct unsupported_construct : error { using error::error; };

// A dispatch site met a node kind it has no case for.
struct internal_error : error { using error::error; };

// Raised by parser adapters. The library only propagates it.
struct parse_error : error
{
  struct entry
  {
    std::string description;
    std::size_t offset;
  };

  parse_error(std::vector<entry> entries, const source_range& range = {});

  const std::vector<entry>& entries() const { return errors; }
private:
  std::vector<entry> errors;
};

void record(const nlohmann::json& diag);

// Records `diag` with the diagnostics manager (when enabled) and throws E.
template<typename E>
[[noreturn]] void raise(const nlohmann::json& diag)
{
  record(diag);
  throw E(diag);
}

}
