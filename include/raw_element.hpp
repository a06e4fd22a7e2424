#pragma once

#include <string_view>
#include <cstddef>

namespace ktree
{

enum class raw_role
{
  significant,     // becomes a node, may be a leaf such as an identifier
  whitespace,
  comment,
  semicolon,
  trailing_comma,
  token,           // literal punctuation or keyword text that is not a node
};

// One element of the parse tree handed over by a parser adapter. Elements
// must stay alive and at a fixed address while a converter refers to them.
class raw_element
{
public:
  virtual ~raw_element() = default;

  virtual std::string_view kind() const = 0;
  virtual raw_role role() const = 0;
  virtual std::string_view text() const = 0;
  virtual std::size_t offset() const = 0;

  virtual std::size_t child_count() const = 0;
  virtual const raw_element& child(std::size_t i) const = 0;
};

inline bool is_trivia(raw_role role)
{
  return role == raw_role::whitespace || role == raw_role::comment
      || role == raw_role::semicolon || role == raw_role::trailing_comma;
}

}
