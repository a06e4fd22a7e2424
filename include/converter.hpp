#pragma once

#include <ast.hpp>
#include <raw_element.hpp>
#include <extras_map.hpp>
#include <source_range.hpp>

#include <tsl/robin_map.h>

#include <string>

namespace ktree
{

// Node factory for parser adapters. Every node built through `make` is
// reported to `on_node` together with the raw element it came from; a null
// origin marks a synthetic node.
class converter
{
public:
  converter(std::string module = "<ast>", std::string source = {});
  virtual ~converter() = default;

  template<typename T, typename... Args>
  std::shared_ptr<const T> make(const raw_element* origin, Args&&... args)
  {
    auto node = mk<T>(std::forward<Args>(args)...);
    on_node(node, origin);
    return node;
  }

  keyword_ptr make_keyword(const raw_element* origin, keyword_kind which)
  { return make<keyword>(origin, which); }

  // Throws unsupported_construct for a raw element the node model has no place for.
  [[noreturn]] void unsupported(const raw_element& origin) const;

  source_range range_of(const raw_element& origin) const;

  const std::string& module_name() const { return module; }
protected:
  virtual void on_node(const node_ptr& node, const raw_element* origin);

  std::string module;
  std::string source;
};

// Captures trivia while converting. Once the file or script node is made,
// the raw tree is walked in document order and every whitespace, comment,
// semicolon and trailing comma lands in the before, within or after list of
// a node. A raw element converted more than once belongs to the last node.
class extras_converter : public converter
{
public:
  using converter::converter;

  extras_table& extras() { return table; }
  const extras_table& extras() const { return table; }

  // The node last made from `element`, or null.
  node_ptr node_of(const raw_element& element) const;

  void fill_extras(const raw_element& root);
protected:
  void on_node(const node_ptr& node, const raw_element* origin) override;
private:
  node_ptr make_extra(const raw_element& elem, const raw_element* prev_leaf, const raw_element* next_leaf) const;

  tsl::robin_map<const raw_element*, node_ptr> nodes;
  extras_table table;
};

}
