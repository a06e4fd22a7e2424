#include <converter.hpp>
#include <errors.hpp>
#include <config.hpp>
#include <diagnostic_db.hpp>

#include <algorithm>
#include <vector>

namespace ktree
{

converter::converter(std::string module, std::string source)
  : module(std::move(module)), source(std::move(source))
{  }

void converter::on_node(const node_ptr&, const raw_element*)
{  }

source_range converter::range_of(const raw_element& origin) const
{
  if(source.empty())
    return source_range { module, 0, 0, 0, 0 };
  return source_range::from_offsets(module, source, origin.offset(), origin.offset() + origin.text().size());
}

void converter::unsupported(const raw_element& origin) const
{
  raise<unsupported_construct>(diagnostic_db::convert::unsupported(range_of(origin), origin.kind()));
}

////////////////////////////////////////////////////////////////////////////////

node_ptr extras_converter::node_of(const raw_element& element) const
{
  auto it = nodes.find(&element);
  return it == nodes.end() ? nullptr : it->second;
}

void extras_converter::on_node(const node_ptr& node, const raw_element* origin)
{
  if(origin == nullptr || is_trivia(origin->role()))
    return;

  auto it = nodes.find(origin);
  if(it != nodes.end())
  {
    record(diagnostic_db::convert::trivia_reattributed(range_of(*origin), origin->kind()));
    it.value() = node;
  }
  else
    nodes.emplace(origin, node);

  if(node->kind == node_kind::kotlin_file || node->kind == node_kind::kotlin_script)
    fill_extras(*origin);
}

static bool has_line_break(std::string_view text)
{ return text.find('\n') != std::string_view::npos; }

static std::size_t count_line_breaks(std::string_view text)
{ return std::count(text.begin(), text.end(), '\n'); }

node_ptr extras_converter::make_extra(const raw_element& elem, const raw_element* prev_leaf,
                                      const raw_element* next_leaf) const
{
  switch(elem.role())
  {
  case raw_role::whitespace:
    {
      const auto breaks = count_line_breaks(elem.text());
      if(config.collapse_blank_lines && breaks >= 2)
        return mk<blank_lines>(breaks - 1);
      return mk<whitespace>(std::string(elem.text()));
    }
  case raw_role::comment:
    {
      // Neighbours are taken in document order, across element boundaries.
      const bool starts_line = prev_leaf == nullptr
        || (prev_leaf->role() == raw_role::whitespace && has_line_break(prev_leaf->text()));
      const bool line_comment = elem.text().substr(0, 2) == "//";
      const bool ends_line = line_comment || next_leaf == nullptr
        || (next_leaf->role() == raw_role::whitespace && has_line_break(next_leaf->text()));
      return mk<comment>(std::string(elem.text()), starts_line, ends_line);
    }
  case raw_role::semicolon:
    return mk<semicolon>();
  case raw_role::trailing_comma:
    return mk<trailing_comma>();
  default:
    raise<internal_error>(diagnostic_db::visit::unhandled_kind(range_of(elem), elem.kind(), "extras converter"));
  }
}

namespace
{

void collect_leaves(const raw_element& elem, std::vector<const raw_element*>& leaves)
{
  if(is_trivia(elem.role()) || elem.role() == raw_role::token || elem.child_count() == 0)
  {
    leaves.push_back(&elem);
    return;
  }
  for(std::size_t i = 0; i < elem.child_count(); ++i)
    collect_leaves(elem.child(i), leaves);
}

bool ends_a_line(const node_ptr& extra)
{
  switch(extra->kind)
  {
  case node_kind::whitespace: return as<whitespace>(extra)->text.find('\n') != std::string::npos;
  case node_kind::blank_lines: return true;
  default: return false;
  }
}

}

void extras_converter::fill_extras(const raw_element& root)
{
  auto root_node = node_of(root);
  if(root_node == nullptr)
    raise<invariant_violation>(diagnostic_db::convert::root_not_converted(range_of(root), root.kind()));

  std::vector<const raw_element*> leaves;
  collect_leaves(root, leaves);
  tsl::robin_map<const raw_element*, std::size_t> leaf_index;
  for(std::size_t i = 0; i < leaves.size(); ++i)
    leaf_index.emplace(leaves[i], i);

  extra_list pending;
  node_ptr last;
  std::vector<node_ptr> ancestors;

  const auto flush_after_token = [&](const raw_element& elem)
  {
    if(pending.empty())
      return;
    if(last != nullptr)
      table.append_after(last, pending);
    else
    {
      record(diagnostic_db::convert::trivia_to_enclosing(range_of(elem), elem.kind()));
      table.append_within(ancestors.back(), pending);
    }
    pending.clear();
  };

  const auto walk = [&](const auto& self, const raw_element& elem) -> void
  {
    const auto role = elem.role();
    if(is_trivia(role))
    {
      const auto i = leaf_index.at(&elem);
      auto extra = make_extra(elem, i == 0 ? nullptr : leaves[i - 1], i + 1 == leaves.size() ? nullptr : leaves[i + 1]);
      pending.push_back(extra);
      // A semicolon closes the previous node together with the trivia before it.
      if(role == raw_role::semicolon && last != nullptr)
      {
        table.append_after(last, pending);
        pending.clear();
      }
      return;
    }

    auto node = role == raw_role::significant ? node_of(elem) : nullptr;
    if(node == nullptr)
    {
      if(role == raw_role::token || elem.child_count() == 0)
      {
        flush_after_token(elem);
        last = nullptr;
        return;
      }
      for(std::size_t i = 0; i < elem.child_count(); ++i)
        self(self, elem.child(i));
      return;
    }

    table.append_before(node, pending);
    pending.clear();
    ancestors.push_back(node);
    last = nullptr;

    for(std::size_t i = 0; i < elem.child_count(); ++i)
      self(self, elem.child(i));

    if(last != nullptr)
    {
      auto split = pending.begin();
      while(split != pending.end())
      {
        const bool line_end = ends_a_line(*split);
        ++split;
        if(line_end)
          break;
      }
      table.append_after(last, extra_list(pending.begin(), split));
      table.append_within(node, extra_list(split, pending.end()));
    }
    else
      table.append_within(node, pending);
    pending.clear();

    ancestors.pop_back();
    last = node;
  };

  ancestors.push_back(root_node);
  walk(walk, root);
}

}
