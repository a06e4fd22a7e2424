#include <extras_map.hpp>

namespace ktree
{

static const extra_list no_extras;

const extras_table::entry* extras_table::find(const node_ptr& node) const
{
  auto it = entries.find(node->id);
  if(it == entries.end())
    return nullptr;
  return &it->second;
}

extras_table::entry& extras_table::entry_of(const node_ptr& node)
{
  return entries[node->id];
}

void extras_table::drop_if_empty(const node_ptr& node)
{
  auto it = entries.find(node->id);
  if(it != entries.end() && it->second.empty())
    entries.erase(it);
}

const extra_list& extras_table::before(const node_ptr& node) const
{
  auto e = find(node);
  return e == nullptr ? no_extras : e->before;
}

const extra_list& extras_table::within(const node_ptr& node) const
{
  auto e = find(node);
  return e == nullptr ? no_extras : e->within;
}

const extra_list& extras_table::after(const node_ptr& node) const
{
  auto e = find(node);
  return e == nullptr ? no_extras : e->after;
}

void extras_table::set_before(const node_ptr& node, extra_list extras)
{
  entry_of(node).before = std::move(extras);
  drop_if_empty(node);
}

void extras_table::set_within(const node_ptr& node, extra_list extras)
{
  entry_of(node).within = std::move(extras);
  drop_if_empty(node);
}

void extras_table::set_after(const node_ptr& node, extra_list extras)
{
  entry_of(node).after = std::move(extras);
  drop_if_empty(node);
}

static void append_to(extra_list& list, const extra_list& extras)
{
  list.insert(list.end(), extras.begin(), extras.end());
}

void extras_table::append_before(const node_ptr& node, const extra_list& extras)
{
  if(!extras.empty())
    append_to(entry_of(node).before, extras);
}

void extras_table::append_within(const node_ptr& node, const extra_list& extras)
{
  if(!extras.empty())
    append_to(entry_of(node).within, extras);
}

void extras_table::append_after(const node_ptr& node, const extra_list& extras)
{
  if(!extras.empty())
    append_to(entry_of(node).after, extras);
}

void extras_table::move_extras(const node_ptr& from, const node_ptr& to)
{
  if(from->id == to->id)
    return;

  auto it = entries.find(from->id);
  if(it == entries.end())
  {
    entries.erase(to->id);
    return;
  }
  entry moved = std::move(it.value());
  entries.erase(it);
  entries[to->id] = std::move(moved);
}

void extras_table::erase(const node_ptr& node)
{
  entries.erase(node->id);
}

}
