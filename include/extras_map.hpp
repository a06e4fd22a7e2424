#pragma once

#include <ast_fwd.hpp>

#include <tsl/robin_map.h>

#include <cstdint>
#include <vector>

namespace ktree
{

using extra_list = std::vector<node_ptr>;

// Trivia associated with the nodes of one tree, keyed by node id. Looking up
// nodes of an unrelated tree yields empty lists.
class extras_map
{
public:
  virtual ~extras_map() = default;

  virtual const extra_list& before(const node_ptr& node) const = 0;
  virtual const extra_list& within(const node_ptr& node) const = 0;
  virtual const extra_list& after(const node_ptr& node) const = 0;
};

class mutable_extras_map : public extras_map
{
public:
  virtual void set_before(const node_ptr& node, extra_list extras) = 0;
  virtual void set_within(const node_ptr& node, extra_list extras) = 0;
  virtual void set_after(const node_ptr& node, extra_list extras) = 0;

  // Moves all three lists of `from` onto `to`, leaving `from` without extras.
  virtual void move_extras(const node_ptr& from, const node_ptr& to) = 0;
};

class extras_table : public mutable_extras_map
{
public:
  const extra_list& before(const node_ptr& node) const override;
  const extra_list& within(const node_ptr& node) const override;
  const extra_list& after(const node_ptr& node) const override;

  void set_before(const node_ptr& node, extra_list extras) override;
  void set_within(const node_ptr& node, extra_list extras) override;
  void set_after(const node_ptr& node, extra_list extras) override;

  void append_before(const node_ptr& node, const extra_list& extras);
  void append_within(const node_ptr& node, const extra_list& extras);
  void append_after(const node_ptr& node, const extra_list& extras);

  void move_extras(const node_ptr& from, const node_ptr& to) override;

  // Drops every list held for `node`.
  void erase(const node_ptr& node);

  std::size_t size() const { return entries.size(); }
  bool empty() const { return entries.empty(); }
  void clear() { entries.clear(); }
private:
  struct entry
  {
    extra_list before;
    extra_list within;
    extra_list after;

    bool empty() const { return before.empty() && within.empty() && after.empty(); }
  };

  entry& entry_of(const node_ptr& node);
  const entry* find(const node_ptr& node) const;
  void drop_if_empty(const node_ptr& node);

  tsl::robin_map<std::uint_fast64_t, entry> entries;
};

}
