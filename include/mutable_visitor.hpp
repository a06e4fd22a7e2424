#pragma once

#include <node_path.hpp>
#include <extras_map.hpp>

#include <functional>

namespace ktree
{

// Depth-first rebuild of a tree. `pre_visit` may replace a node before its
// children are rebuilt, `post_visit` sees the node with rebuilt children.
// A node is reconstructed only when one of its children changed, so
// untouched subtrees keep their identity and their extras.
class mutable_visitor
{
public:
  using hook = std::function<node_ptr(const node_path&)>;

  struct rebuilt
  {
    node_ptr node;
    bool changed;
  };

  explicit mutable_visitor(mutable_extras_map* extras = nullptr)
    : extras(extras)
  {  }
  virtual ~mutable_visitor() = default;

  node_ptr traverse(const node_ptr& root);

  // Empty hooks leave nodes as they are. When `extras` is given, the extras
  // of every replaced node move to its replacement.
  static node_ptr traverse(const node_ptr& root, const hook& pre, const hook& post = {},
                           mutable_extras_map* extras = nullptr);
protected:
  virtual node_ptr pre_visit(const node_path& path) { return path.node; }
  virtual node_ptr post_visit(const node_path& path) { return path.node; }

  rebuilt visit(const node_path& path);
private:
  struct child_rebuilder;

  rebuilt rebuild_children(const node_path& path);

  mutable_extras_map* extras;
};

}
