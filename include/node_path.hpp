#pragma once

#include <ast_fwd.hpp>

#include <cstddef>
#include <vector>

namespace ktree
{

// A node together with the chain of paths leading to it from the root.
// Paths refer to their parents by address and live as long as a traversal step.
struct node_path
{
  node_path(node_ptr node, const node_path* parent = nullptr)
    : node(std::move(node)), parent(parent)
  {  }

  node_ptr node;
  const node_path* parent;

  node_ptr parent_node() const { return parent == nullptr ? nullptr : parent->node; }

  // Nearest ancestor first.
  std::vector<node_ptr> ancestors() const
  {
    std::vector<node_ptr> result;
    for(auto p = parent; p != nullptr; p = p->parent)
      result.push_back(p->node);
    return result;
  }

  node_path child_path(node_ptr child) const { return node_path(std::move(child), this); }

  std::size_t depth() const
  {
    std::size_t d = 0;
    for(auto p = parent; p != nullptr; p = p->parent)
      ++d;
    return d;
  }
};

}
