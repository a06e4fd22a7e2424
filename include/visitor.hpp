#pragma once

#include <node_path.hpp>

#include <functional>

namespace ktree
{

// Read-only depth-first pre-order traversal. Children are enumerated with
// the child slot table; subclasses override `visit` to change what happens
// at a node and call `visit_children` to descend.
class visitor
{
public:
  virtual ~visitor() = default;

  void traverse(const node_ptr& root);

  static void traverse(const node_ptr& root, const std::function<void(const node_path&)>& callback);
protected:
  virtual void visit(const node_path& path);

  void visit_children(const node_path& path);

  // Visits `child` below `path`, doing nothing for an absent child.
  void visit_child(const node_path& path, const node_ptr& child);

  template<typename T>
  void visit_list(const node_path& path, const list_of<T>& children)
  {
    for(auto& c : children)
      visit_child(path, c);
  }
};

}
