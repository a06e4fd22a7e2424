#include <visitor.hpp>
#include <child_slots.hpp>

namespace ktree
{

namespace
{

class callback_visitor : public visitor
{
public:
  callback_visitor(const std::function<void(const node_path&)>& callback)
    : callback(callback)
  {  }
protected:
  void visit(const node_path& path) override
  {
    callback(path);
    visitor::visit(path);
  }
private:
  const std::function<void(const node_path&)>& callback;
};

}

void visitor::traverse(const node_ptr& root)
{
  if(root != nullptr)
    visit(node_path(root));
}

void visitor::traverse(const node_ptr& root, const std::function<void(const node_path&)>& callback)
{
  callback_visitor v(callback);
  v.traverse(root);
}

void visitor::visit(const node_path& path)
{
  visit_children(path);
}

void visitor::visit_children(const node_path& path)
{
  for_each_child(path.node, [this, &path](const node_ptr& child)
  {
    visit(path.child_path(child));
  });
}

void visitor::visit_child(const node_path& path, const node_ptr& child)
{
  if(child != nullptr)
    visit(path.child_path(child));
}

}
