#pragma once

#include <ast_fwd.hpp>

#include <string>
#include <vector>

namespace ktree
{

// One significant child position of a node. Absent optional slots are
// reported with a null `single`.
struct child_slot
{
  const char* name;
  bool is_list;
  node_ptr single;
  node_list list;
};
using slot_list = std::vector<child_slot>;

// Ordered exactly as the children appear in source text.
slot_list child_slots(const node_ptr& node);

// Calls `fn` for every present child in source order.
template<typename Fn>
void for_each_child(const node_ptr& node, Fn&& fn)
{
  for(auto& slot : child_slots(node))
  {
    if(slot.is_list)
    {
      for(auto& c : slot.list)
        fn(c);
    }
    else if(slot.single != nullptr)
      fn(slot.single);
  }
}

struct attribute
{
  const char* key;
  std::string value;
};

// Scalar payload of a node (texts, flags, forms) in declaration order.
std::vector<attribute> node_attributes(const node_ptr& node);

}
