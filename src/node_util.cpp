#include <node_util.hpp>
#include <child_slots.hpp>
#include <ast.hpp>

#include <cstring>

namespace ktree
{

static bool attributes_equal(const std::vector<attribute>& lhs, const std::vector<attribute>& rhs)
{
  if(lhs.size() != rhs.size())
    return false;
  for(std::size_t i = 0; i < lhs.size(); ++i)
  {
    if(std::strcmp(lhs[i].key, rhs[i].key) != 0 || lhs[i].value != rhs[i].value)
      return false;
  }
  return true;
}

bool structurally_equal(const node_ptr& lhs, const node_ptr& rhs)
{
  if(lhs == nullptr || rhs == nullptr)
    return lhs == rhs;
  if(lhs == rhs)
    return true;
  if(lhs->kind != rhs->kind)
    return false;
  if(!attributes_equal(node_attributes(lhs), node_attributes(rhs)))
    return false;
  if(is_extra(lhs->kind))
    return true;

  auto lslots = child_slots(lhs);
  auto rslots = child_slots(rhs);
  for(std::size_t i = 0; i < lslots.size(); ++i)
  {
    auto& l = lslots[i];
    auto& r = rslots[i];
    if(l.is_list != r.is_list)
      return false;
    if(!l.is_list)
    {
      if(!structurally_equal(l.single, r.single))
        return false;
      continue;
    }
    if(l.list.size() != r.list.size())
      return false;
    for(std::size_t j = 0; j < l.list.size(); ++j)
    {
      if(!structurally_equal(l.list[j], r.list[j]))
        return false;
    }
  }
  return true;
}

node_ptr to_type(const node_ptr& expression)
{
  if(expression == nullptr)
    return nullptr;

  switch(expression->kind)
  {
  case node_kind::name_expression:
    return mk<simple_type>(list_of<simple_type_qualifier>{}, as<name_expression>(expression), nullptr);

  case node_kind::call_expression:
    {
      auto call = as<call_expression>(expression);
      if(call->args != nullptr || call->lambda_arg != nullptr
          || call->expression->kind != node_kind::name_expression)
        return nullptr;
      return mk<simple_type>(list_of<simple_type_qualifier>{}, as<name_expression>(call->expression),
                             call->type_args);
    }

  case node_kind::binary_expression:
    {
      auto bin = as<binary_expression>(expression);
      if(bin->op->which != keyword_kind::dot)
        return nullptr;
      auto lhs = to_type(bin->lhs);
      auto rhs = to_type(bin->rhs);
      if(lhs == nullptr || rhs == nullptr
          || lhs->kind != node_kind::simple_type || rhs->kind != node_kind::simple_type)
        return nullptr;

      auto l = as<simple_type>(lhs);
      auto r = as<simple_type>(rhs);
      auto qualifiers = l->qualifiers;
      qualifiers.push_back(mk<simple_type_qualifier>(l->name, l->type_args));
      qualifiers.insert(qualifiers.end(), r->qualifiers.begin(), r->qualifiers.end());
      return mk<simple_type>(qualifiers, r->name, r->type_args);
    }

  default:
    return nullptr;
  }
}

node_ptr wrap_nullable(const node_ptr& type, std::size_t question_marks)
{
  if(type == nullptr)
    return nullptr;
  node_ptr result = type;
  for(std::size_t i = 0; i < question_marks; ++i)
    result = mk<nullable_type>(nullptr, nullptr, result, nullptr);
  return result;
}

lambda_expression_ptr lambda_expression_of(const node_ptr& statement)
{
  if(statement == nullptr)
    return nullptr;
  switch(statement->kind)
  {
  case node_kind::lambda_expression:
    return as<lambda_expression>(statement);
  case node_kind::annotated_expression:
    return lambda_expression_of(as<annotated_expression>(statement)->expression);
  case node_kind::labeled_expression:
    return lambda_expression_of(as<labeled_expression>(statement)->expression);
  default:
    return nullptr;
  }
}

}
