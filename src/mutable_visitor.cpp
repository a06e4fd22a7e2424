#include <mutable_visitor.hpp>
#include <ast.hpp>
#include <errors.hpp>
#include <diagnostic_db.hpp>

#include <type_traits>

namespace ktree
{

namespace
{

class hook_visitor : public mutable_visitor
{
public:
  hook_visitor(const hook& pre, const hook& post, mutable_extras_map* extras)
    : mutable_visitor(extras), pre(pre), post(post)
  {  }
protected:
  node_ptr pre_visit(const node_path& path) override
  { return pre ? pre(path) : path.node; }

  node_ptr post_visit(const node_path& path) override
  { return post ? post(path) : path.node; }
private:
  const hook& pre;
  const hook& post;
};

}

// Rebuilds the children of one node and remembers whether any of them changed.
struct mutable_visitor::child_rebuilder
{
  mutable_visitor& v;
  const node_path& path;
  bool changed { false };

  template<typename T>
  std::shared_ptr<const T> operator()(const std::shared_ptr<const T>& child)
  {
    if(child == nullptr)
      return nullptr;
    auto r = v.visit(path.child_path(child));
    changed = changed || r.changed;
    if constexpr(std::is_same_v<T, node_base>)
      return r.node;
    else
      return node_cast<T>(r.node, kind_name(path.node->kind));
  }

  template<typename T>
  list_of<T> operator()(const list_of<T>& children)
  {
    list_of<T> result;
    result.reserve(children.size());
    for(auto& c : children)
      result.push_back((*this)(c));
    return result;
  }

  template<typename T, typename... Args>
  rebuilt result(Args&&... args) const
  {
    if(!changed)
      return { path.node, false };
    return { mk<T>(std::forward<Args>(args)...), true };
  }
};

node_ptr mutable_visitor::traverse(const node_ptr& root)
{
  if(root == nullptr)
    return nullptr;
  return visit(node_path(root)).node;
}

node_ptr mutable_visitor::traverse(const node_ptr& root, const hook& pre, const hook& post,
                                   mutable_extras_map* extras)
{
  hook_visitor v(pre, post, extras);
  return v.traverse(root);
}

static node_ptr expect_replacement(node_ptr node)
{
  if(node == nullptr)
    raise<invariant_violation>(diagnostic_db::node::missing_child(source_range{}, "mutable_visitor hook result"));
  return node;
}

mutable_visitor::rebuilt mutable_visitor::visit(const node_path& path)
{
  const node_ptr original = path.node;

  node_path working(expect_replacement(pre_visit(path)), path.parent);
  auto children = rebuild_children(working);

  node_path done(children.node, path.parent);
  node_ptr result = expect_replacement(post_visit(done));

  if(extras != nullptr && result->id != original->id)
    extras->move_extras(original, result);
  return { result, result != original };
}

mutable_visitor::rebuilt mutable_visitor::rebuild_children(const node_path& path)
{
  const node_ptr& node = path.node;
  child_rebuilder r { *this, path };

  switch(node->kind)
  {
  case node_kind::kotlin_file:
    {
      auto n = as<kotlin_file>(node);
      auto annotation_sets = r(n->annotation_sets);
      auto package = r(n->package_directive);
      auto imports = r(n->import_directives);
      auto declarations = r(n->declarations);
      return r.result<kotlin_file>(annotation_sets, package, imports, declarations);
    }
  case node_kind::kotlin_script:
    {
      auto n = as<kotlin_script>(node);
      auto annotation_sets = r(n->annotation_sets);
      auto package = r(n->package_directive);
      auto imports = r(n->import_directives);
      auto expressions = r(n->expressions);
      return r.result<kotlin_script>(annotation_sets, package, imports, expressions);
    }
  case node_kind::package_directive:
    {
      auto n = as<package_directive>(node);
      auto mods = r(n->modifiers);
      auto kw = r(n->package_keyword);
      auto names = r(n->names);
      return r.result<package_directive>(mods, kw, names);
    }
  case node_kind::import_directives:
    {
      auto elements = r(as<import_directives>(node)->elements);
      return r.result<import_directives>(elements);
    }
  case node_kind::import_directive:
    {
      auto n = as<import_directive>(node);
      auto kw = r(n->import_keyword);
      auto names = r(n->names);
      auto alias = r(n->import_alias);
      return r.result<import_directive>(kw, names, alias);
    }
  case node_kind::import_alias:
    {
      auto name = r(as<import_alias>(node)->name);
      return r.result<import_alias>(name);
    }

  case node_kind::class_declaration:
    {
      auto n = as<class_declaration>(node);
      auto mods = r(n->modifiers);
      auto kw = r(n->declaration_keyword);
      auto name = r(n->name);
      auto tparams = r(n->type_params);
      auto ctor = r(n->primary_constructor);
      auto parents = r(n->class_parents);
      auto constraints = r(n->type_constraint_set);
      auto body = r(n->class_body);
      return r.result<class_declaration>(mods, kw, name, tparams, ctor, parents, constraints, body);
    }
  case node_kind::class_parents:
    {
      auto elements = r(as<class_parents>(node)->elements);
      return r.result<class_parents>(elements);
    }
  case node_kind::call_constructor_parent:
    {
      auto n = as<call_constructor_parent>(node);
      auto type = r(n->type);
      auto args = r(n->args);
      auto lambda = r(n->lambda_arg);
      return r.result<call_constructor_parent>(type, args, lambda);
    }
  case node_kind::delegated_type_parent:
    {
      auto n = as<delegated_type_parent>(node);
      auto type = r(n->type);
      auto kw = r(n->by_keyword);
      auto expression = r(n->expression);
      return r.result<delegated_type_parent>(type, kw, expression);
    }
  case node_kind::type_parent:
    {
      auto type = r(as<type_parent>(node)->type);
      return r.result<type_parent>(type);
    }
  case node_kind::primary_constructor:
    {
      auto n = as<primary_constructor>(node);
      auto mods = r(n->modifiers);
      auto kw = r(n->constructor_keyword);
      auto params = r(n->params);
      return r.result<primary_constructor>(mods, kw, params);
    }
  case node_kind::class_body:
    {
      auto n = as<class_body>(node);
      auto entries = r(n->enum_entries);
      auto declarations = r(n->declarations);
      return r.result<class_body>(entries, n->enum_trailing_comma, declarations);
    }
  case node_kind::enum_entry:
    {
      auto n = as<enum_entry>(node);
      auto mods = r(n->modifiers);
      auto name = r(n->name);
      auto args = r(n->args);
      auto body = r(n->class_body);
      return r.result<enum_entry>(mods, name, args, body);
    }
  case node_kind::init_declaration:
    {
      auto n = as<init_declaration>(node);
      auto mods = r(n->modifiers);
      auto block = r(n->block);
      return r.result<init_declaration>(mods, block);
    }
  case node_kind::function_declaration:
    {
      auto n = as<function_declaration>(node);
      auto mods = r(n->modifiers);
      auto kw = r(n->fun_keyword);
      auto tparams = r(n->type_params);
      auto receiver = r(n->receiver_type_ref);
      auto name = r(n->name);
      auto params = r(n->params);
      auto type = r(n->type_ref);
      auto post_mods = r(n->post_modifiers);
      auto equals = r(n->equals);
      auto body = r(n->body);
      return r.result<function_declaration>(mods, kw, tparams, receiver, name, params, type, post_mods, equals, body);
    }
  case node_kind::function_params:
    {
      auto n = as<function_params>(node);
      auto elements = r(n->elements);
      auto comma = r(n->trailing_comma);
      return r.result<function_params>(elements, comma);
    }
  case node_kind::function_param:
    {
      auto n = as<function_param>(node);
      auto mods = r(n->modifiers);
      auto kw = r(n->val_or_var);
      auto name = r(n->name);
      auto type = r(n->type_ref);
      auto equals = r(n->equals);
      auto value = r(n->default_value);
      return r.result<function_param>(mods, kw, name, type, equals, value);
    }
  case node_kind::property_declaration:
    {
      auto n = as<property_declaration>(node);
      auto mods = r(n->modifiers);
      auto kw = r(n->val_or_var);
      auto tparams = r(n->type_params);
      auto receiver = r(n->receiver_type_ref);
      auto lpar = r(n->lpar);
      auto variables = r(n->variables);
      auto comma = r(n->trailing_comma);
      auto rpar = r(n->rpar);
      auto constraints = r(n->type_constraint_set);
      auto equals = r(n->equals);
      auto initializer = r(n->initializer);
      auto delegate = r(n->property_delegate);
      auto accessors = r(n->accessors);
      return r.result<property_declaration>(mods, kw, tparams, receiver, lpar, variables, comma, rpar,
                                            constraints, equals, initializer, delegate, accessors);
    }
  case node_kind::property_delegate:
    {
      auto n = as<property_delegate>(node);
      auto kw = r(n->by_keyword);
      auto expression = r(n->expression);
      return r.result<property_delegate>(kw, expression);
    }
  case node_kind::variable:
    {
      auto n = as<variable>(node);
      auto mods = r(n->modifiers);
      auto name = r(n->name);
      auto type = r(n->type_ref);
      return r.result<variable>(mods, name, type);
    }
  case node_kind::getter:
    {
      auto n = as<getter>(node);
      auto mods = r(n->modifiers);
      auto kw = r(n->get_keyword);
      auto lpar = r(n->lpar);
      auto rpar = r(n->rpar);
      auto type = r(n->type_ref);
      auto post_mods = r(n->post_modifiers);
      auto equals = r(n->equals);
      auto body = r(n->body);
      return r.result<getter>(mods, kw, lpar, rpar, type, post_mods, equals, body);
    }
  case node_kind::setter:
    {
      auto n = as<setter>(node);
      auto mods = r(n->modifiers);
      auto kw = r(n->set_keyword);
      auto params = r(n->params);
      auto post_mods = r(n->post_modifiers);
      auto equals = r(n->equals);
      auto body = r(n->body);
      return r.result<setter>(mods, kw, params, post_mods, equals, body);
    }
  case node_kind::type_alias_declaration:
    {
      auto n = as<type_alias_declaration>(node);
      auto mods = r(n->modifiers);
      auto name = r(n->name);
      auto tparams = r(n->type_params);
      auto type = r(n->type_ref);
      return r.result<type_alias_declaration>(mods, name, tparams, type);
    }
  case node_kind::secondary_constructor_declaration:
    {
      auto n = as<secondary_constructor_declaration>(node);
      auto mods = r(n->modifiers);
      auto kw = r(n->constructor_keyword);
      auto params = r(n->params);
      auto call = r(n->delegation_call);
      auto block = r(n->block);
      return r.result<secondary_constructor_declaration>(mods, kw, params, call, block);
    }
  case node_kind::delegation_call:
    {
      auto n = as<delegation_call>(node);
      auto target = r(n->target);
      auto args = r(n->args);
      return r.result<delegation_call>(target, args);
    }
  case node_kind::type_params:
    {
      auto n = as<type_params>(node);
      auto elements = r(n->elements);
      auto comma = r(n->trailing_comma);
      return r.result<type_params>(elements, comma);
    }
  case node_kind::type_param:
    {
      auto n = as<type_param>(node);
      auto mods = r(n->modifiers);
      auto name = r(n->name);
      auto type = r(n->type_ref);
      return r.result<type_param>(mods, name, type);
    }

  case node_kind::function_type:
    {
      auto n = as<function_type>(node);
      auto context = r(n->context_receivers);
      auto receiver = r(n->receiver);
      auto params = r(n->params);
      auto ret = r(n->return_type_ref);
      return r.result<function_type>(context, receiver, params, ret);
    }
  case node_kind::context_receivers:
    {
      auto n = as<context_receivers>(node);
      auto elements = r(n->elements);
      auto comma = r(n->trailing_comma);
      return r.result<context_receivers>(elements, comma);
    }
  case node_kind::context_receiver:
    {
      auto type = r(as<context_receiver>(node)->type_ref);
      return r.result<context_receiver>(type);
    }
  case node_kind::function_type_receiver:
    {
      auto type = r(as<function_type_receiver>(node)->type_ref);
      return r.result<function_type_receiver>(type);
    }
  case node_kind::function_type_params:
    {
      auto n = as<function_type_params>(node);
      auto elements = r(n->elements);
      auto comma = r(n->trailing_comma);
      return r.result<function_type_params>(elements, comma);
    }
  case node_kind::function_type_param:
    {
      auto n = as<function_type_param>(node);
      auto name = r(n->name);
      auto type = r(n->type_ref);
      return r.result<function_type_param>(name, type);
    }
  case node_kind::simple_type:
    {
      auto n = as<simple_type>(node);
      auto qualifiers = r(n->qualifiers);
      auto name = r(n->name);
      auto args = r(n->type_args);
      return r.result<simple_type>(qualifiers, name, args);
    }
  case node_kind::simple_type_qualifier:
    {
      auto n = as<simple_type_qualifier>(node);
      auto name = r(n->name);
      auto args = r(n->type_args);
      return r.result<simple_type_qualifier>(name, args);
    }
  case node_kind::nullable_type:
    {
      auto n = as<nullable_type>(node);
      auto lpar = r(n->lpar);
      auto mods = r(n->modifiers);
      auto type = r(n->type);
      auto rpar = r(n->rpar);
      return r.result<nullable_type>(lpar, mods, type, rpar);
    }
  case node_kind::type_args:
    {
      auto n = as<type_args>(node);
      auto elements = r(n->elements);
      auto comma = r(n->trailing_comma);
      return r.result<type_args>(elements, comma);
    }
  case node_kind::type_arg:
    {
      auto n = as<type_arg>(node);
      auto mods = r(n->modifiers);
      auto type = r(n->type_ref);
      return r.result<type_arg>(mods, type, n->asterisk);
    }
  case node_kind::type_ref:
    {
      auto n = as<type_ref>(node);
      auto lpar = r(n->lpar);
      auto mods = r(n->modifiers);
      auto type = r(n->type);
      auto rpar = r(n->rpar);
      return r.result<type_ref>(lpar, mods, type, rpar);
    }
  case node_kind::value_args:
    {
      auto n = as<value_args>(node);
      auto elements = r(n->elements);
      auto comma = r(n->trailing_comma);
      return r.result<value_args>(elements, comma);
    }
  case node_kind::value_arg:
    {
      auto n = as<value_arg>(node);
      auto name = r(n->name);
      auto expression = r(n->expression);
      return r.result<value_arg>(name, n->asterisk, expression);
    }

  case node_kind::if_expression:
    {
      auto n = as<if_expression>(node);
      auto kw = r(n->if_keyword);
      auto condition = r(n->condition);
      auto body = r(n->body);
      auto else_body = r(n->else_body);
      return r.result<if_expression>(kw, condition, body, else_body);
    }
  case node_kind::try_expression:
    {
      auto n = as<try_expression>(node);
      auto block = r(n->block);
      auto catches = r(n->catch_clauses);
      auto finally_block = r(n->finally_block);
      return r.result<try_expression>(block, catches, finally_block);
    }
  case node_kind::catch_clause:
    {
      auto n = as<catch_clause>(node);
      auto kw = r(n->catch_keyword);
      auto params = r(n->params);
      auto block = r(n->block);
      return r.result<catch_clause>(kw, params, block);
    }
  case node_kind::for_expression:
    {
      auto n = as<for_expression>(node);
      auto kw = r(n->for_keyword);
      auto param = r(n->loop_param);
      auto range = r(n->loop_range);
      auto body = r(n->body);
      return r.result<for_expression>(kw, param, range, body);
    }
  case node_kind::while_expression:
    {
      auto n = as<while_expression>(node);
      if(n->do_while)
      {
        auto body = r(n->body);
        auto kw = r(n->while_keyword);
        auto condition = r(n->condition);
        return r.result<while_expression>(kw, condition, body, true);
      }
      auto kw = r(n->while_keyword);
      auto condition = r(n->condition);
      auto body = r(n->body);
      return r.result<while_expression>(kw, condition, body, false);
    }
  case node_kind::binary_expression:
    {
      auto n = as<binary_expression>(node);
      auto lhs = r(n->lhs);
      auto op = r(n->op);
      auto rhs = r(n->rhs);
      return r.result<binary_expression>(lhs, op, rhs);
    }
  case node_kind::binary_infix_expression:
    {
      auto n = as<binary_infix_expression>(node);
      auto lhs = r(n->lhs);
      auto op = r(n->op);
      auto rhs = r(n->rhs);
      return r.result<binary_infix_expression>(lhs, op, rhs);
    }
  case node_kind::unary_expression:
    {
      auto n = as<unary_expression>(node);
      if(n->prefix)
      {
        auto op = r(n->op);
        auto expression = r(n->expression);
        return r.result<unary_expression>(expression, op, true);
      }
      auto expression = r(n->expression);
      auto op = r(n->op);
      return r.result<unary_expression>(expression, op, false);
    }
  case node_kind::binary_type_expression:
    {
      auto n = as<binary_type_expression>(node);
      auto lhs = r(n->lhs);
      auto op = r(n->op);
      auto rhs = r(n->rhs);
      return r.result<binary_type_expression>(lhs, op, rhs);
    }
  case node_kind::callable_reference_expression:
    {
      auto n = as<callable_reference_expression>(node);
      auto lhs = r(n->lhs);
      auto rhs = r(n->rhs);
      return r.result<callable_reference_expression>(lhs, rhs);
    }
  case node_kind::class_literal_expression:
    {
      auto lhs = r(as<class_literal_expression>(node)->lhs);
      return r.result<class_literal_expression>(lhs);
    }
  case node_kind::expression_receiver:
    {
      auto expression = r(as<expression_receiver>(node)->expression);
      return r.result<expression_receiver>(expression);
    }
  case node_kind::type_receiver:
    {
      auto n = as<type_receiver>(node);
      auto type = r(n->type);
      return r.result<type_receiver>(type, n->question_marks);
    }
  case node_kind::parenthesized_expression:
    {
      auto inner = r(as<parenthesized_expression>(node)->inner_expression);
      return r.result<parenthesized_expression>(inner);
    }
  case node_kind::string_literal_expression:
    {
      auto n = as<string_literal_expression>(node);
      auto entries = r(n->entries);
      return r.result<string_literal_expression>(entries, n->raw);
    }
  case node_kind::template_string_entry:
    {
      auto n = as<template_string_entry>(node);
      auto expression = r(n->expression);
      return r.result<template_string_entry>(expression, n->short_template);
    }
  case node_kind::lambda_expression:
    {
      auto n = as<lambda_expression>(node);
      auto params = r(n->params);
      auto arrow = r(n->arrow);
      auto body = r(n->lambda_body);
      return r.result<lambda_expression>(params, arrow, body);
    }
  case node_kind::lambda_params:
    {
      auto n = as<lambda_params>(node);
      auto elements = r(n->elements);
      auto comma = r(n->trailing_comma);
      return r.result<lambda_params>(elements, comma);
    }
  case node_kind::lambda_param:
    {
      auto n = as<lambda_param>(node);
      auto lpar = r(n->lpar);
      auto variables = r(n->variables);
      auto comma = r(n->trailing_comma);
      auto rpar = r(n->rpar);
      auto colon = r(n->colon);
      auto type = r(n->destruct_type_ref);
      return r.result<lambda_param>(lpar, variables, comma, rpar, colon, type);
    }
  case node_kind::lambda_body:
    {
      auto statements = r(as<lambda_body>(node)->statements);
      return r.result<lambda_body>(statements);
    }
  case node_kind::super_expression:
    {
      auto n = as<super_expression>(node);
      auto arg = r(n->type_arg);
      return r.result<super_expression>(arg, n->label);
    }
  case node_kind::when_expression:
    {
      auto n = as<when_expression>(node);
      auto kw = r(n->when_keyword);
      auto lpar = r(n->lpar);
      auto subject = r(n->subject);
      auto rpar = r(n->rpar);
      auto branches = r(n->branches);
      return r.result<when_expression>(kw, lpar, subject, rpar, branches);
    }
  case node_kind::when_branch:
    {
      auto n = as<when_branch>(node);
      auto conditions = r(n->conditions);
      auto comma = r(n->trailing_comma);
      auto else_kw = r(n->else_keyword);
      auto body = r(n->body);
      return r.result<when_branch>(conditions, comma, else_kw, body);
    }
  case node_kind::when_condition:
    {
      auto n = as<when_condition>(node);
      auto op = r(n->op);
      auto expression = r(n->expression);
      auto type = r(n->type_ref);
      return r.result<when_condition>(op, expression, type);
    }
  case node_kind::object_literal_expression:
    {
      auto declaration = r(as<object_literal_expression>(node)->declaration);
      return r.result<object_literal_expression>(declaration);
    }
  case node_kind::throw_expression:
    {
      auto expression = r(as<throw_expression>(node)->expression);
      return r.result<throw_expression>(expression);
    }
  case node_kind::return_expression:
    {
      auto n = as<return_expression>(node);
      auto expression = r(n->expression);
      return r.result<return_expression>(n->label, expression);
    }
  case node_kind::collection_literal_expression:
    {
      auto n = as<collection_literal_expression>(node);
      auto expressions = r(n->expressions);
      auto comma = r(n->trailing_comma);
      return r.result<collection_literal_expression>(expressions, comma);
    }
  case node_kind::labeled_expression:
    {
      auto n = as<labeled_expression>(node);
      auto expression = r(n->expression);
      return r.result<labeled_expression>(n->label, expression);
    }
  case node_kind::annotated_expression:
    {
      auto n = as<annotated_expression>(node);
      auto annotation_sets = r(n->annotation_sets);
      auto expression = r(n->expression);
      return r.result<annotated_expression>(annotation_sets, expression);
    }
  case node_kind::call_expression:
    {
      auto n = as<call_expression>(node);
      auto expression = r(n->expression);
      auto targs = r(n->type_args);
      auto args = r(n->args);
      auto lambda = r(n->lambda_arg);
      return r.result<call_expression>(expression, targs, args, lambda);
    }
  case node_kind::lambda_arg:
    {
      auto n = as<lambda_arg>(node);
      auto annotation_sets = r(n->annotation_sets);
      auto expression = r(n->expression);
      return r.result<lambda_arg>(annotation_sets, n->label, expression);
    }
  case node_kind::array_access_expression:
    {
      auto n = as<array_access_expression>(node);
      auto expression = r(n->expression);
      auto indices = r(n->indices);
      auto comma = r(n->trailing_comma);
      return r.result<array_access_expression>(expression, indices, comma);
    }
  case node_kind::anonymous_function_expression:
    {
      auto function = r(as<anonymous_function_expression>(node)->function);
      return r.result<anonymous_function_expression>(function);
    }
  case node_kind::property_expression:
    {
      auto declaration = r(as<property_expression>(node)->declaration);
      return r.result<property_expression>(declaration);
    }
  case node_kind::block_expression:
    {
      auto statements = r(as<block_expression>(node)->statements);
      return r.result<block_expression>(statements);
    }

  case node_kind::modifiers:
    {
      auto elements = r(as<modifiers>(node)->elements);
      return r.result<modifiers>(elements);
    }
  case node_kind::annotation_set:
    {
      auto n = as<annotation_set>(node);
      auto at = r(n->at);
      auto target = r(n->target);
      auto colon = r(n->colon);
      auto lbracket = r(n->lbracket);
      auto annotations = r(n->annotations);
      auto rbracket = r(n->rbracket);
      return r.result<annotation_set>(at, target, colon, lbracket, annotations, rbracket);
    }
  case node_kind::annotation:
    {
      auto n = as<annotation>(node);
      auto type = r(n->type);
      auto args = r(n->args);
      return r.result<annotation>(type, args);
    }
  case node_kind::type_constraint_set:
    {
      auto n = as<type_constraint_set>(node);
      auto kw = r(n->where_keyword);
      auto constraints = r(n->constraints);
      return r.result<type_constraint_set>(kw, constraints);
    }
  case node_kind::type_constraints:
    {
      auto elements = r(as<type_constraints>(node)->elements);
      return r.result<type_constraints>(elements);
    }
  case node_kind::type_constraint:
    {
      auto n = as<type_constraint>(node);
      auto annotation_sets = r(n->annotation_sets);
      auto name = r(n->name);
      auto type = r(n->type_ref);
      return r.result<type_constraint>(annotation_sets, name, type);
    }
  case node_kind::contract:
    {
      auto n = as<contract>(node);
      auto kw = r(n->contract_keyword);
      auto effects = r(n->effects);
      return r.result<contract>(kw, effects);
    }
  case node_kind::contract_effects:
    {
      auto n = as<contract_effects>(node);
      auto elements = r(n->elements);
      auto comma = r(n->trailing_comma);
      return r.result<contract_effects>(elements, comma);
    }
  case node_kind::contract_effect:
    {
      auto expression = r(as<contract_effect>(node)->expression);
      return r.result<contract_effect>(expression);
    }

  // leaves
  case node_kind::dynamic_type:
  case node_kind::literal_string_entry:
  case node_kind::escape_string_entry:
  case node_kind::constant_literal_expression:
  case node_kind::this_expression:
  case node_kind::continue_expression:
  case node_kind::break_expression:
  case node_kind::name_expression:
  case node_kind::keyword:
  case node_kind::whitespace:
  case node_kind::comment:
  case node_kind::semicolon:
  case node_kind::trailing_comma:
  case node_kind::blank_lines:
    return { node, false };

  default:
    raise<internal_error>(diagnostic_db::visit::unhandled_kind(source_range{}, kind_name(node->kind),
                                                              "mutable visitor"));
  }
}

}
