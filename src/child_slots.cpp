#include <child_slots.hpp>
#include <ast.hpp>
#include <errors.hpp>
#include <diagnostic_db.hpp>

namespace ktree
{

namespace
{

struct slot_builder
{
  slot_list slots;

  slot_builder& operator()(const char* name, const node_ptr& child)
  {
    slots.push_back(child_slot { name, false, child, {} });
    return *this;
  }

  template<typename T>
  slot_builder& operator()(const char* name, const list_of<T>& children)
  {
    slots.push_back(child_slot { name, true, nullptr, node_list(children.begin(), children.end()) });
    return *this;
  }
};

const char* to_text(bool b) { return b ? "true" : "false"; }

const char* to_text(constant_form form)
{
  switch(form)
  {
  case constant_form::boolean: return "boolean";
  case constant_form::character: return "character";
  case constant_form::integer: return "integer";
  case constant_form::real: return "real";
  case constant_form::null: return "null";
  }
  return "unknown";
}

}

slot_list child_slots(const node_ptr& node)
{
  slot_builder b;
  switch(node->kind)
  {
  case node_kind::kotlin_file:
    {
      auto n = as<kotlin_file>(node);
      b("annotation_sets", n->annotation_sets)("package_directive", n->package_directive)
       ("import_directives", n->import_directives)("declarations", n->declarations);
    } break;
  case node_kind::kotlin_script:
    {
      auto n = as<kotlin_script>(node);
      b("annotation_sets", n->annotation_sets)("package_directive", n->package_directive)
       ("import_directives", n->import_directives)("expressions", n->expressions);
    } break;
  case node_kind::package_directive:
    {
      auto n = as<package_directive>(node);
      b("modifiers", n->modifiers)("package_keyword", n->package_keyword)("names", n->names);
    } break;
  case node_kind::import_directives:
    b("elements", as<import_directives>(node)->elements);
    break;
  case node_kind::import_directive:
    {
      auto n = as<import_directive>(node);
      b("import_keyword", n->import_keyword)("names", n->names)("import_alias", n->import_alias);
    } break;
  case node_kind::import_alias:
    b("name", as<import_alias>(node)->name);
    break;

  case node_kind::class_declaration:
    {
      auto n = as<class_declaration>(node);
      b("modifiers", n->modifiers)("declaration_keyword", n->declaration_keyword)("name", n->name)
       ("type_params", n->type_params)("primary_constructor", n->primary_constructor)
       ("class_parents", n->class_parents)("type_constraint_set", n->type_constraint_set)
       ("class_body", n->class_body);
    } break;
  case node_kind::class_parents:
    b("elements", as<class_parents>(node)->elements);
    break;
  case node_kind::call_constructor_parent:
    {
      auto n = as<call_constructor_parent>(node);
      b("type", n->type)("args", n->args)("lambda_arg", n->lambda_arg);
    } break;
  case node_kind::delegated_type_parent:
    {
      auto n = as<delegated_type_parent>(node);
      b("type", n->type)("by_keyword", n->by_keyword)("expression", n->expression);
    } break;
  case node_kind::type_parent:
    b("type", as<type_parent>(node)->type);
    break;
  case node_kind::primary_constructor:
    {
      auto n = as<primary_constructor>(node);
      b("modifiers", n->modifiers)("constructor_keyword", n->constructor_keyword)("params", n->params);
    } break;
  case node_kind::class_body:
    {
      auto n = as<class_body>(node);
      b("enum_entries", n->enum_entries)("declarations", n->declarations);
    } break;
  case node_kind::enum_entry:
    {
      auto n = as<enum_entry>(node);
      b("modifiers", n->modifiers)("name", n->name)("args", n->args)("class_body", n->class_body);
    } break;
  case node_kind::init_declaration:
    {
      auto n = as<init_declaration>(node);
      b("modifiers", n->modifiers)("block", n->block);
    } break;
  case node_kind::function_declaration:
    {
      auto n = as<function_declaration>(node);
      b("modifiers", n->modifiers)("fun_keyword", n->fun_keyword)("type_params", n->type_params)
       ("receiver_type_ref", n->receiver_type_ref)("name", n->name)("params", n->params)
       ("type_ref", n->type_ref)("post_modifiers", n->post_modifiers)("equals", n->equals)("body", n->body);
    } break;
  case node_kind::function_params:
    {
      auto n = as<function_params>(node);
      b("elements", n->elements)("trailing_comma", n->trailing_comma);
    } break;
  case node_kind::function_param:
    {
      auto n = as<function_param>(node);
      b("modifiers", n->modifiers)("val_or_var", n->val_or_var)("name", n->name)("type_ref", n->type_ref)
       ("equals", n->equals)("default_value", n->default_value);
    } break;
  case node_kind::property_declaration:
    {
      auto n = as<property_declaration>(node);
      b("modifiers", n->modifiers)("val_or_var", n->val_or_var)("type_params", n->type_params)
       ("receiver_type_ref", n->receiver_type_ref)("lpar", n->lpar)("variables", n->variables)
       ("trailing_comma", n->trailing_comma)("rpar", n->rpar)("type_constraint_set", n->type_constraint_set)
       ("equals", n->equals)("initializer", n->initializer)("property_delegate", n->property_delegate)
       ("accessors", n->accessors);
    } break;
  case node_kind::property_delegate:
    {
      auto n = as<property_delegate>(node);
      b("by_keyword", n->by_keyword)("expression", n->expression);
    } break;
  case node_kind::variable:
    {
      auto n = as<variable>(node);
      b("modifiers", n->modifiers)("name", n->name)("type_ref", n->type_ref);
    } break;
  case node_kind::getter:
    {
      auto n = as<getter>(node);
      b("modifiers", n->modifiers)("get_keyword", n->get_keyword)("lpar", n->lpar)("rpar", n->rpar)
       ("type_ref", n->type_ref)("post_modifiers", n->post_modifiers)("equals", n->equals)("body", n->body);
    } break;
  case node_kind::setter:
    {
      auto n = as<setter>(node);
      b("modifiers", n->modifiers)("set_keyword", n->set_keyword)("params", n->params)
       ("post_modifiers", n->post_modifiers)("equals", n->equals)("body", n->body);
    } break;
  case node_kind::type_alias_declaration:
    {
      auto n = as<type_alias_declaration>(node);
      b("modifiers", n->modifiers)("name", n->name)("type_params", n->type_params)("type_ref", n->type_ref);
    } break;
  case node_kind::secondary_constructor_declaration:
    {
      auto n = as<secondary_constructor_declaration>(node);
      b("modifiers", n->modifiers)("constructor_keyword", n->constructor_keyword)("params", n->params)
       ("delegation_call", n->delegation_call)("block", n->block);
    } break;
  case node_kind::delegation_call:
    {
      auto n = as<delegation_call>(node);
      b("target", n->target)("args", n->args);
    } break;
  case node_kind::type_params:
    {
      auto n = as<type_params>(node);
      b("elements", n->elements)("trailing_comma", n->trailing_comma);
    } break;
  case node_kind::type_param:
    {
      auto n = as<type_param>(node);
      b("modifiers", n->modifiers)("name", n->name)("type_ref", n->type_ref);
    } break;

  case node_kind::function_type:
    {
      auto n = as<function_type>(node);
      b("context_receivers", n->context_receivers)("receiver", n->receiver)("params", n->params)
       ("return_type_ref", n->return_type_ref);
    } break;
  case node_kind::context_receivers:
    {
      auto n = as<context_receivers>(node);
      b("elements", n->elements)("trailing_comma", n->trailing_comma);
    } break;
  case node_kind::context_receiver:
    b("type_ref", as<context_receiver>(node)->type_ref);
    break;
  case node_kind::function_type_receiver:
    b("type_ref", as<function_type_receiver>(node)->type_ref);
    break;
  case node_kind::function_type_params:
    {
      auto n = as<function_type_params>(node);
      b("elements", n->elements)("trailing_comma", n->trailing_comma);
    } break;
  case node_kind::function_type_param:
    {
      auto n = as<function_type_param>(node);
      b("name", n->name)("type_ref", n->type_ref);
    } break;
  case node_kind::simple_type:
    {
      auto n = as<simple_type>(node);
      b("qualifiers", n->qualifiers)("name", n->name)("type_args", n->type_args);
    } break;
  case node_kind::simple_type_qualifier:
    {
      auto n = as<simple_type_qualifier>(node);
      b("name", n->name)("type_args", n->type_args);
    } break;
  case node_kind::nullable_type:
    {
      auto n = as<nullable_type>(node);
      b("lpar", n->lpar)("modifiers", n->modifiers)("type", n->type)("rpar", n->rpar);
    } break;
  case node_kind::dynamic_type:
    break;
  case node_kind::type_args:
    {
      auto n = as<type_args>(node);
      b("elements", n->elements)("trailing_comma", n->trailing_comma);
    } break;
  case node_kind::type_arg:
    {
      auto n = as<type_arg>(node);
      b("modifiers", n->modifiers)("type_ref", n->type_ref);
    } break;
  case node_kind::type_ref:
    {
      auto n = as<type_ref>(node);
      b("lpar", n->lpar)("modifiers", n->modifiers)("type", n->type)("rpar", n->rpar);
    } break;
  case node_kind::value_args:
    {
      auto n = as<value_args>(node);
      b("elements", n->elements)("trailing_comma", n->trailing_comma);
    } break;
  case node_kind::value_arg:
    {
      auto n = as<value_arg>(node);
      b("name", n->name)("expression", n->expression);
    } break;

  case node_kind::if_expression:
    {
      auto n = as<if_expression>(node);
      b("if_keyword", n->if_keyword)("condition", n->condition)("body", n->body)("else_body", n->else_body);
    } break;
  case node_kind::try_expression:
    {
      auto n = as<try_expression>(node);
      b("block", n->block)("catch_clauses", n->catch_clauses)("finally_block", n->finally_block);
    } break;
  case node_kind::catch_clause:
    {
      auto n = as<catch_clause>(node);
      b("catch_keyword", n->catch_keyword)("params", n->params)("block", n->block);
    } break;
  case node_kind::for_expression:
    {
      auto n = as<for_expression>(node);
      b("for_keyword", n->for_keyword)("loop_param", n->loop_param)("loop_range", n->loop_range)("body", n->body);
    } break;
  case node_kind::while_expression:
    {
      auto n = as<while_expression>(node);
      if(n->do_while)
        b("body", n->body)("while_keyword", n->while_keyword)("condition", n->condition);
      else
        b("while_keyword", n->while_keyword)("condition", n->condition)("body", n->body);
    } break;
  case node_kind::binary_expression:
    {
      auto n = as<binary_expression>(node);
      b("lhs", n->lhs)("op", n->op)("rhs", n->rhs);
    } break;
  case node_kind::binary_infix_expression:
    {
      auto n = as<binary_infix_expression>(node);
      b("lhs", n->lhs)("op", n->op)("rhs", n->rhs);
    } break;
  case node_kind::unary_expression:
    {
      auto n = as<unary_expression>(node);
      if(n->prefix)
        b("op", n->op)("expression", n->expression);
      else
        b("expression", n->expression)("op", n->op);
    } break;
  case node_kind::binary_type_expression:
    {
      auto n = as<binary_type_expression>(node);
      b("lhs", n->lhs)("op", n->op)("rhs", n->rhs);
    } break;
  case node_kind::callable_reference_expression:
    {
      auto n = as<callable_reference_expression>(node);
      b("lhs", n->lhs)("rhs", n->rhs);
    } break;
  case node_kind::class_literal_expression:
    b("lhs", as<class_literal_expression>(node)->lhs);
    break;
  case node_kind::expression_receiver:
    b("expression", as<expression_receiver>(node)->expression);
    break;
  case node_kind::type_receiver:
    b("type", as<type_receiver>(node)->type);
    break;
  case node_kind::parenthesized_expression:
    b("inner_expression", as<parenthesized_expression>(node)->inner_expression);
    break;
  case node_kind::string_literal_expression:
    b("entries", as<string_literal_expression>(node)->entries);
    break;
  case node_kind::literal_string_entry:
  case node_kind::escape_string_entry:
    break;
  case node_kind::template_string_entry:
    b("expression", as<template_string_entry>(node)->expression);
    break;
  case node_kind::constant_literal_expression:
    break;
  case node_kind::lambda_expression:
    {
      auto n = as<lambda_expression>(node);
      b("params", n->params)("arrow", n->arrow)("lambda_body", n->lambda_body);
    } break;
  case node_kind::lambda_params:
    {
      auto n = as<lambda_params>(node);
      b("elements", n->elements)("trailing_comma", n->trailing_comma);
    } break;
  case node_kind::lambda_param:
    {
      auto n = as<lambda_param>(node);
      b("lpar", n->lpar)("variables", n->variables)("trailing_comma", n->trailing_comma)("rpar", n->rpar)
       ("colon", n->colon)("destruct_type_ref", n->destruct_type_ref);
    } break;
  case node_kind::lambda_body:
    b("statements", as<lambda_body>(node)->statements);
    break;
  case node_kind::this_expression:
    break;
  case node_kind::super_expression:
    b("type_arg", as<super_expression>(node)->type_arg);
    break;
  case node_kind::when_expression:
    {
      auto n = as<when_expression>(node);
      b("when_keyword", n->when_keyword)("lpar", n->lpar)("subject", n->subject)("rpar", n->rpar)
       ("branches", n->branches);
    } break;
  case node_kind::when_branch:
    {
      auto n = as<when_branch>(node);
      b("conditions", n->conditions)("trailing_comma", n->trailing_comma)("else_keyword", n->else_keyword)
       ("body", n->body);
    } break;
  case node_kind::when_condition:
    {
      auto n = as<when_condition>(node);
      b("op", n->op)("expression", n->expression)("type_ref", n->type_ref);
    } break;
  case node_kind::object_literal_expression:
    b("declaration", as<object_literal_expression>(node)->declaration);
    break;
  case node_kind::throw_expression:
    b("expression", as<throw_expression>(node)->expression);
    break;
  case node_kind::return_expression:
    b("expression", as<return_expression>(node)->expression);
    break;
  case node_kind::continue_expression:
  case node_kind::break_expression:
    break;
  case node_kind::collection_literal_expression:
    {
      auto n = as<collection_literal_expression>(node);
      b("expressions", n->expressions)("trailing_comma", n->trailing_comma);
    } break;
  case node_kind::name_expression:
    break;
  case node_kind::labeled_expression:
    b("expression", as<labeled_expression>(node)->expression);
    break;
  case node_kind::annotated_expression:
    {
      auto n = as<annotated_expression>(node);
      b("annotation_sets", n->annotation_sets)("expression", n->expression);
    } break;
  case node_kind::call_expression:
    {
      auto n = as<call_expression>(node);
      b("expression", n->expression)("type_args", n->type_args)("args", n->args)("lambda_arg", n->lambda_arg);
    } break;
  case node_kind::lambda_arg:
    {
      auto n = as<lambda_arg>(node);
      b("annotation_sets", n->annotation_sets)("expression", n->expression);
    } break;
  case node_kind::array_access_expression:
    {
      auto n = as<array_access_expression>(node);
      b("expression", n->expression)("indices", n->indices)("trailing_comma", n->trailing_comma);
    } break;
  case node_kind::anonymous_function_expression:
    b("function", as<anonymous_function_expression>(node)->function);
    break;
  case node_kind::property_expression:
    b("declaration", as<property_expression>(node)->declaration);
    break;
  case node_kind::block_expression:
    b("statements", as<block_expression>(node)->statements);
    break;

  case node_kind::modifiers:
    b("elements", as<modifiers>(node)->elements);
    break;
  case node_kind::annotation_set:
    {
      auto n = as<annotation_set>(node);
      b("at", n->at)("target", n->target)("colon", n->colon)("lbracket", n->lbracket)
       ("annotations", n->annotations)("rbracket", n->rbracket);
    } break;
  case node_kind::annotation:
    {
      auto n = as<annotation>(node);
      b("type", n->type)("args", n->args);
    } break;
  case node_kind::type_constraint_set:
    {
      auto n = as<type_constraint_set>(node);
      b("where_keyword", n->where_keyword)("constraints", n->constraints);
    } break;
  case node_kind::type_constraints:
    b("elements", as<type_constraints>(node)->elements);
    break;
  case node_kind::type_constraint:
    {
      auto n = as<type_constraint>(node);
      b("annotation_sets", n->annotation_sets)("name", n->name)("type_ref", n->type_ref);
    } break;
  case node_kind::contract:
    {
      auto n = as<contract>(node);
      b("contract_keyword", n->contract_keyword)("effects", n->effects);
    } break;
  case node_kind::contract_effects:
    {
      auto n = as<contract_effects>(node);
      b("elements", n->elements)("trailing_comma", n->trailing_comma);
    } break;
  case node_kind::contract_effect:
    b("expression", as<contract_effect>(node)->expression);
    break;

  case node_kind::keyword:
    break;

  case node_kind::whitespace:
  case node_kind::comment:
  case node_kind::semicolon:
  case node_kind::trailing_comma:
  case node_kind::blank_lines:
    raise<internal_error>(diagnostic_db::visit::extra_as_child(source_range{}, kind_name(node->kind)));

  default:
    raise<internal_error>(diagnostic_db::visit::unhandled_kind(source_range{}, kind_name(node->kind),
                                                              "child slot table"));
  }
  return b.slots;
}

std::vector<attribute> node_attributes(const node_ptr& node)
{
  switch(node->kind)
  {
  case node_kind::class_body:
    return { { "enum_trailing_comma", to_text(as<class_body>(node)->enum_trailing_comma) } };
  case node_kind::type_arg:
    return { { "asterisk", to_text(as<type_arg>(node)->asterisk) } };
  case node_kind::value_arg:
    return { { "asterisk", to_text(as<value_arg>(node)->asterisk) } };
  case node_kind::while_expression:
    return { { "do_while", to_text(as<while_expression>(node)->do_while) } };
  case node_kind::unary_expression:
    return { { "prefix", to_text(as<unary_expression>(node)->prefix) } };
  case node_kind::type_receiver:
    return { { "question_marks", std::to_string(as<type_receiver>(node)->question_marks) } };
  case node_kind::string_literal_expression:
    return { { "raw", to_text(as<string_literal_expression>(node)->raw) } };
  case node_kind::literal_string_entry:
    return { { "text", as<literal_string_entry>(node)->text } };
  case node_kind::escape_string_entry:
    return { { "text", as<escape_string_entry>(node)->text } };
  case node_kind::template_string_entry:
    return { { "short", to_text(as<template_string_entry>(node)->short_template) } };
  case node_kind::constant_literal_expression:
    {
      auto n = as<constant_literal_expression>(node);
      return { { "text", n->value }, { "form", to_text(n->form) } };
    }
  case node_kind::this_expression:
    return { { "label", as<this_expression>(node)->label } };
  case node_kind::super_expression:
    return { { "label", as<super_expression>(node)->label } };
  case node_kind::return_expression:
    return { { "label", as<return_expression>(node)->label } };
  case node_kind::continue_expression:
    return { { "label", as<continue_expression>(node)->label } };
  case node_kind::break_expression:
    return { { "label", as<break_expression>(node)->label } };
  case node_kind::name_expression:
    return { { "text", as<name_expression>(node)->name } };
  case node_kind::labeled_expression:
    return { { "label", as<labeled_expression>(node)->label } };
  case node_kind::lambda_arg:
    return { { "label", as<lambda_arg>(node)->label } };
  case node_kind::keyword:
    return { { "text", std::string(as<keyword>(node)->text()) } };
  case node_kind::whitespace:
    return { { "text", as<whitespace>(node)->text } };
  case node_kind::comment:
    {
      auto n = as<comment>(node);
      return { { "text", n->text }, { "starts_line", to_text(n->starts_line) },
               { "ends_line", to_text(n->ends_line) } };
    }
  case node_kind::semicolon:
    return { { "text", ";" } };
  case node_kind::trailing_comma:
    return { { "text", "," } };
  case node_kind::blank_lines:
    return { { "count", std::to_string(as<blank_lines>(node)->count) } };
  default:
    return {};
  }
}

}
