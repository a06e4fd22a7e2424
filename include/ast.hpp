#pragma once

#include <ast_fwd.hpp>
#include <keyword.hpp>

#include <string_view>
#include <optional>
#include <string>
#include <memory>
#include <vector>

namespace ktree
{

// Constructors validate their fields and throw invariant_violation.
namespace detail
{
  void expect_present(const node_ptr& child, const char* where);
  void expect_category(const node_ptr& child, node_category cat, const char* where, bool optional = false);
  void expect_categories(const node_list& children, node_category cat, const char* where);
  void expect_keyword(const keyword_ptr& kw, keyword_kind kind, const char* where, bool optional = false);
  void expect_keyword_category(const keyword_ptr& kw, keyword_category cat, const char* where, bool optional = false);
  void expect_trailing_comma(const keyword_ptr& comma, std::size_t elements, const char* where);
  void expect_non_empty(std::size_t size, const char* where);
  void expect(bool cond, const char* node, const char* what);
  [[noreturn]] void wrong_kind(const node_ptr& child, const char* where);

  template<typename T>
  void expect_all_present(const list_of<T>& children, const char* where)
  {
    for(auto& c : children)
      expect_present(c, where);
  }
}

template<typename T>
std::shared_ptr<const T> node_cast(const node_ptr& node, const char* where)
{
  if(node == nullptr)
    return nullptr;
  if(node->kind != T::static_kind)
    detail::wrong_kind(node, where);
  return std::static_pointer_cast<const T>(node);
}

////////////////////////////////////////////////////////////////////////////////
// containers

struct kotlin_file : node_base
{
  static constexpr node_kind static_kind = node_kind::kotlin_file;

  kotlin_file(const list_of<annotation_set>& annotation_sets, package_directive_ptr package_directive,
              import_directives_ptr import_directives, const node_list& declarations);

  list_of<annotation_set> annotation_sets;
  package_directive_ptr package_directive;
  import_directives_ptr import_directives;
  node_list declarations;
};

struct kotlin_script : node_base
{
  static constexpr node_kind static_kind = node_kind::kotlin_script;

  kotlin_script(const list_of<annotation_set>& annotation_sets, package_directive_ptr package_directive,
                import_directives_ptr import_directives, const node_list& expressions);

  list_of<annotation_set> annotation_sets;
  package_directive_ptr package_directive;
  import_directives_ptr import_directives;
  node_list expressions;
};

struct package_directive : node_base
{
  static constexpr node_kind static_kind = node_kind::package_directive;

  package_directive(modifiers_ptr modifiers, keyword_ptr package_keyword, const list_of<name_expression>& names);

  modifiers_ptr modifiers;
  keyword_ptr package_keyword;
  list_of<name_expression> names;
};

struct import_directives : node_base
{
  static constexpr node_kind static_kind = node_kind::import_directives;

  import_directives(const list_of<import_directive>& elements);

  list_of<import_directive> elements;
};

struct import_directive : node_base
{
  static constexpr node_kind static_kind = node_kind::import_directive;

  import_directive(keyword_ptr import_keyword, const list_of<name_expression>& names, import_alias_ptr import_alias);

  keyword_ptr import_keyword;
  list_of<name_expression> names;
  import_alias_ptr import_alias;
};

struct import_alias : node_base
{
  static constexpr node_kind static_kind = node_kind::import_alias;

  import_alias(name_expression_ptr name);

  name_expression_ptr name;
};

////////////////////////////////////////////////////////////////////////////////
// declarations

struct class_declaration : node_base
{
  static constexpr node_kind static_kind = node_kind::class_declaration;

  class_declaration(modifiers_ptr modifiers, keyword_ptr declaration_keyword, name_expression_ptr name,
                    type_params_ptr type_params, primary_constructor_ptr primary_constructor,
                    class_parents_ptr class_parents, type_constraint_set_ptr type_constraint_set,
                    class_body_ptr class_body);

  modifiers_ptr modifiers;
  keyword_ptr declaration_keyword;
  name_expression_ptr name;
  type_params_ptr type_params;
  primary_constructor_ptr primary_constructor;
  class_parents_ptr class_parents;
  type_constraint_set_ptr type_constraint_set;
  class_body_ptr class_body;

  bool is_class() const;
  bool is_object() const;
  bool is_interface() const;
  bool is_companion() const;
  bool is_enum() const;
};

struct class_parents : node_base
{
  static constexpr node_kind static_kind = node_kind::class_parents;

  class_parents(const node_list& elements);

  node_list elements;
};

struct call_constructor_parent : node_base
{
  static constexpr node_kind static_kind = node_kind::call_constructor_parent;

  call_constructor_parent(simple_type_ptr type, value_args_ptr args, lambda_arg_ptr lambda_arg);

  simple_type_ptr type;
  value_args_ptr args;
  lambda_arg_ptr lambda_arg;
};

struct delegated_type_parent : node_base
{
  static constexpr node_kind static_kind = node_kind::delegated_type_parent;

  delegated_type_parent(node_ptr type, keyword_ptr by_keyword, node_ptr expression);

  node_ptr type;
  keyword_ptr by_keyword;
  node_ptr expression;
};

struct type_parent : node_base
{
  static constexpr node_kind static_kind = node_kind::type_parent;

  type_parent(node_ptr type);

  node_ptr type;
};

struct primary_constructor : node_base
{
  static constexpr node_kind static_kind = node_kind::primary_constructor;

  primary_constructor(modifiers_ptr modifiers, keyword_ptr constructor_keyword, function_params_ptr params);

  modifiers_ptr modifiers;
  keyword_ptr constructor_keyword;
  function_params_ptr params;
};

struct class_body : node_base
{
  static constexpr node_kind static_kind = node_kind::class_body;

  class_body(const list_of<enum_entry>& enum_entries, bool enum_trailing_comma, const node_list& declarations);

  list_of<enum_entry> enum_entries;
  bool enum_trailing_comma;
  node_list declarations;
};

struct enum_entry : node_base
{
  static constexpr node_kind static_kind = node_kind::enum_entry;

  enum_entry(modifiers_ptr modifiers, name_expression_ptr name, value_args_ptr args, class_body_ptr class_body);

  modifiers_ptr modifiers;
  name_expression_ptr name;
  value_args_ptr args;
  class_body_ptr class_body;
};

struct init_declaration : node_base
{
  static constexpr node_kind static_kind = node_kind::init_declaration;

  init_declaration(modifiers_ptr modifiers, block_expression_ptr block);

  modifiers_ptr modifiers;
  block_expression_ptr block;
};

struct function_declaration : node_base
{
  static constexpr node_kind static_kind = node_kind::function_declaration;

  function_declaration(modifiers_ptr modifiers, keyword_ptr fun_keyword, type_params_ptr type_params,
                       type_ref_ptr receiver_type_ref, name_expression_ptr name, function_params_ptr params,
                       type_ref_ptr type_ref, const node_list& post_modifiers, keyword_ptr equals, node_ptr body);

  modifiers_ptr modifiers;
  keyword_ptr fun_keyword;
  type_params_ptr type_params;
  type_ref_ptr receiver_type_ref;
  name_expression_ptr name;
  function_params_ptr params;
  type_ref_ptr type_ref;
  node_list post_modifiers;
  keyword_ptr equals;
  node_ptr body;
};

struct function_params : node_base
{
  static constexpr node_kind static_kind = node_kind::function_params;

  function_params(const list_of<function_param>& elements, keyword_ptr trailing_comma);

  list_of<function_param> elements;
  keyword_ptr trailing_comma;
};

struct function_param : node_base
{
  static constexpr node_kind static_kind = node_kind::function_param;

  function_param(modifiers_ptr modifiers, keyword_ptr val_or_var, name_expression_ptr name,
                 type_ref_ptr type_ref, keyword_ptr equals, node_ptr default_value);

  modifiers_ptr modifiers;
  keyword_ptr val_or_var;
  name_expression_ptr name;
  type_ref_ptr type_ref;
  keyword_ptr equals;
  node_ptr default_value;
};

struct property_declaration : node_base
{
  static constexpr node_kind static_kind = node_kind::property_declaration;

  property_declaration(modifiers_ptr modifiers, keyword_ptr val_or_var, type_params_ptr type_params,
                       type_ref_ptr receiver_type_ref, keyword_ptr lpar, const list_of<variable>& variables,
                       keyword_ptr trailing_comma, keyword_ptr rpar, type_constraint_set_ptr type_constraint_set,
                       keyword_ptr equals, node_ptr initializer, property_delegate_ptr property_delegate,
                       const node_list& accessors);

  modifiers_ptr modifiers;
  keyword_ptr val_or_var;
  type_params_ptr type_params;
  type_ref_ptr receiver_type_ref;
  keyword_ptr lpar;
  list_of<variable> variables;
  keyword_ptr trailing_comma;
  keyword_ptr rpar;
  type_constraint_set_ptr type_constraint_set;
  keyword_ptr equals;
  node_ptr initializer;
  property_delegate_ptr property_delegate;
  node_list accessors;
};

struct property_delegate : node_base
{
  static constexpr node_kind static_kind = node_kind::property_delegate;

  property_delegate(keyword_ptr by_keyword, node_ptr expression);

  keyword_ptr by_keyword;
  node_ptr expression;
};

struct variable : node_base
{
  static constexpr node_kind static_kind = node_kind::variable;

  variable(modifiers_ptr modifiers, name_expression_ptr name, type_ref_ptr type_ref);

  modifiers_ptr modifiers;
  name_expression_ptr name;
  type_ref_ptr type_ref;
};

struct getter : node_base
{
  static constexpr node_kind static_kind = node_kind::getter;

  getter(modifiers_ptr modifiers, keyword_ptr get_keyword, keyword_ptr lpar, keyword_ptr rpar,
         type_ref_ptr type_ref, const node_list& post_modifiers, keyword_ptr equals, node_ptr body);

  modifiers_ptr modifiers;
  keyword_ptr get_keyword;
  keyword_ptr lpar;
  keyword_ptr rpar;
  type_ref_ptr type_ref;
  node_list post_modifiers;
  keyword_ptr equals;
  node_ptr body;
};

struct setter : node_base
{
  static constexpr node_kind static_kind = node_kind::setter;

  setter(modifiers_ptr modifiers, keyword_ptr set_keyword, function_params_ptr params,
         const node_list& post_modifiers, keyword_ptr equals, node_ptr body);

  modifiers_ptr modifiers;
  keyword_ptr set_keyword;
  function_params_ptr params;
  node_list post_modifiers;
  keyword_ptr equals;
  node_ptr body;
};

struct type_alias_declaration : node_base
{
  static constexpr node_kind static_kind = node_kind::type_alias_declaration;

  type_alias_declaration(modifiers_ptr modifiers, name_expression_ptr name, type_params_ptr type_params,
                         type_ref_ptr type_ref);

  modifiers_ptr modifiers;
  name_expression_ptr name;
  type_params_ptr type_params;
  type_ref_ptr type_ref;
};

struct secondary_constructor_declaration : node_base
{
  static constexpr node_kind static_kind = node_kind::secondary_constructor_declaration;

  secondary_constructor_declaration(modifiers_ptr modifiers, keyword_ptr constructor_keyword,
                                    function_params_ptr params, delegation_call_ptr delegation_call,
                                    block_expression_ptr block);

  modifiers_ptr modifiers;
  keyword_ptr constructor_keyword;
  function_params_ptr params;
  delegation_call_ptr delegation_call;
  block_expression_ptr block;
};

struct delegation_call : node_base
{
  static constexpr node_kind static_kind = node_kind::delegation_call;

  delegation_call(keyword_ptr target, value_args_ptr args);

  keyword_ptr target;
  value_args_ptr args;
};

struct type_params : node_base
{
  static constexpr node_kind static_kind = node_kind::type_params;

  type_params(const list_of<type_param>& elements, keyword_ptr trailing_comma);

  list_of<type_param> elements;
  keyword_ptr trailing_comma;
};

struct type_param : node_base
{
  static constexpr node_kind static_kind = node_kind::type_param;

  type_param(modifiers_ptr modifiers, name_expression_ptr name, type_ref_ptr type_ref);

  modifiers_ptr modifiers;
  name_expression_ptr name;
  type_ref_ptr type_ref;
};

////////////////////////////////////////////////////////////////////////////////
// types

struct function_type : node_base
{
  static constexpr node_kind static_kind = node_kind::function_type;

  function_type(context_receivers_ptr context_receivers, function_type_receiver_ptr receiver,
                function_type_params_ptr params, type_ref_ptr return_type_ref);

  context_receivers_ptr context_receivers;
  function_type_receiver_ptr receiver;
  function_type_params_ptr params;
  type_ref_ptr return_type_ref;
};

struct context_receivers : node_base
{
  static constexpr node_kind static_kind = node_kind::context_receivers;

  context_receivers(const list_of<context_receiver>& elements, keyword_ptr trailing_comma);

  list_of<context_receiver> elements;
  keyword_ptr trailing_comma;
};

struct context_receiver : node_base
{
  static constexpr node_kind static_kind = node_kind::context_receiver;

  context_receiver(type_ref_ptr type_ref);

  type_ref_ptr type_ref;
};

struct function_type_receiver : node_base
{
  static constexpr node_kind static_kind = node_kind::function_type_receiver;

  function_type_receiver(type_ref_ptr type_ref);

  type_ref_ptr type_ref;
};

struct function_type_params : node_base
{
  static constexpr node_kind static_kind = node_kind::function_type_params;

  function_type_params(const list_of<function_type_param>& elements, keyword_ptr trailing_comma);

  list_of<function_type_param> elements;
  keyword_ptr trailing_comma;
};

struct function_type_param : node_base
{
  static constexpr node_kind static_kind = node_kind::function_type_param;

  function_type_param(name_expression_ptr name, type_ref_ptr type_ref);

  name_expression_ptr name;
  type_ref_ptr type_ref;
};

struct simple_type : node_base
{
  static constexpr node_kind static_kind = node_kind::simple_type;

  simple_type(const list_of<simple_type_qualifier>& qualifiers, name_expression_ptr name, type_args_ptr type_args);

  list_of<simple_type_qualifier> qualifiers;
  name_expression_ptr name;
  type_args_ptr type_args;
};

struct simple_type_qualifier : node_base
{
  static constexpr node_kind static_kind = node_kind::simple_type_qualifier;

  simple_type_qualifier(name_expression_ptr name, type_args_ptr type_args);

  name_expression_ptr name;
  type_args_ptr type_args;
};

struct nullable_type : node_base
{
  static constexpr node_kind static_kind = node_kind::nullable_type;

  nullable_type(keyword_ptr lpar, modifiers_ptr modifiers, node_ptr type, keyword_ptr rpar);

  keyword_ptr lpar;
  modifiers_ptr modifiers;
  node_ptr type;
  keyword_ptr rpar;
};

struct dynamic_type : node_base
{
  static constexpr node_kind static_kind = node_kind::dynamic_type;

  dynamic_type() : node_base(static_kind) {}
};

struct type_args : node_base
{
  static constexpr node_kind static_kind = node_kind::type_args;

  type_args(const list_of<type_arg>& elements, keyword_ptr trailing_comma);

  list_of<type_arg> elements;
  keyword_ptr trailing_comma;
};

struct type_arg : node_base
{
  static constexpr node_kind static_kind = node_kind::type_arg;

  type_arg(modifiers_ptr modifiers, type_ref_ptr type_ref, bool asterisk);

  modifiers_ptr modifiers;
  type_ref_ptr type_ref;
  bool asterisk;
};

struct type_ref : node_base
{
  static constexpr node_kind static_kind = node_kind::type_ref;

  type_ref(keyword_ptr lpar, modifiers_ptr modifiers, node_ptr type, keyword_ptr rpar);

  keyword_ptr lpar;
  modifiers_ptr modifiers;
  node_ptr type;
  keyword_ptr rpar;
};

struct value_args : node_base
{
  static constexpr node_kind static_kind = node_kind::value_args;

  value_args(const list_of<value_arg>& elements, keyword_ptr trailing_comma);

  list_of<value_arg> elements;
  keyword_ptr trailing_comma;
};

struct value_arg : node_base
{
  static constexpr node_kind static_kind = node_kind::value_arg;

  value_arg(name_expression_ptr name, bool asterisk, node_ptr expression);

  name_expression_ptr name;
  bool asterisk;
  node_ptr expression;
};

////////////////////////////////////////////////////////////////////////////////
// expressions

struct if_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::if_expression;

  if_expression(keyword_ptr if_keyword, node_ptr condition, node_ptr body, node_ptr else_body);

  keyword_ptr if_keyword;
  node_ptr condition;
  node_ptr body;
  node_ptr else_body;
};

struct try_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::try_expression;

  try_expression(block_expression_ptr block, const list_of<catch_clause>& catch_clauses,
                 block_expression_ptr finally_block);

  block_expression_ptr block;
  list_of<catch_clause> catch_clauses;
  block_expression_ptr finally_block;
};

struct catch_clause : node_base
{
  static constexpr node_kind static_kind = node_kind::catch_clause;

  catch_clause(keyword_ptr catch_keyword, function_params_ptr params, block_expression_ptr block);

  keyword_ptr catch_keyword;
  function_params_ptr params;
  block_expression_ptr block;
};

struct for_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::for_expression;

  for_expression(keyword_ptr for_keyword, lambda_param_ptr loop_param, node_ptr loop_range, node_ptr body);

  keyword_ptr for_keyword;
  lambda_param_ptr loop_param;
  node_ptr loop_range;
  node_ptr body;
};

struct while_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::while_expression;

  while_expression(keyword_ptr while_keyword, node_ptr condition, node_ptr body, bool do_while);

  keyword_ptr while_keyword;
  node_ptr condition;
  node_ptr body;
  bool do_while;
};

struct binary_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::binary_expression;

  binary_expression(node_ptr lhs, keyword_ptr op, node_ptr rhs);

  node_ptr lhs;
  keyword_ptr op;
  node_ptr rhs;
};

struct binary_infix_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::binary_infix_expression;

  binary_infix_expression(node_ptr lhs, name_expression_ptr op, node_ptr rhs);

  node_ptr lhs;
  name_expression_ptr op;
  node_ptr rhs;
};

struct unary_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::unary_expression;

  unary_expression(node_ptr expression, keyword_ptr op, bool prefix);

  node_ptr expression;
  keyword_ptr op;
  bool prefix;
};

struct binary_type_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::binary_type_expression;

  binary_type_expression(node_ptr lhs, keyword_ptr op, type_ref_ptr rhs);

  node_ptr lhs;
  keyword_ptr op;
  type_ref_ptr rhs;
};

struct callable_reference_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::callable_reference_expression;

  callable_reference_expression(node_ptr lhs, name_expression_ptr rhs);

  node_ptr lhs;
  name_expression_ptr rhs;

  // The receiver read as a type, or null when it is not a type.
  node_ptr lhs_as_type() const;
};

struct class_literal_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::class_literal_expression;

  class_literal_expression(node_ptr lhs);

  node_ptr lhs;

  node_ptr lhs_as_type() const;
};

struct expression_receiver : node_base
{
  static constexpr node_kind static_kind = node_kind::expression_receiver;

  expression_receiver(node_ptr expression);

  node_ptr expression;
};

struct type_receiver : node_base
{
  static constexpr node_kind static_kind = node_kind::type_receiver;

  type_receiver(simple_type_ptr type, std::size_t question_marks);

  simple_type_ptr type;
  std::size_t question_marks;
};

struct parenthesized_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::parenthesized_expression;

  parenthesized_expression(node_ptr inner_expression);

  node_ptr inner_expression;
};

struct string_literal_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::string_literal_expression;

  string_literal_expression(const node_list& entries, bool raw);

  node_list entries;
  bool raw;
};

struct literal_string_entry : node_base
{
  static constexpr node_kind static_kind = node_kind::literal_string_entry;

  literal_string_entry(std::string text);

  std::string text;
};

struct escape_string_entry : node_base
{
  static constexpr node_kind static_kind = node_kind::escape_string_entry;

  escape_string_entry(std::string text);

  std::string text;
};

struct template_string_entry : node_base
{
  static constexpr node_kind static_kind = node_kind::template_string_entry;

  template_string_entry(node_ptr expression, bool short_template);

  node_ptr expression;
  bool short_template;
};

enum class constant_form : std::uint_fast8_t
{
  boolean,
  character,
  integer,
  real,
  null,
};

struct constant_literal_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::constant_literal_expression;

  constant_literal_expression(std::string value, constant_form form);

  std::string value;
  constant_form form;
};

struct lambda_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::lambda_expression;

  lambda_expression(lambda_params_ptr params, keyword_ptr arrow, lambda_body_ptr lambda_body);

  lambda_params_ptr params;
  keyword_ptr arrow;
  lambda_body_ptr lambda_body;
};

struct lambda_params : node_base
{
  static constexpr node_kind static_kind = node_kind::lambda_params;

  lambda_params(const list_of<lambda_param>& elements, keyword_ptr trailing_comma);

  list_of<lambda_param> elements;
  keyword_ptr trailing_comma;
};

struct lambda_param : node_base
{
  static constexpr node_kind static_kind = node_kind::lambda_param;

  lambda_param(keyword_ptr lpar, const list_of<variable>& variables, keyword_ptr trailing_comma,
               keyword_ptr rpar, keyword_ptr colon, type_ref_ptr destruct_type_ref);

  keyword_ptr lpar;
  list_of<variable> variables;
  keyword_ptr trailing_comma;
  keyword_ptr rpar;
  keyword_ptr colon;
  type_ref_ptr destruct_type_ref;
};

struct lambda_body : node_base
{
  static constexpr node_kind static_kind = node_kind::lambda_body;

  lambda_body(const node_list& statements);

  node_list statements;
};

struct this_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::this_expression;

  this_expression(std::string label);

  std::string label;
};

struct super_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::super_expression;

  super_expression(type_arg_ptr type_arg, std::string label);

  type_arg_ptr type_arg;
  std::string label;
};

struct when_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::when_expression;

  when_expression(keyword_ptr when_keyword, keyword_ptr lpar, node_ptr subject, keyword_ptr rpar,
                  const list_of<when_branch>& branches);

  keyword_ptr when_keyword;
  keyword_ptr lpar;
  node_ptr subject;
  keyword_ptr rpar;
  list_of<when_branch> branches;
};

struct when_branch : node_base
{
  static constexpr node_kind static_kind = node_kind::when_branch;

  when_branch(const list_of<when_condition>& conditions, keyword_ptr trailing_comma,
              keyword_ptr else_keyword, node_ptr body);

  list_of<when_condition> conditions;
  keyword_ptr trailing_comma;
  keyword_ptr else_keyword;
  node_ptr body;
};

struct when_condition : node_base
{
  static constexpr node_kind static_kind = node_kind::when_condition;

  when_condition(keyword_ptr op, node_ptr expression, type_ref_ptr type_ref);

  keyword_ptr op;
  node_ptr expression;
  type_ref_ptr type_ref;
};

struct object_literal_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::object_literal_expression;

  object_literal_expression(class_declaration_ptr declaration);

  class_declaration_ptr declaration;
};

struct throw_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::throw_expression;

  throw_expression(node_ptr expression);

  node_ptr expression;
};

struct return_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::return_expression;

  return_expression(std::string label, node_ptr expression);

  std::string label;
  node_ptr expression;
};

struct continue_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::continue_expression;

  continue_expression(std::string label);

  std::string label;
};

struct break_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::break_expression;

  break_expression(std::string label);

  std::string label;
};

struct collection_literal_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::collection_literal_expression;

  collection_literal_expression(const node_list& expressions, keyword_ptr trailing_comma);

  node_list expressions;
  keyword_ptr trailing_comma;
};

struct name_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::name_expression;

  name_expression(std::string name);

  std::string name;
};

struct labeled_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::labeled_expression;

  labeled_expression(std::string label, node_ptr expression);

  std::string label;
  node_ptr expression;
};

struct annotated_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::annotated_expression;

  annotated_expression(const list_of<annotation_set>& annotation_sets, node_ptr expression);

  list_of<annotation_set> annotation_sets;
  node_ptr expression;
};

struct call_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::call_expression;

  call_expression(node_ptr expression, type_args_ptr type_args, value_args_ptr args, lambda_arg_ptr lambda_arg);

  node_ptr expression;
  type_args_ptr type_args;
  value_args_ptr args;
  lambda_arg_ptr lambda_arg;

  // The trailing lambda, or null.
  lambda_expression_ptr lambda() const;
};

struct lambda_arg : node_base
{
  static constexpr node_kind static_kind = node_kind::lambda_arg;

  lambda_arg(const list_of<annotation_set>& annotation_sets, std::string label, lambda_expression_ptr expression);

  list_of<annotation_set> annotation_sets;
  std::string label;
  lambda_expression_ptr expression;
};

struct array_access_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::array_access_expression;

  array_access_expression(node_ptr expression, const node_list& indices, keyword_ptr trailing_comma);

  node_ptr expression;
  node_list indices;
  keyword_ptr trailing_comma;
};

struct anonymous_function_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::anonymous_function_expression;

  anonymous_function_expression(function_declaration_ptr function);

  function_declaration_ptr function;
};

struct property_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::property_expression;

  property_expression(property_declaration_ptr declaration);

  property_declaration_ptr declaration;
};

struct block_expression : node_base
{
  static constexpr node_kind static_kind = node_kind::block_expression;

  block_expression(const node_list& statements);

  node_list statements;
};

////////////////////////////////////////////////////////////////////////////////
// modifiers

struct modifiers : node_base
{
  static constexpr node_kind static_kind = node_kind::modifiers;

  modifiers(const node_list& elements);

  node_list elements;

  bool has(keyword_kind kind) const;
};

struct annotation_set : node_base
{
  static constexpr node_kind static_kind = node_kind::annotation_set;

  annotation_set(keyword_ptr at, keyword_ptr target, keyword_ptr colon, keyword_ptr lbracket,
                 const list_of<annotation>& annotations, keyword_ptr rbracket);

  keyword_ptr at;
  keyword_ptr target;
  keyword_ptr colon;
  keyword_ptr lbracket;
  list_of<annotation> annotations;
  keyword_ptr rbracket;
};

struct annotation : node_base
{
  static constexpr node_kind static_kind = node_kind::annotation;

  annotation(simple_type_ptr type, value_args_ptr args);

  simple_type_ptr type;
  value_args_ptr args;
};

struct type_constraint_set : node_base
{
  static constexpr node_kind static_kind = node_kind::type_constraint_set;

  type_constraint_set(keyword_ptr where_keyword, type_constraints_ptr constraints);

  keyword_ptr where_keyword;
  type_constraints_ptr constraints;
};

struct type_constraints : node_base
{
  static constexpr node_kind static_kind = node_kind::type_constraints;

  type_constraints(const list_of<type_constraint>& elements);

  list_of<type_constraint> elements;
};

struct type_constraint : node_base
{
  static constexpr node_kind static_kind = node_kind::type_constraint;

  type_constraint(const list_of<annotation_set>& annotation_sets, name_expression_ptr name, type_ref_ptr type_ref);

  list_of<annotation_set> annotation_sets;
  name_expression_ptr name;
  type_ref_ptr type_ref;
};

struct contract : node_base
{
  static constexpr node_kind static_kind = node_kind::contract;

  contract(keyword_ptr contract_keyword, contract_effects_ptr effects);

  keyword_ptr contract_keyword;
  contract_effects_ptr effects;
};

struct contract_effects : node_base
{
  static constexpr node_kind static_kind = node_kind::contract_effects;

  contract_effects(const list_of<contract_effect>& elements, keyword_ptr trailing_comma);

  list_of<contract_effect> elements;
  keyword_ptr trailing_comma;
};

struct contract_effect : node_base
{
  static constexpr node_kind static_kind = node_kind::contract_effect;

  contract_effect(node_ptr expression);

  node_ptr expression;
};

////////////////////////////////////////////////////////////////////////////////
// keywords

struct keyword : node_base
{
  static constexpr node_kind static_kind = node_kind::keyword;

  keyword(keyword_kind which) : node_base(static_kind), which(which) {}

  keyword_kind which;

  std::string_view text() const { return keyword_text(which); }
};

inline keyword_ptr mk_keyword(keyword_kind which) { return mk<keyword>(which); }

////////////////////////////////////////////////////////////////////////////////
// extras

struct whitespace : node_base
{
  static constexpr node_kind static_kind = node_kind::whitespace;

  whitespace(std::string text);

  std::string text;
};

struct comment : node_base
{
  static constexpr node_kind static_kind = node_kind::comment;

  comment(std::string text, bool starts_line, bool ends_line);

  std::string text;
  bool starts_line;
  bool ends_line;
};

struct semicolon : node_base
{
  static constexpr node_kind static_kind = node_kind::semicolon;

  semicolon() : node_base(static_kind) {}
};

struct trailing_comma : node_base
{
  static constexpr node_kind static_kind = node_kind::trailing_comma;

  trailing_comma() : node_base(static_kind) {}
};

struct blank_lines : node_base
{
  static constexpr node_kind static_kind = node_kind::blank_lines;

  blank_lines(std::size_t count);

  std::size_t count;
};

// The literal text an extra stands for.
std::string extra_text(const node_ptr& extra);

}
