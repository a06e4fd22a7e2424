#pragma once

#include <cstdint>
#include <atomic>
#include <memory>
#include <vector>

namespace ktree
{

enum class node_kind : std::uint_fast8_t
{
  // containers
  kotlin_file,
  kotlin_script,
  package_directive,
  import_directives,
  import_directive,
  import_alias,

  // declarations and their parts
  class_declaration,
  class_parents,
  call_constructor_parent,
  delegated_type_parent,
  type_parent,
  primary_constructor,
  class_body,
  enum_entry,
  init_declaration,
  function_declaration,
  function_params,
  function_param,
  property_declaration,
  property_delegate,
  variable,
  getter,
  setter,
  type_alias_declaration,
  secondary_constructor_declaration,
  delegation_call,
  type_params,
  type_param,

  // types
  function_type,
  context_receivers,
  context_receiver,
  function_type_receiver,
  function_type_params,
  function_type_param,
  simple_type,
  simple_type_qualifier,
  nullable_type,
  dynamic_type,
  type_args,
  type_arg,
  type_ref,

  value_args,
  value_arg,

  // expressions and their parts
  if_expression,
  try_expression,
  catch_clause,
  for_expression,
  while_expression,
  binary_expression,
  binary_infix_expression,
  unary_expression,
  binary_type_expression,
  callable_reference_expression,
  class_literal_expression,
  expression_receiver,
  type_receiver,
  parenthesized_expression,
  string_literal_expression,
  literal_string_entry,
  escape_string_entry,
  template_string_entry,
  constant_literal_expression,
  lambda_expression,
  lambda_params,
  lambda_param,
  lambda_body,
  this_expression,
  super_expression,
  when_expression,
  when_branch,
  when_condition,
  object_literal_expression,
  throw_expression,
  return_expression,
  continue_expression,
  break_expression,
  collection_literal_expression,
  name_expression,
  labeled_expression,
  annotated_expression,
  call_expression,
  lambda_arg,
  array_access_expression,
  anonymous_function_expression,
  property_expression,
  block_expression,

  // modifiers and post modifiers
  modifiers,
  annotation_set,
  annotation,
  type_constraint_set,
  type_constraints,
  type_constraint,
  contract,
  contract_effects,
  contract_effect,

  keyword,

  // extras
  whitespace,
  comment,
  semicolon,
  trailing_comma,
  blank_lines,
};
constexpr std::size_t node_kind_count = static_cast<std::size_t>(node_kind::blank_lines) + 1;

enum class node_category : std::uint_fast8_t
{
  expression,
  declaration,
  statement,
  type,
  modifier,
  post_modifier,
  class_parent,
  accessor,
  string_entry,
  receiver,
  extra,
};

struct node_base;
struct kotlin_file;                       using kotlin_file_ptr = std::shared_ptr<const kotlin_file>;
struct kotlin_script;                     using kotlin_script_ptr = std::shared_ptr<const kotlin_script>;
struct package_directive;                 using package_directive_ptr = std::shared_ptr<const package_directive>;
struct import_directives;                 using import_directives_ptr = std::shared_ptr<const import_directives>;
struct import_directive;                  using import_directive_ptr = std::shared_ptr<const import_directive>;
struct import_alias;                      using import_alias_ptr = std::shared_ptr<const import_alias>;
struct class_declaration;                 using class_declaration_ptr = std::shared_ptr<const class_declaration>;
struct class_parents;                     using class_parents_ptr = std::shared_ptr<const class_parents>;
struct call_constructor_parent;           using call_constructor_parent_ptr = std::shared_ptr<const call_constructor_parent>;
struct delegated_type_parent;             using delegated_type_parent_ptr = std::shared_ptr<const delegated_type_parent>;
struct type_parent;                       using type_parent_ptr = std::shared_ptr<const type_parent>;
struct primary_constructor;               using primary_constructor_ptr = std::shared_ptr<const primary_constructor>;
struct class_body;                        using class_body_ptr = std::shared_ptr<const class_body>;
struct enum_entry;                        using enum_entry_ptr = std::shared_ptr<const enum_entry>;
struct init_declaration;                  using init_declaration_ptr = std::shared_ptr<const init_declaration>;
struct function_declaration;              using function_declaration_ptr = std::shared_ptr<const function_declaration>;
struct function_params;                   using function_params_ptr = std::shared_ptr<const function_params>;
struct function_param;                    using function_param_ptr = std::shared_ptr<const function_param>;
struct property_declaration;              using property_declaration_ptr = std::shared_ptr<const property_declaration>;
struct property_delegate;                 using property_delegate_ptr = std::shared_ptr<const property_delegate>;
struct variable;                          using variable_ptr = std::shared_ptr<const variable>;
struct getter;                            using getter_ptr = std::shared_ptr<const getter>;
struct setter;                            using setter_ptr = std::shared_ptr<const setter>;
struct type_alias_declaration;            using type_alias_declaration_ptr = std::shared_ptr<const type_alias_declaration>;
struct secondary_constructor_declaration; using secondary_constructor_declaration_ptr = std::shared_ptr<const secondary_constructor_declaration>;
struct delegation_call;                   using delegation_call_ptr = std::shared_ptr<const delegation_call>;
struct type_params;                       using type_params_ptr = std::shared_ptr<const type_params>;
struct type_param;                        using type_param_ptr = std::shared_ptr<const type_param>;
struct function_type;                     using function_type_ptr = std::shared_ptr<const function_type>;
struct context_receivers;                 using context_receivers_ptr = std::shared_ptr<const context_receivers>;
struct context_receiver;                  using context_receiver_ptr = std::shared_ptr<const context_receiver>;
struct function_type_receiver;            using function_type_receiver_ptr = std::shared_ptr<const function_type_receiver>;
struct function_type_params;              using function_type_params_ptr = std::shared_ptr<const function_type_params>;
struct function_type_param;               using function_type_param_ptr = std::shared_ptr<const function_type_param>;
struct simple_type;                       using simple_type_ptr = std::shared_ptr<const simple_type>;
struct simple_type_qualifier;             using simple_type_qualifier_ptr = std::shared_ptr<const simple_type_qualifier>;
struct nullable_type;                     using nullable_type_ptr = std::shared_ptr<const nullable_type>;
struct dynamic_type;                      using dynamic_type_ptr = std::shared_ptr<const dynamic_type>;
struct type_args;                         using type_args_ptr = std::shared_ptr<const type_args>;
struct type_arg;                          using type_arg_ptr = std::shared_ptr<const type_arg>;
struct type_ref;                          using type_ref_ptr = std::shared_ptr<const type_ref>;
struct value_args;                        using value_args_ptr = std::shared_ptr<const value_args>;
struct value_arg;                         using value_arg_ptr = std::shared_ptr<const value_arg>;
struct if_expression;                     using if_expression_ptr = std::shared_ptr<const if_expression>;
struct try_expression;                    using try_expression_ptr = std::shared_ptr<const try_expression>;
struct catch_clause;                      using catch_clause_ptr = std::shared_ptr<const catch_clause>;
struct for_expression;                    using for_expression_ptr = std::shared_ptr<const for_expression>;
struct while_expression;                  using while_expression_ptr = std::shared_ptr<const while_expression>;
struct binary_expression;                 using binary_expression_ptr = std::shared_ptr<const binary_expression>;
struct binary_infix_expression;           using binary_infix_expression_ptr = std::shared_ptr<const binary_infix_expression>;
struct unary_expression;                  using unary_expression_ptr = std::shared_ptr<const unary_expression>;
struct binary_type_expression;            using binary_type_expression_ptr = std::shared_ptr<const binary_type_expression>;
struct callable_reference_expression;     using callable_reference_expression_ptr = std::shared_ptr<const callable_reference_expression>;
struct class_literal_expression;          using class_literal_expression_ptr = std::shared_ptr<const class_literal_expression>;
struct expression_receiver;               using expression_receiver_ptr = std::shared_ptr<const expression_receiver>;
struct type_receiver;                     using type_receiver_ptr = std::shared_ptr<const type_receiver>;
struct parenthesized_expression;          using parenthesized_expression_ptr = std::shared_ptr<const parenthesized_expression>;
struct string_literal_expression;         using string_literal_expression_ptr = std::shared_ptr<const string_literal_expression>;
struct literal_string_entry;              using literal_string_entry_ptr = std::shared_ptr<const literal_string_entry>;
struct escape_string_entry;               using escape_string_entry_ptr = std::shared_ptr<const escape_string_entry>;
struct template_string_entry;             using template_string_entry_ptr = std::shared_ptr<const template_string_entry>;
struct constant_literal_expression;       using constant_literal_expression_ptr = std::shared_ptr<const constant_literal_expression>;
struct lambda_expression;                 using lambda_expression_ptr = std::shared_ptr<const lambda_expression>;
struct lambda_params;                     using lambda_params_ptr = std::shared_ptr<const lambda_params>;
struct lambda_param;                      using lambda_param_ptr = std::shared_ptr<const lambda_param>;
struct lambda_body;                       using lambda_body_ptr = std::shared_ptr<const lambda_body>;
struct this_expression;                   using this_expression_ptr = std::shared_ptr<const this_expression>;
struct super_expression;                  using super_expression_ptr = std::shared_ptr<const super_expression>;
struct when_expression;                   using when_expression_ptr = std::shared_ptr<const when_expression>;
struct when_branch;                       using when_branch_ptr = std::shared_ptr<const when_branch>;
struct when_condition;                    using when_condition_ptr = std::shared_ptr<const when_condition>;
struct object_literal_expression;         using object_literal_expression_ptr = std::shared_ptr<const object_literal_expression>;
struct throw_expression;                  using throw_expression_ptr = std::shared_ptr<const throw_expression>;
struct return_expression;                 using return_expression_ptr = std::shared_ptr<const return_expression>;
struct continue_expression;               using continue_expression_ptr = std::shared_ptr<const continue_expression>;
struct break_expression;                  using break_expression_ptr = std::shared_ptr<const break_expression>;
struct collection_literal_expression;     using collection_literal_expression_ptr = std::shared_ptr<const collection_literal_expression>;
struct name_expression;                   using name_expression_ptr = std::shared_ptr<const name_expression>;
struct labeled_expression;                using labeled_expression_ptr = std::shared_ptr<const labeled_expression>;
struct annotated_expression;              using annotated_expression_ptr = std::shared_ptr<const annotated_expression>;
struct call_expression;                   using call_expression_ptr = std::shared_ptr<const call_expression>;
struct lambda_arg;                        using lambda_arg_ptr = std::shared_ptr<const lambda_arg>;
struct array_access_expression;           using array_access_expression_ptr = std::shared_ptr<const array_access_expression>;
struct anonymous_function_expression;     using anonymous_function_expression_ptr = std::shared_ptr<const anonymous_function_expression>;
struct property_expression;               using property_expression_ptr = std::shared_ptr<const property_expression>;
struct block_expression;                  using block_expression_ptr = std::shared_ptr<const block_expression>;
struct modifiers;                         using modifiers_ptr = std::shared_ptr<const modifiers>;
struct annotation_set;                    using annotation_set_ptr = std::shared_ptr<const annotation_set>;
struct annotation;                        using annotation_ptr = std::shared_ptr<const annotation>;
struct type_constraint_set;               using type_constraint_set_ptr = std::shared_ptr<const type_constraint_set>;
struct type_constraints;                  using type_constraints_ptr = std::shared_ptr<const type_constraints>;
struct type_constraint;                   using type_constraint_ptr = std::shared_ptr<const type_constraint>;
struct contract;                          using contract_ptr = std::shared_ptr<const contract>;
struct contract_effects;                  using contract_effects_ptr = std::shared_ptr<const contract_effects>;
struct contract_effect;                   using contract_effect_ptr = std::shared_ptr<const contract_effect>;
struct keyword;                           using keyword_ptr = std::shared_ptr<const keyword>;
struct whitespace;                        using whitespace_ptr = std::shared_ptr<const whitespace>;
struct comment;                           using comment_ptr = std::shared_ptr<const comment>;
struct semicolon;                         using semicolon_ptr = std::shared_ptr<const semicolon>;
struct trailing_comma;                    using trailing_comma_ptr = std::shared_ptr<const trailing_comma>;
struct blank_lines;                       using blank_lines_ptr = std::shared_ptr<const blank_lines>;

using node_ptr = std::shared_ptr<const node_base>;
using node_list = std::vector<node_ptr>;

template<typename T>
using list_of = std::vector<std::shared_ptr<const T>>;

struct node_base
{
  node_base(node_kind kind) : kind(kind), id(next_id()) {}
  node_base(const node_base& other) : kind(other.kind), id(next_id()) {}
  node_base& operator=(const node_base&) = delete;
  virtual ~node_base() = default;

  const node_kind kind;
  const std::uint_fast64_t id;

private:
  static std::uint_fast64_t next_id()
  {
    static std::atomic<std::uint_fast64_t> counter { 0 };
    return ++counter;
  }
};

template<typename Type, typename... Args>
std::shared_ptr<const Type> mk(Args&&... args)
{ return std::make_shared<const Type>(std::forward<Args>(args)...); }

// Unchecked downcast, callers dispatch on kind first.
template<typename T>
std::shared_ptr<const T> as(const node_ptr& node)
{ return std::static_pointer_cast<const T>(node); }

// Checked downcast, throws invariant_violation when the kind does not match.
template<typename T>
std::shared_ptr<const T> node_cast(const node_ptr& node, const char* where);

bool in_category(node_kind kind, node_category cat);

inline bool is_expression(node_kind kind) { return in_category(kind, node_category::expression); }
inline bool is_declaration(node_kind kind) { return in_category(kind, node_category::declaration); }
inline bool is_statement(node_kind kind) { return in_category(kind, node_category::statement); }
inline bool is_type(node_kind kind) { return in_category(kind, node_category::type); }
inline bool is_extra(node_kind kind) { return in_category(kind, node_category::extra); }

// Qualified kind name, e.g. "expression.name_expression".
const char* kind_name(node_kind kind);
const char* category_name(node_category cat);

}
