#include <ast.hpp>
#include <errors.hpp>
#include <diagnostic_db.hpp>
#include <node_util.hpp>

#include <algorithm>

namespace ktree
{

bool in_category(node_kind kind, node_category cat)
{
  switch(cat)
  {
  case node_category::expression:
    switch(kind)
    {
    case node_kind::if_expression:
    case node_kind::try_expression:
    case node_kind::for_expression:
    case node_kind::while_expression:
    case node_kind::binary_expression:
    case node_kind::binary_infix_expression:
    case node_kind::unary_expression:
    case node_kind::binary_type_expression:
    case node_kind::callable_reference_expression:
    case node_kind::class_literal_expression:
    case node_kind::parenthesized_expression:
    case node_kind::string_literal_expression:
    case node_kind::constant_literal_expression:
    case node_kind::lambda_expression:
    case node_kind::this_expression:
    case node_kind::super_expression:
    case node_kind::when_expression:
    case node_kind::object_literal_expression:
    case node_kind::throw_expression:
    case node_kind::return_expression:
    case node_kind::continue_expression:
    case node_kind::break_expression:
    case node_kind::collection_literal_expression:
    case node_kind::name_expression:
    case node_kind::labeled_expression:
    case node_kind::annotated_expression:
    case node_kind::call_expression:
    case node_kind::array_access_expression:
    case node_kind::anonymous_function_expression:
    case node_kind::property_expression:
    case node_kind::block_expression:
      return true;
    default:
      return false;
    }
  case node_category::declaration:
    switch(kind)
    {
    case node_kind::class_declaration:
    case node_kind::init_declaration:
    case node_kind::function_declaration:
    case node_kind::property_declaration:
    case node_kind::type_alias_declaration:
    case node_kind::secondary_constructor_declaration:
      return true;
    default:
      return false;
    }
  case node_category::statement:
    return in_category(kind, node_category::expression) || in_category(kind, node_category::declaration);
  case node_category::type:
    return kind == node_kind::function_type || kind == node_kind::simple_type
        || kind == node_kind::nullable_type || kind == node_kind::dynamic_type;
  case node_category::modifier:
    return kind == node_kind::keyword || kind == node_kind::annotation_set;
  case node_category::post_modifier:
    return kind == node_kind::type_constraint_set || kind == node_kind::contract;
  case node_category::class_parent:
    return kind == node_kind::call_constructor_parent || kind == node_kind::delegated_type_parent
        || kind == node_kind::type_parent;
  case node_category::accessor:
    return kind == node_kind::getter || kind == node_kind::setter;
  case node_category::string_entry:
    return kind == node_kind::literal_string_entry || kind == node_kind::escape_string_entry
        || kind == node_kind::template_string_entry;
  case node_category::receiver:
    return kind == node_kind::expression_receiver || kind == node_kind::type_receiver;
  case node_category::extra:
    return kind >= node_kind::whitespace;
  }
  return false;
}

const char* kind_name(node_kind kind)
{
  switch(kind)
  {
  case node_kind::kotlin_file: return "kotlin_file";
  case node_kind::kotlin_script: return "kotlin_script";
  case node_kind::package_directive: return "package_directive";
  case node_kind::import_directives: return "import_directives";
  case node_kind::import_directive: return "import_directive";
  case node_kind::import_alias: return "import_alias";
  case node_kind::class_declaration: return "declaration.class_declaration";
  case node_kind::class_parents: return "declaration.class_parents";
  case node_kind::call_constructor_parent: return "declaration.call_constructor_parent";
  case node_kind::delegated_type_parent: return "declaration.delegated_type_parent";
  case node_kind::type_parent: return "declaration.type_parent";
  case node_kind::primary_constructor: return "declaration.primary_constructor";
  case node_kind::class_body: return "declaration.class_body";
  case node_kind::enum_entry: return "declaration.enum_entry";
  case node_kind::init_declaration: return "declaration.init_declaration";
  case node_kind::function_declaration: return "declaration.function_declaration";
  case node_kind::function_params: return "declaration.function_params";
  case node_kind::function_param: return "declaration.function_param";
  case node_kind::property_declaration: return "declaration.property_declaration";
  case node_kind::property_delegate: return "declaration.property_delegate";
  case node_kind::variable: return "declaration.variable";
  case node_kind::getter: return "declaration.getter";
  case node_kind::setter: return "declaration.setter";
  case node_kind::type_alias_declaration: return "declaration.type_alias_declaration";
  case node_kind::secondary_constructor_declaration: return "declaration.secondary_constructor_declaration";
  case node_kind::delegation_call: return "declaration.delegation_call";
  case node_kind::type_params: return "declaration.type_params";
  case node_kind::type_param: return "declaration.type_param";
  case node_kind::function_type: return "type.function_type";
  case node_kind::context_receivers: return "type.context_receivers";
  case node_kind::context_receiver: return "type.context_receiver";
  case node_kind::function_type_receiver: return "type.function_type_receiver";
  case node_kind::function_type_params: return "type.function_type_params";
  case node_kind::function_type_param: return "type.function_type_param";
  case node_kind::simple_type: return "type.simple_type";
  case node_kind::simple_type_qualifier: return "type.simple_type_qualifier";
  case node_kind::nullable_type: return "type.nullable_type";
  case node_kind::dynamic_type: return "type.dynamic_type";
  case node_kind::type_args: return "type.type_args";
  case node_kind::type_arg: return "type.type_arg";
  case node_kind::type_ref: return "type.type_ref";
  case node_kind::value_args: return "argument.value_args";
  case node_kind::value_arg: return "argument.value_arg";
  case node_kind::if_expression: return "expression.if_expression";
  case node_kind::try_expression: return "expression.try_expression";
  case node_kind::catch_clause: return "expression.catch_clause";
  case node_kind::for_expression: return "expression.for_expression";
  case node_kind::while_expression: return "expression.while_expression";
  case node_kind::binary_expression: return "expression.binary_expression";
  case node_kind::binary_infix_expression: return "expression.binary_infix_expression";
  case node_kind::unary_expression: return "expression.unary_expression";
  case node_kind::binary_type_expression: return "expression.binary_type_expression";
  case node_kind::callable_reference_expression: return "expression.callable_reference_expression";
  case node_kind::class_literal_expression: return "expression.class_literal_expression";
  case node_kind::expression_receiver: return "expression.expression_receiver";
  case node_kind::type_receiver: return "expression.type_receiver";
  case node_kind::parenthesized_expression: return "expression.parenthesized_expression";
  case node_kind::string_literal_expression: return "expression.string_literal_expression";
  case node_kind::literal_string_entry: return "expression.literal_string_entry";
  case node_kind::escape_string_entry: return "expression.escape_string_entry";
  case node_kind::template_string_entry: return "expression.template_string_entry";
  case node_kind::constant_literal_expression: return "expression.constant_literal_expression";
  case node_kind::lambda_expression: return "expression.lambda_expression";
  case node_kind::lambda_params: return "expression.lambda_params";
  case node_kind::lambda_param: return "expression.lambda_param";
  case node_kind::lambda_body: return "expression.lambda_body";
  case node_kind::this_expression: return "expression.this_expression";
  case node_kind::super_expression: return "expression.super_expression";
  case node_kind::when_expression: return "expression.when_expression";
  case node_kind::when_branch: return "expression.when_branch";
  case node_kind::when_condition: return "expression.when_condition";
  case node_kind::object_literal_expression: return "expression.object_literal_expression";
  case node_kind::throw_expression: return "expression.throw_expression";
  case node_kind::return_expression: return "expression.return_expression";
  case node_kind::continue_expression: return "expression.continue_expression";
  case node_kind::break_expression: return "expression.break_expression";
  case node_kind::collection_literal_expression: return "expression.collection_literal_expression";
  case node_kind::name_expression: return "expression.name_expression";
  case node_kind::labeled_expression: return "expression.labeled_expression";
  case node_kind::annotated_expression: return "expression.annotated_expression";
  case node_kind::call_expression: return "expression.call_expression";
  case node_kind::lambda_arg: return "expression.lambda_arg";
  case node_kind::array_access_expression: return "expression.array_access_expression";
  case node_kind::anonymous_function_expression: return "expression.anonymous_function_expression";
  case node_kind::property_expression: return "expression.property_expression";
  case node_kind::block_expression: return "expression.block_expression";
  case node_kind::modifiers: return "modifier.modifiers";
  case node_kind::annotation_set: return "modifier.annotation_set";
  case node_kind::annotation: return "modifier.annotation";
  case node_kind::type_constraint_set: return "modifier.type_constraint_set";
  case node_kind::type_constraints: return "modifier.type_constraints";
  case node_kind::type_constraint: return "modifier.type_constraint";
  case node_kind::contract: return "modifier.contract";
  case node_kind::contract_effects: return "modifier.contract_effects";
  case node_kind::contract_effect: return "modifier.contract_effect";
  case node_kind::keyword: return "keyword";
  case node_kind::whitespace: return "extra.whitespace";
  case node_kind::comment: return "extra.comment";
  case node_kind::semicolon: return "extra.semicolon";
  case node_kind::trailing_comma: return "extra.trailing_comma";
  case node_kind::blank_lines: return "extra.blank_lines";
  }
  return "unknown";
}

const char* category_name(node_category cat)
{
  switch(cat)
  {
  case node_category::expression: return "expression";
  case node_category::declaration: return "declaration";
  case node_category::statement: return "statement";
  case node_category::type: return "type";
  case node_category::modifier: return "modifier";
  case node_category::post_modifier: return "post modifier";
  case node_category::class_parent: return "class parent";
  case node_category::accessor: return "accessor";
  case node_category::string_entry: return "string entry";
  case node_category::receiver: return "receiver";
  case node_category::extra: return "extra";
  }
  return "node";
}

namespace detail
{

void expect_present(const node_ptr& child, const char* where)
{
  if(child == nullptr)
    raise<invariant_violation>(diagnostic_db::node::missing_child(source_range{}, where));
}

void expect_category(const node_ptr& child, node_category cat, const char* where, bool optional)
{
  if(child == nullptr)
  {
    if(!optional)
      expect_present(child, where);
    return;
  }
  if(!in_category(child->kind, cat))
    raise<invariant_violation>(diagnostic_db::node::wrong_category(source_range{}, where, category_name(cat)));
}

void expect_categories(const node_list& children, node_category cat, const char* where)
{
  for(auto& c : children)
    expect_category(c, cat, where);
}

void expect_keyword(const keyword_ptr& kw, keyword_kind kind, const char* where, bool optional)
{
  if(kw == nullptr)
  {
    if(!optional)
      expect_present(kw, where);
    return;
  }
  if(kw->which != kind)
    raise<invariant_violation>(diagnostic_db::node::wrong_keyword(source_range{}, where, keyword_text(kind)));
}

void expect_keyword_category(const keyword_ptr& kw, keyword_category cat, const char* where, bool optional)
{
  if(kw == nullptr)
  {
    if(!optional)
      expect_present(kw, where);
    return;
  }
  if(!has_category(kw->which, cat))
    raise<invariant_violation>(diagnostic_db::node::wrong_category(source_range{}, where, keyword_category_name(cat)));
}

void expect_trailing_comma(const keyword_ptr& comma, std::size_t elements, const char* where)
{
  expect_keyword(comma, keyword_kind::comma, where, true);
  if(comma != nullptr && elements == 0)
    raise<invariant_violation>(diagnostic_db::node::invariant(source_range{}, where, "a trailing comma needs at least one element"));
}

void expect_non_empty(std::size_t size, const char* where)
{
  if(size == 0)
    raise<invariant_violation>(diagnostic_db::node::empty_list(source_range{}, where));
}

void expect(bool cond, const char* node, const char* what)
{
  if(!cond)
    raise<invariant_violation>(diagnostic_db::node::invariant(source_range{}, node, what));
}

void wrong_kind(const node_ptr& child, const char* where)
{
  raise<invariant_violation>(diagnostic_db::node::wrong_kind(source_range{}, where, kind_name(child->kind)));
}

}

using namespace detail;

static void expect_grouping(const keyword_ptr& lpar, std::size_t variables, const keyword_ptr& trailing_comma,
                            const keyword_ptr& rpar, const char* node)
{
  expect_keyword(lpar, keyword_kind::lpar, node, true);
  expect_keyword(rpar, keyword_kind::rpar, node, true);
  expect_non_empty(variables, node);
  expect((lpar == nullptr) == (rpar == nullptr), node, "parentheses must be balanced");
  if(variables > 1)
    expect(lpar != nullptr, node, "multiple variables must be parenthesized");
  else
    expect(lpar == nullptr, node, "a single variable must not be parenthesized");
  expect_trailing_comma(trailing_comma, variables, node);
  expect(trailing_comma == nullptr || lpar != nullptr, node, "a trailing comma needs parentheses");
}

////////////////////////////////////////////////////////////////////////////////

kotlin_file::kotlin_file(const list_of<annotation_set>& annotation_sets, package_directive_ptr package_directive,
                         import_directives_ptr import_directives, const node_list& declarations)
  : node_base(static_kind), annotation_sets(annotation_sets), package_directive(package_directive),
    import_directives(import_directives), declarations(declarations)
{
  expect_all_present(annotation_sets, "kotlin_file.annotation_sets");
  expect_categories(declarations, node_category::declaration, "kotlin_file.declarations");
}

kotlin_script::kotlin_script(const list_of<annotation_set>& annotation_sets, package_directive_ptr package_directive,
                             import_directives_ptr import_directives, const node_list& expressions)
  : node_base(static_kind), annotation_sets(annotation_sets), package_directive(package_directive),
    import_directives(import_directives), expressions(expressions)
{
  expect_all_present(annotation_sets, "kotlin_script.annotation_sets");
  expect_categories(expressions, node_category::expression, "kotlin_script.expressions");
}

package_directive::package_directive(modifiers_ptr modifiers, keyword_ptr package_keyword,
                                     const list_of<name_expression>& names)
  : node_base(static_kind), modifiers(modifiers), package_keyword(package_keyword), names(names)
{
  expect_keyword(package_keyword, keyword_kind::package, "package_directive.package_keyword");
  expect_non_empty(names.size(), "package_directive.names");
  expect_all_present(names, "package_directive.names");
}

import_directives::import_directives(const list_of<import_directive>& elements)
  : node_base(static_kind), elements(elements)
{
  expect_non_empty(elements.size(), "import_directives.elements");
  expect_all_present(elements, "import_directives.elements");
}

import_directive::import_directive(keyword_ptr import_keyword, const list_of<name_expression>& names,
                                   import_alias_ptr import_alias)
  : node_base(static_kind), import_keyword(import_keyword), names(names), import_alias(import_alias)
{
  expect_keyword(import_keyword, keyword_kind::import, "import_directive.import_keyword");
  expect_non_empty(names.size(), "import_directive.names");
  expect_all_present(names, "import_directive.names");
}

import_alias::import_alias(name_expression_ptr name)
  : node_base(static_kind), name(name)
{ expect_present(name, "import_alias.name"); }

////////////////////////////////////////////////////////////////////////////////

class_declaration::class_declaration(modifiers_ptr modifiers, keyword_ptr declaration_keyword, name_expression_ptr name,
                                     type_params_ptr type_params, primary_constructor_ptr primary_constructor,
                                     class_parents_ptr class_parents, type_constraint_set_ptr type_constraint_set,
                                     class_body_ptr class_body)
  : node_base(static_kind), modifiers(modifiers), declaration_keyword(declaration_keyword), name(name),
    type_params(type_params), primary_constructor(primary_constructor), class_parents(class_parents),
    type_constraint_set(type_constraint_set), class_body(class_body)
{
  expect_keyword_category(declaration_keyword, keyword_category::class_declaration,
                          "class_declaration.declaration_keyword");
  if(declaration_keyword->which != keyword_kind::object)
    expect_present(name, "class_declaration.name");
}

bool class_declaration::is_class() const { return declaration_keyword->which == keyword_kind::class_; }
bool class_declaration::is_object() const { return declaration_keyword->which == keyword_kind::object; }
bool class_declaration::is_interface() const { return declaration_keyword->which == keyword_kind::interface; }

bool class_declaration::is_companion() const
{ return is_object() && modifiers != nullptr && modifiers->has(keyword_kind::companion); }

bool class_declaration::is_enum() const
{ return is_class() && modifiers != nullptr && modifiers->has(keyword_kind::enum_); }

class_parents::class_parents(const node_list& elements)
  : node_base(static_kind), elements(elements)
{
  expect_non_empty(elements.size(), "class_parents.elements");
  expect_categories(elements, node_category::class_parent, "class_parents.elements");
}

call_constructor_parent::call_constructor_parent(simple_type_ptr type, value_args_ptr args, lambda_arg_ptr lambda_arg)
  : node_base(static_kind), type(type), args(args), lambda_arg(lambda_arg)
{
  expect_present(type, "call_constructor_parent.type");
  expect_present(args, "call_constructor_parent.args");
}

delegated_type_parent::delegated_type_parent(node_ptr type, keyword_ptr by_keyword, node_ptr expression)
  : node_base(static_kind), type(type), by_keyword(by_keyword), expression(expression)
{
  expect_category(type, node_category::type, "delegated_type_parent.type");
  expect_keyword(by_keyword, keyword_kind::by, "delegated_type_parent.by_keyword");
  expect_category(expression, node_category::expression, "delegated_type_parent.expression");
}

type_parent::type_parent(node_ptr type)
  : node_base(static_kind), type(type)
{ expect_category(type, node_category::type, "type_parent.type"); }

primary_constructor::primary_constructor(modifiers_ptr modifiers, keyword_ptr constructor_keyword,
                                         function_params_ptr params)
  : node_base(static_kind), modifiers(modifiers), constructor_keyword(constructor_keyword), params(params)
{
  expect_keyword(constructor_keyword, keyword_kind::constructor, "primary_constructor.constructor_keyword", true);
  expect(constructor_keyword != nullptr || params != nullptr, "primary_constructor",
         "needs a constructor keyword or parameters");
  expect(modifiers == nullptr || constructor_keyword != nullptr, "primary_constructor",
         "modifiers need a constructor keyword");
}

class_body::class_body(const list_of<enum_entry>& enum_entries, bool enum_trailing_comma, const node_list& declarations)
  : node_base(static_kind), enum_entries(enum_entries), enum_trailing_comma(enum_trailing_comma),
    declarations(declarations)
{
  expect_all_present(enum_entries, "class_body.enum_entries");
  expect_categories(declarations, node_category::declaration, "class_body.declarations");
  expect(!enum_trailing_comma || !enum_entries.empty(), "class_body",
         "a trailing comma needs at least one enum entry");
}

enum_entry::enum_entry(modifiers_ptr modifiers, name_expression_ptr name, value_args_ptr args, class_body_ptr class_body)
  : node_base(static_kind), modifiers(modifiers), name(name), args(args), class_body(class_body)
{ expect_present(name, "enum_entry.name"); }

init_declaration::init_declaration(modifiers_ptr modifiers, block_expression_ptr block)
  : node_base(static_kind), modifiers(modifiers), block(block)
{ expect_present(block, "init_declaration.block"); }

function_declaration::function_declaration(modifiers_ptr modifiers, keyword_ptr fun_keyword, type_params_ptr type_params,
                                           type_ref_ptr receiver_type_ref, name_expression_ptr name,
                                           function_params_ptr params, type_ref_ptr type_ref,
                                           const node_list& post_modifiers, keyword_ptr equals, node_ptr body)
  : node_base(static_kind), modifiers(modifiers), fun_keyword(fun_keyword), type_params(type_params),
    receiver_type_ref(receiver_type_ref), name(name), params(params), type_ref(type_ref),
    post_modifiers(post_modifiers), equals(equals), body(body)
{
  expect_keyword(fun_keyword, keyword_kind::fun, "function_declaration.fun_keyword");
  expect_categories(post_modifiers, node_category::post_modifier, "function_declaration.post_modifiers");
  expect_keyword(equals, keyword_kind::equal, "function_declaration.equals", true);
  expect_category(body, node_category::expression, "function_declaration.body", true);
  expect(equals == nullptr || body != nullptr, "function_declaration", "\"=\" needs a body");
  expect(body == nullptr || equals != nullptr || body->kind == node_kind::block_expression,
         "function_declaration", "a body without \"=\" must be a block");
}

function_params::function_params(const list_of<function_param>& elements, keyword_ptr trailing_comma)
  : node_base(static_kind), elements(elements), trailing_comma(trailing_comma)
{
  expect_all_present(elements, "function_params.elements");
  expect_trailing_comma(trailing_comma, elements.size(), "function_params.trailing_comma");
}

function_param::function_param(modifiers_ptr modifiers, keyword_ptr val_or_var, name_expression_ptr name,
                               type_ref_ptr type_ref, keyword_ptr equals, node_ptr default_value)
  : node_base(static_kind), modifiers(modifiers), val_or_var(val_or_var), name(name), type_ref(type_ref),
    equals(equals), default_value(default_value)
{
  expect_keyword_category(val_or_var, keyword_category::val_or_var, "function_param.val_or_var", true);
  expect_present(name, "function_param.name");
  expect_keyword(equals, keyword_kind::equal, "function_param.equals", true);
  expect_category(default_value, node_category::expression, "function_param.default_value", true);
  expect((equals == nullptr) == (default_value == nullptr), "function_param",
         "\"=\" and the default value must be present together");
}

property_declaration::property_declaration(modifiers_ptr modifiers, keyword_ptr val_or_var, type_params_ptr type_params,
                                           type_ref_ptr receiver_type_ref, keyword_ptr lpar,
                                           const list_of<variable>& variables, keyword_ptr trailing_comma,
                                           keyword_ptr rpar, type_constraint_set_ptr type_constraint_set,
                                           keyword_ptr equals, node_ptr initializer,
                                           property_delegate_ptr property_delegate, const node_list& accessors)
  : node_base(static_kind), modifiers(modifiers), val_or_var(val_or_var), type_params(type_params),
    receiver_type_ref(receiver_type_ref), lpar(lpar), variables(variables), trailing_comma(trailing_comma),
    rpar(rpar), type_constraint_set(type_constraint_set), equals(equals), initializer(initializer),
    property_delegate(property_delegate), accessors(accessors)
{
  expect_keyword_category(val_or_var, keyword_category::val_or_var, "property_declaration.val_or_var");
  expect_all_present(variables, "property_declaration.variables");
  expect_grouping(lpar, variables.size(), trailing_comma, rpar, "property_declaration");
  expect_keyword(equals, keyword_kind::equal, "property_declaration.equals", true);
  expect_category(initializer, node_category::expression, "property_declaration.initializer", true);
  expect((equals == nullptr) == (initializer == nullptr), "property_declaration",
         "\"=\" and the initializer must be present together");
  expect(initializer == nullptr || property_delegate == nullptr, "property_declaration",
         "a delegate and an initializer cannot both be present");

  expect_categories(accessors, node_category::accessor, "property_declaration.accessors");
  expect(accessors.size() <= 2, "property_declaration", "at most two accessors are allowed");
  const std::size_t getters = std::count_if(accessors.begin(), accessors.end(),
                                            [](auto& a) { return a->kind == node_kind::getter; });
  expect(getters <= 1, "property_declaration", "at most one getter is allowed");
  expect(accessors.size() - getters <= 1, "property_declaration", "at most one setter is allowed");
}

property_delegate::property_delegate(keyword_ptr by_keyword, node_ptr expression)
  : node_base(static_kind), by_keyword(by_keyword), expression(expression)
{
  expect_keyword(by_keyword, keyword_kind::by, "property_delegate.by_keyword");
  expect_category(expression, node_category::expression, "property_delegate.expression");
}

variable::variable(modifiers_ptr modifiers, name_expression_ptr name, type_ref_ptr type_ref)
  : node_base(static_kind), modifiers(modifiers), name(name), type_ref(type_ref)
{ expect_present(name, "variable.name"); }

getter::getter(modifiers_ptr modifiers, keyword_ptr get_keyword, keyword_ptr lpar, keyword_ptr rpar,
               type_ref_ptr type_ref, const node_list& post_modifiers, keyword_ptr equals, node_ptr body)
  : node_base(static_kind), modifiers(modifiers), get_keyword(get_keyword), lpar(lpar), rpar(rpar),
    type_ref(type_ref), post_modifiers(post_modifiers), equals(equals), body(body)
{
  expect_keyword(get_keyword, keyword_kind::get, "getter.get_keyword");
  expect_keyword(lpar, keyword_kind::lpar, "getter.lpar", true);
  expect_keyword(rpar, keyword_kind::rpar, "getter.rpar", true);
  expect((lpar == nullptr) == (rpar == nullptr), "getter", "parentheses must be balanced");
  expect(body == nullptr || lpar != nullptr, "getter", "a body needs parentheses");
  expect_categories(post_modifiers, node_category::post_modifier, "getter.post_modifiers");
  expect_keyword(equals, keyword_kind::equal, "getter.equals", true);
  expect_category(body, node_category::expression, "getter.body", true);
  expect(equals == nullptr || body != nullptr, "getter", "\"=\" needs a body");
  expect(body == nullptr || equals != nullptr || body->kind == node_kind::block_expression,
         "getter", "a body without \"=\" must be a block");
}

setter::setter(modifiers_ptr modifiers, keyword_ptr set_keyword, function_params_ptr params,
               const node_list& post_modifiers, keyword_ptr equals, node_ptr body)
  : node_base(static_kind), modifiers(modifiers), set_keyword(set_keyword), params(params),
    post_modifiers(post_modifiers), equals(equals), body(body)
{
  expect_keyword(set_keyword, keyword_kind::set, "setter.set_keyword");
  expect((params == nullptr) == (body == nullptr), "setter", "the parameter and the body must be present together");
  expect_categories(post_modifiers, node_category::post_modifier, "setter.post_modifiers");
  expect_keyword(equals, keyword_kind::equal, "setter.equals", true);
  expect_category(body, node_category::expression, "setter.body", true);
  expect(equals == nullptr || body != nullptr, "setter", "\"=\" needs a body");
  expect(body == nullptr || equals != nullptr || body->kind == node_kind::block_expression,
         "setter", "a body without \"=\" must be a block");
}

type_alias_declaration::type_alias_declaration(modifiers_ptr modifiers, name_expression_ptr name,
                                               type_params_ptr type_params, type_ref_ptr type_ref)
  : node_base(static_kind), modifiers(modifiers), name(name), type_params(type_params), type_ref(type_ref)
{
  expect_present(name, "type_alias_declaration.name");
  expect_present(type_ref, "type_alias_declaration.type_ref");
}

secondary_constructor_declaration::secondary_constructor_declaration(modifiers_ptr modifiers,
                                                                     keyword_ptr constructor_keyword,
                                                                     function_params_ptr params,
                                                                     delegation_call_ptr delegation_call,
                                                                     block_expression_ptr block)
  : node_base(static_kind), modifiers(modifiers), constructor_keyword(constructor_keyword), params(params),
    delegation_call(delegation_call), block(block)
{
  expect_keyword(constructor_keyword, keyword_kind::constructor,
                 "secondary_constructor_declaration.constructor_keyword");
  expect_present(params, "secondary_constructor_declaration.params");
}

delegation_call::delegation_call(keyword_ptr target, value_args_ptr args)
  : node_base(static_kind), target(target), args(args)
{
  expect_keyword_category(target, keyword_category::delegation_target, "delegation_call.target");
  expect_present(args, "delegation_call.args");
}

type_params::type_params(const list_of<type_param>& elements, keyword_ptr trailing_comma)
  : node_base(static_kind), elements(elements), trailing_comma(trailing_comma)
{
  expect_non_empty(elements.size(), "type_params.elements");
  expect_all_present(elements, "type_params.elements");
  expect_trailing_comma(trailing_comma, elements.size(), "type_params.trailing_comma");
}

type_param::type_param(modifiers_ptr modifiers, name_expression_ptr name, type_ref_ptr type_ref)
  : node_base(static_kind), modifiers(modifiers), name(name), type_ref(type_ref)
{ expect_present(name, "type_param.name"); }

////////////////////////////////////////////////////////////////////////////////

function_type::function_type(context_receivers_ptr context_receivers, function_type_receiver_ptr receiver,
                             function_type_params_ptr params, type_ref_ptr return_type_ref)
  : node_base(static_kind), context_receivers(context_receivers), receiver(receiver), params(params),
    return_type_ref(return_type_ref)
{
  expect_present(params, "function_type.params");
  expect_present(return_type_ref, "function_type.return_type_ref");
}

context_receivers::context_receivers(const list_of<context_receiver>& elements, keyword_ptr trailing_comma)
  : node_base(static_kind), elements(elements), trailing_comma(trailing_comma)
{
  expect_non_empty(elements.size(), "context_receivers.elements");
  expect_all_present(elements, "context_receivers.elements");
  expect_trailing_comma(trailing_comma, elements.size(), "context_receivers.trailing_comma");
}

context_receiver::context_receiver(type_ref_ptr type_ref)
  : node_base(static_kind), type_ref(type_ref)
{ expect_present(type_ref, "context_receiver.type_ref"); }

function_type_receiver::function_type_receiver(type_ref_ptr type_ref)
  : node_base(static_kind), type_ref(type_ref)
{ expect_present(type_ref, "function_type_receiver.type_ref"); }

function_type_params::function_type_params(const list_of<function_type_param>& elements, keyword_ptr trailing_comma)
  : node_base(static_kind), elements(elements), trailing_comma(trailing_comma)
{
  expect_all_present(elements, "function_type_params.elements");
  expect_trailing_comma(trailing_comma, elements.size(), "function_type_params.trailing_comma");
}

function_type_param::function_type_param(name_expression_ptr name, type_ref_ptr type_ref)
  : node_base(static_kind), name(name), type_ref(type_ref)
{ expect_present(type_ref, "function_type_param.type_ref"); }

simple_type::simple_type(const list_of<simple_type_qualifier>& qualifiers, name_expression_ptr name,
                         type_args_ptr type_args)
  : node_base(static_kind), qualifiers(qualifiers), name(name), type_args(type_args)
{
  expect_all_present(qualifiers, "simple_type.qualifiers");
  expect_present(name, "simple_type.name");
}

simple_type_qualifier::simple_type_qualifier(name_expression_ptr name, type_args_ptr type_args)
  : node_base(static_kind), name(name), type_args(type_args)
{ expect_present(name, "simple_type_qualifier.name"); }

nullable_type::nullable_type(keyword_ptr lpar, modifiers_ptr modifiers, node_ptr type, keyword_ptr rpar)
  : node_base(static_kind), lpar(lpar), modifiers(modifiers), type(type), rpar(rpar)
{
  expect_keyword(lpar, keyword_kind::lpar, "nullable_type.lpar", true);
  expect_keyword(rpar, keyword_kind::rpar, "nullable_type.rpar", true);
  expect((lpar == nullptr) == (rpar == nullptr), "nullable_type", "parentheses must be balanced");
  expect_category(type, node_category::type, "nullable_type.type");
}

type_args::type_args(const list_of<type_arg>& elements, keyword_ptr trailing_comma)
  : node_base(static_kind), elements(elements), trailing_comma(trailing_comma)
{
  expect_non_empty(elements.size(), "type_args.elements");
  expect_all_present(elements, "type_args.elements");
  expect_trailing_comma(trailing_comma, elements.size(), "type_args.trailing_comma");
}

type_arg::type_arg(modifiers_ptr modifiers, type_ref_ptr type_ref, bool asterisk)
  : node_base(static_kind), modifiers(modifiers), type_ref(type_ref), asterisk(asterisk)
{
  expect(asterisk != (type_ref != nullptr), "type_arg", "exactly one of \"*\" and a type must be given");
  expect(!asterisk || modifiers == nullptr, "type_arg", "\"*\" cannot carry modifiers");
}

type_ref::type_ref(keyword_ptr lpar, modifiers_ptr modifiers, node_ptr type, keyword_ptr rpar)
  : node_base(static_kind), lpar(lpar), modifiers(modifiers), type(type), rpar(rpar)
{
  expect_keyword(lpar, keyword_kind::lpar, "type_ref.lpar", true);
  expect_keyword(rpar, keyword_kind::rpar, "type_ref.rpar", true);
  expect((lpar == nullptr) == (rpar == nullptr), "type_ref", "parentheses must be balanced");
  expect_category(type, node_category::type, "type_ref.type");
}

value_args::value_args(const list_of<value_arg>& elements, keyword_ptr trailing_comma)
  : node_base(static_kind), elements(elements), trailing_comma(trailing_comma)
{
  expect_all_present(elements, "value_args.elements");
  expect_trailing_comma(trailing_comma, elements.size(), "value_args.trailing_comma");
}

value_arg::value_arg(name_expression_ptr name, bool asterisk, node_ptr expression)
  : node_base(static_kind), name(name), asterisk(asterisk), expression(expression)
{ expect_category(expression, node_category::expression, "value_arg.expression"); }

////////////////////////////////////////////////////////////////////////////////

if_expression::if_expression(keyword_ptr if_keyword, node_ptr condition, node_ptr body, node_ptr else_body)
  : node_base(static_kind), if_keyword(if_keyword), condition(condition), body(body), else_body(else_body)
{
  expect_keyword(if_keyword, keyword_kind::if_, "if_expression.if_keyword");
  expect_category(condition, node_category::expression, "if_expression.condition");
  expect_category(body, node_category::expression, "if_expression.body");
  expect_category(else_body, node_category::expression, "if_expression.else_body", true);
}

try_expression::try_expression(block_expression_ptr block, const list_of<catch_clause>& catch_clauses,
                               block_expression_ptr finally_block)
  : node_base(static_kind), block(block), catch_clauses(catch_clauses), finally_block(finally_block)
{
  expect_present(block, "try_expression.block");
  expect_all_present(catch_clauses, "try_expression.catch_clauses");
  expect(!catch_clauses.empty() || finally_block != nullptr, "try_expression",
         "needs a catch clause or a finally block");
}

catch_clause::catch_clause(keyword_ptr catch_keyword, function_params_ptr params, block_expression_ptr block)
  : node_base(static_kind), catch_keyword(catch_keyword), params(params), block(block)
{
  expect_keyword(catch_keyword, keyword_kind::catch_, "catch_clause.catch_keyword");
  expect_present(params, "catch_clause.params");
  expect_present(block, "catch_clause.block");
}

for_expression::for_expression(keyword_ptr for_keyword, lambda_param_ptr loop_param, node_ptr loop_range, node_ptr body)
  : node_base(static_kind), for_keyword(for_keyword), loop_param(loop_param), loop_range(loop_range), body(body)
{
  expect_keyword(for_keyword, keyword_kind::for_, "for_expression.for_keyword");
  expect_present(loop_param, "for_expression.loop_param");
  expect_category(loop_range, node_category::expression, "for_expression.loop_range");
  expect_category(body, node_category::expression, "for_expression.body");
}

while_expression::while_expression(keyword_ptr while_keyword, node_ptr condition, node_ptr body, bool do_while)
  : node_base(static_kind), while_keyword(while_keyword), condition(condition), body(body), do_while(do_while)
{
  expect_keyword(while_keyword, keyword_kind::while_, "while_expression.while_keyword");
  expect_category(condition, node_category::expression, "while_expression.condition");
  expect_category(body, node_category::expression, "while_expression.body");
}

binary_expression::binary_expression(node_ptr lhs, keyword_ptr op, node_ptr rhs)
  : node_base(static_kind), lhs(lhs), op(op), rhs(rhs)
{
  expect_category(lhs, node_category::expression, "binary_expression.lhs");
  expect_keyword_category(op, keyword_category::binary_operator, "binary_expression.op");
  expect_category(rhs, node_category::expression, "binary_expression.rhs");
}

binary_infix_expression::binary_infix_expression(node_ptr lhs, name_expression_ptr op, node_ptr rhs)
  : node_base(static_kind), lhs(lhs), op(op), rhs(rhs)
{
  expect_category(lhs, node_category::expression, "binary_infix_expression.lhs");
  expect_present(op, "binary_infix_expression.op");
  expect_category(rhs, node_category::expression, "binary_infix_expression.rhs");
}

unary_expression::unary_expression(node_ptr expression, keyword_ptr op, bool prefix)
  : node_base(static_kind), expression(expression), op(op), prefix(prefix)
{
  expect_category(expression, node_category::expression, "unary_expression.expression");
  expect_keyword_category(op, keyword_category::unary_operator, "unary_expression.op");
  if(prefix)
    expect(op->which != keyword_kind::excl_excl, "unary_expression", "\"!!\" is a postfix operator");
  else
    expect(op->which == keyword_kind::plus_plus || op->which == keyword_kind::minus_minus
        || op->which == keyword_kind::excl_excl, "unary_expression", "only \"++\", \"--\" and \"!!\" are postfix");
}

binary_type_expression::binary_type_expression(node_ptr lhs, keyword_ptr op, type_ref_ptr rhs)
  : node_base(static_kind), lhs(lhs), op(op), rhs(rhs)
{
  expect_category(lhs, node_category::expression, "binary_type_expression.lhs");
  expect_keyword_category(op, keyword_category::binary_type_operator, "binary_type_expression.op");
  expect_present(rhs, "binary_type_expression.rhs");
}

callable_reference_expression::callable_reference_expression(node_ptr lhs, name_expression_ptr rhs)
  : node_base(static_kind), lhs(lhs), rhs(rhs)
{
  expect_category(lhs, node_category::receiver, "callable_reference_expression.lhs", true);
  expect_present(rhs, "callable_reference_expression.rhs");
}

class_literal_expression::class_literal_expression(node_ptr lhs)
  : node_base(static_kind), lhs(lhs)
{ expect_category(lhs, node_category::receiver, "class_literal_expression.lhs"); }

static node_ptr receiver_as_type(const node_ptr& lhs)
{
  if(lhs == nullptr)
    return nullptr;
  if(lhs->kind == node_kind::type_receiver)
  {
    auto recv = as<type_receiver>(lhs);
    return wrap_nullable(recv->type, recv->question_marks);
  }
  return to_type(as<expression_receiver>(lhs)->expression);
}

node_ptr callable_reference_expression::lhs_as_type() const
{ return receiver_as_type(lhs); }

node_ptr class_literal_expression::lhs_as_type() const
{ return receiver_as_type(lhs); }

expression_receiver::expression_receiver(node_ptr expression)
  : node_base(static_kind), expression(expression)
{ expect_category(expression, node_category::expression, "expression_receiver.expression"); }

type_receiver::type_receiver(simple_type_ptr type, std::size_t question_marks)
  : node_base(static_kind), type(type), question_marks(question_marks)
{ expect_present(type, "type_receiver.type"); }

parenthesized_expression::parenthesized_expression(node_ptr inner_expression)
  : node_base(static_kind), inner_expression(inner_expression)
{ expect_category(inner_expression, node_category::expression, "parenthesized_expression.inner_expression"); }

string_literal_expression::string_literal_expression(const node_list& entries, bool raw)
  : node_base(static_kind), entries(entries), raw(raw)
{ expect_categories(entries, node_category::string_entry, "string_literal_expression.entries"); }

literal_string_entry::literal_string_entry(std::string text)
  : node_base(static_kind), text(std::move(text))
{  }

escape_string_entry::escape_string_entry(std::string text)
  : node_base(static_kind), text(std::move(text))
{ expect(!this->text.empty() && this->text.front() == '\\', "escape_string_entry", "must start with \"\\\""); }

template_string_entry::template_string_entry(node_ptr expression, bool short_template)
  : node_base(static_kind), expression(expression), short_template(short_template)
{
  expect_category(expression, node_category::expression, "template_string_entry.expression");
  if(short_template)
  {
    const bool bare_name = expression->kind == node_kind::name_expression;
    const bool bare_this = expression->kind == node_kind::this_expression
                        && as<this_expression>(expression)->label.empty();
    expect(bare_name || bare_this, "template_string_entry",
           "a short template may only hold a name or an unlabeled \"this\"");
  }
}

constant_literal_expression::constant_literal_expression(std::string value, constant_form form)
  : node_base(static_kind), value(std::move(value)), form(form)
{ expect(!this->value.empty(), "constant_literal_expression", "the value must not be empty"); }

lambda_expression::lambda_expression(lambda_params_ptr params, keyword_ptr arrow, lambda_body_ptr lambda_body)
  : node_base(static_kind), params(params), arrow(arrow), lambda_body(lambda_body)
{
  expect_keyword(arrow, keyword_kind::arrow, "lambda_expression.arrow", true);
  expect(params == nullptr || arrow != nullptr, "lambda_expression", "parameters need an arrow");
}

lambda_params::lambda_params(const list_of<lambda_param>& elements, keyword_ptr trailing_comma)
  : node_base(static_kind), elements(elements), trailing_comma(trailing_comma)
{
  expect_non_empty(elements.size(), "lambda_params.elements");
  expect_all_present(elements, "lambda_params.elements");
  expect_trailing_comma(trailing_comma, elements.size(), "lambda_params.trailing_comma");
}

lambda_param::lambda_param(keyword_ptr lpar, const list_of<variable>& variables, keyword_ptr trailing_comma,
                           keyword_ptr rpar, keyword_ptr colon, type_ref_ptr destruct_type_ref)
  : node_base(static_kind), lpar(lpar), variables(variables), trailing_comma(trailing_comma), rpar(rpar),
    colon(colon), destruct_type_ref(destruct_type_ref)
{
  expect_all_present(variables, "lambda_param.variables");
  expect_grouping(lpar, variables.size(), trailing_comma, rpar, "lambda_param");
  expect_keyword(colon, keyword_kind::colon, "lambda_param.colon", true);
  expect((colon == nullptr) == (destruct_type_ref == nullptr), "lambda_param",
         "\":\" and the destructuring type must be present together");
  expect(destruct_type_ref == nullptr || lpar != nullptr, "lambda_param",
         "a destructuring type needs parentheses");
}

lambda_body::lambda_body(const node_list& statements)
  : node_base(static_kind), statements(statements)
{ expect_categories(statements, node_category::statement, "lambda_body.statements"); }

this_expression::this_expression(std::string label)
  : node_base(static_kind), label(std::move(label))
{  }

super_expression::super_expression(type_arg_ptr type_arg, std::string label)
  : node_base(static_kind), type_arg(type_arg), label(std::move(label))
{  }

when_expression::when_expression(keyword_ptr when_keyword, keyword_ptr lpar, node_ptr subject, keyword_ptr rpar,
                                 const list_of<when_branch>& branches)
  : node_base(static_kind), when_keyword(when_keyword), lpar(lpar), subject(subject), rpar(rpar), branches(branches)
{
  expect_keyword(when_keyword, keyword_kind::when, "when_expression.when_keyword");
  expect_keyword(lpar, keyword_kind::lpar, "when_expression.lpar", true);
  expect_keyword(rpar, keyword_kind::rpar, "when_expression.rpar", true);
  expect_category(subject, node_category::expression, "when_expression.subject", true);
  expect((lpar == nullptr) == (subject == nullptr) && (rpar == nullptr) == (subject == nullptr),
         "when_expression", "a subject needs parentheses and parentheses need a subject");
  expect_all_present(branches, "when_expression.branches");
}

when_branch::when_branch(const list_of<when_condition>& conditions, keyword_ptr trailing_comma,
                         keyword_ptr else_keyword, node_ptr body)
  : node_base(static_kind), conditions(conditions), trailing_comma(trailing_comma), else_keyword(else_keyword),
    body(body)
{
  expect_all_present(conditions, "when_branch.conditions");
  expect_trailing_comma(trailing_comma, conditions.size(), "when_branch.trailing_comma");
  expect_keyword(else_keyword, keyword_kind::else_, "when_branch.else_keyword", true);
  if(conditions.empty())
    expect(else_keyword != nullptr, "when_branch", "a branch without conditions needs \"else\"");
  else
    expect(else_keyword == nullptr, "when_branch", "a branch with conditions cannot carry \"else\"");
  expect_category(body, node_category::expression, "when_branch.body");
}

when_condition::when_condition(keyword_ptr op, node_ptr expression, type_ref_ptr type_ref)
  : node_base(static_kind), op(op), expression(expression), type_ref(type_ref)
{
  expect_category(expression, node_category::expression, "when_condition.expression", true);
  if(op == nullptr)
  {
    expect(expression != nullptr && type_ref == nullptr, "when_condition",
           "a condition without operator holds exactly an expression");
  }
  else if(has_category(op->which, keyword_category::when_type_operator))
  {
    expect(expression == nullptr && type_ref != nullptr, "when_condition",
           "a type test holds exactly a type");
  }
  else
  {
    expect_keyword_category(op, keyword_category::when_range_operator, "when_condition.op");
    expect(expression != nullptr && type_ref == nullptr, "when_condition",
           "a range test holds exactly an expression");
  }
}

object_literal_expression::object_literal_expression(class_declaration_ptr declaration)
  : node_base(static_kind), declaration(declaration)
{
  expect_present(declaration, "object_literal_expression.declaration");
  expect(declaration->is_object(), "object_literal_expression", "the declaration must be an object");
}

throw_expression::throw_expression(node_ptr expression)
  : node_base(static_kind), expression(expression)
{ expect_category(expression, node_category::expression, "throw_expression.expression"); }

return_expression::return_expression(std::string label, node_ptr expression)
  : node_base(static_kind), label(std::move(label)), expression(expression)
{ expect_category(expression, node_category::expression, "return_expression.expression", true); }

continue_expression::continue_expression(std::string label)
  : node_base(static_kind), label(std::move(label))
{  }

break_expression::break_expression(std::string label)
  : node_base(static_kind), label(std::move(label))
{  }

collection_literal_expression::collection_literal_expression(const node_list& expressions, keyword_ptr trailing_comma)
  : node_base(static_kind), expressions(expressions), trailing_comma(trailing_comma)
{
  expect_categories(expressions, node_category::expression, "collection_literal_expression.expressions");
  expect_trailing_comma(trailing_comma, expressions.size(), "collection_literal_expression.trailing_comma");
}

name_expression::name_expression(std::string name)
  : node_base(static_kind), name(std::move(name))
{ expect(!this->name.empty(), "name_expression", "the name must not be empty"); }

labeled_expression::labeled_expression(std::string label, node_ptr expression)
  : node_base(static_kind), label(std::move(label)), expression(expression)
{
  expect(!this->label.empty(), "labeled_expression", "the label must not be empty");
  expect_category(expression, node_category::expression, "labeled_expression.expression");
}

annotated_expression::annotated_expression(const list_of<annotation_set>& annotation_sets, node_ptr expression)
  : node_base(static_kind), annotation_sets(annotation_sets), expression(expression)
{
  expect_non_empty(annotation_sets.size(), "annotated_expression.annotation_sets");
  expect_all_present(annotation_sets, "annotated_expression.annotation_sets");
  expect_category(expression, node_category::expression, "annotated_expression.expression");
}

call_expression::call_expression(node_ptr expression, type_args_ptr type_args, value_args_ptr args,
                                 lambda_arg_ptr lambda_arg)
  : node_base(static_kind), expression(expression), type_args(type_args), args(args), lambda_arg(lambda_arg)
{
  expect_category(expression, node_category::expression, "call_expression.expression");
  expect(args != nullptr || lambda_arg != nullptr || type_args != nullptr, "call_expression",
         "needs type arguments, arguments or a trailing lambda");
}

lambda_expression_ptr call_expression::lambda() const
{ return lambda_arg == nullptr ? nullptr : lambda_arg->expression; }

lambda_arg::lambda_arg(const list_of<annotation_set>& annotation_sets, std::string label,
                       lambda_expression_ptr expression)
  : node_base(static_kind), annotation_sets(annotation_sets), label(std::move(label)), expression(expression)
{
  expect_all_present(annotation_sets, "lambda_arg.annotation_sets");
  expect_present(expression, "lambda_arg.expression");
}

array_access_expression::array_access_expression(node_ptr expression, const node_list& indices,
                                                 keyword_ptr trailing_comma)
  : node_base(static_kind), expression(expression), indices(indices), trailing_comma(trailing_comma)
{
  expect_category(expression, node_category::expression, "array_access_expression.expression");
  expect_non_empty(indices.size(), "array_access_expression.indices");
  expect_categories(indices, node_category::expression, "array_access_expression.indices");
  expect_trailing_comma(trailing_comma, indices.size(), "array_access_expression.trailing_comma");
}

anonymous_function_expression::anonymous_function_expression(function_declaration_ptr function)
  : node_base(static_kind), function(function)
{
  expect_present(function, "anonymous_function_expression.function");
  expect(function->name == nullptr, "anonymous_function_expression", "the function must not have a name");
}

property_expression::property_expression(property_declaration_ptr declaration)
  : node_base(static_kind), declaration(declaration)
{ expect_present(declaration, "property_expression.declaration"); }

block_expression::block_expression(const node_list& statements)
  : node_base(static_kind), statements(statements)
{ expect_categories(statements, node_category::statement, "block_expression.statements"); }

////////////////////////////////////////////////////////////////////////////////

modifiers::modifiers(const node_list& elements)
  : node_base(static_kind), elements(elements)
{
  expect_non_empty(elements.size(), "modifiers.elements");
  expect_categories(elements, node_category::modifier, "modifiers.elements");
  for(auto& e : elements)
  {
    if(e->kind == node_kind::keyword)
      expect_keyword_category(as<keyword>(e), keyword_category::modifier, "modifiers.elements");
  }
}

bool modifiers::has(keyword_kind kind) const
{
  return std::any_of(elements.begin(), elements.end(), [kind](auto& e)
      { return e->kind == node_kind::keyword && as<keyword>(e)->which == kind; });
}

annotation_set::annotation_set(keyword_ptr at, keyword_ptr target, keyword_ptr colon, keyword_ptr lbracket,
                               const list_of<annotation>& annotations, keyword_ptr rbracket)
  : node_base(static_kind), at(at), target(target), colon(colon), lbracket(lbracket), annotations(annotations),
    rbracket(rbracket)
{
  expect_keyword(at, keyword_kind::at, "annotation_set.at", true);
  expect_keyword_category(target, keyword_category::annotation_target, "annotation_set.target", true);
  expect_keyword(colon, keyword_kind::colon, "annotation_set.colon", true);
  expect_keyword(lbracket, keyword_kind::lbracket, "annotation_set.lbracket", true);
  expect_keyword(rbracket, keyword_kind::rbracket, "annotation_set.rbracket", true);
  expect_all_present(annotations, "annotation_set.annotations");
  expect((lbracket == nullptr) == (rbracket == nullptr), "annotation_set", "brackets must be balanced");
  expect((target == nullptr) == (colon == nullptr), "annotation_set", "a target and \":\" must be present together");
  if(lbracket == nullptr)
    expect(annotations.size() == 1, "annotation_set", "without brackets exactly one annotation is allowed");
}

annotation::annotation(simple_type_ptr type, value_args_ptr args)
  : node_base(static_kind), type(type), args(args)
{ expect_present(type, "annotation.type"); }

type_constraint_set::type_constraint_set(keyword_ptr where_keyword, type_constraints_ptr constraints)
  : node_base(static_kind), where_keyword(where_keyword), constraints(constraints)
{
  expect_keyword(where_keyword, keyword_kind::where, "type_constraint_set.where_keyword");
  expect_present(constraints, "type_constraint_set.constraints");
}

type_constraints::type_constraints(const list_of<type_constraint>& elements)
  : node_base(static_kind), elements(elements)
{
  expect_non_empty(elements.size(), "type_constraints.elements");
  expect_all_present(elements, "type_constraints.elements");
}

type_constraint::type_constraint(const list_of<annotation_set>& annotation_sets, name_expression_ptr name,
                                 type_ref_ptr type_ref)
  : node_base(static_kind), annotation_sets(annotation_sets), name(name), type_ref(type_ref)
{
  expect_all_present(annotation_sets, "type_constraint.annotation_sets");
  expect_present(name, "type_constraint.name");
  expect_present(type_ref, "type_constraint.type_ref");
}

contract::contract(keyword_ptr contract_keyword, contract_effects_ptr effects)
  : node_base(static_kind), contract_keyword(contract_keyword), effects(effects)
{
  expect_keyword(contract_keyword, keyword_kind::contract, "contract.contract_keyword");
  expect_present(effects, "contract.effects");
}

contract_effects::contract_effects(const list_of<contract_effect>& elements, keyword_ptr trailing_comma)
  : node_base(static_kind), elements(elements), trailing_comma(trailing_comma)
{
  expect_all_present(elements, "contract_effects.elements");
  expect_trailing_comma(trailing_comma, elements.size(), "contract_effects.trailing_comma");
}

contract_effect::contract_effect(node_ptr expression)
  : node_base(static_kind), expression(expression)
{ expect_category(expression, node_category::expression, "contract_effect.expression"); }

////////////////////////////////////////////////////////////////////////////////

whitespace::whitespace(std::string text)
  : node_base(static_kind), text(std::move(text))
{ expect(!this->text.empty(), "whitespace", "the text must not be empty"); }

comment::comment(std::string text, bool starts_line, bool ends_line)
  : node_base(static_kind), text(std::move(text)), starts_line(starts_line), ends_line(ends_line)
{ expect(!this->text.empty(), "comment", "the text must not be empty"); }

blank_lines::blank_lines(std::size_t count)
  : node_base(static_kind), count(count)
{ expect(count > 0, "blank_lines", "the count must be positive"); }

std::string extra_text(const node_ptr& extra)
{
  switch(extra->kind)
  {
  case node_kind::whitespace: return as<whitespace>(extra)->text;
  case node_kind::comment: return as<comment>(extra)->text;
  case node_kind::semicolon: return ";";
  case node_kind::trailing_comma: return ",";
  case node_kind::blank_lines: return std::string(as<blank_lines>(extra)->count + 1, '\n');
  default:
    raise<internal_error>(diagnostic_db::visit::unhandled_kind(source_range{}, kind_name(extra->kind), "extra writer"));
  }
}

}
