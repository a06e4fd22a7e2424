#include <writer.hpp>
#include <ast.hpp>
#include <config.hpp>
#include <errors.hpp>
#include <keyword.hpp>
#include <node_util.hpp>
#include <diagnostic_db.hpp>

#include <algorithm>
#include <sstream>

namespace ktree
{

namespace
{

bool is_word_char(char c)
{
  const auto u = static_cast<unsigned char>(c);
  return u == '_' || (u >= '0' && u <= '9') || (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') || u >= 0x80;
}

template<typename T>
std::size_t index_in(const list_of<T>& list, const node_ptr& node)
{
  auto it = std::find(list.begin(), list.end(), node);
  return it == list.end() ? std::string::npos : static_cast<std::size_t>(it - list.begin());
}

bool follows_in(std::size_t index)
{ return index != std::string::npos && index > 0; }

// The statements or declarations `parent` holds one per line.
const node_list* statement_list(const node_ptr& parent)
{
  switch(parent->kind)
  {
  case node_kind::kotlin_file: return &as<kotlin_file>(parent)->declarations;
  case node_kind::kotlin_script: return &as<kotlin_script>(parent)->expressions;
  case node_kind::class_body: return &as<class_body>(parent)->declarations;
  case node_kind::block_expression: return &as<block_expression>(parent)->statements;
  case node_kind::lambda_body: return &as<lambda_body>(parent)->statements;
  default: return nullptr;
  }
}

bool has_package_or_imports(const node_ptr& parent)
{
  if(parent->kind == node_kind::kotlin_file)
  {
    auto f = as<kotlin_file>(parent);
    return f->package_directive != nullptr || f->import_directives != nullptr;
  }
  if(parent->kind == node_kind::kotlin_script)
  {
    auto s = as<kotlin_script>(parent);
    return s->package_directive != nullptr || s->import_directives != nullptr;
  }
  return false;
}

bool is_accessor_after_expression(const node_path& path)
{
  auto parent = path.parent_node();
  if(parent == nullptr || parent->kind != node_kind::property_declaration)
    return false;
  auto prop = as<property_declaration>(parent);
  const auto& accessors = prop->accessors;
  const auto index = index_in(accessors, path.node);
  if(index == 0)
    return prop->initializer != nullptr || prop->property_delegate != nullptr;
  if(index == 1)
  {
    auto& first = accessors.front();
    if(first->kind == node_kind::getter)
      return as<getter>(first)->equals != nullptr;
    return as<setter>(first)->equals != nullptr;
  }
  return false;
}

bool is_newline_sensitive_extra(const node_ptr& extra)
{
  switch(extra->kind)
  {
  case node_kind::whitespace: return as<whitespace>(extra)->text.find('\n') != std::string::npos;
  case node_kind::blank_lines:
  case node_kind::semicolon:
    return true;
  default:
    return false;
  }
}

}

writer::writer(std::ostream& os, const extras_map* extras)
  : os(os), extras(extras)
{
  space_rules = {
    // `>` directly followed by `=` would read as `>=`
    [](char last, char next) { return last == '>' && next == '='; },
    [](char last, char next) { return is_word_char(last) && is_word_char(next); },
    [](char last, char next) { return last == next && (last == '+' || last == '-' || last == '!'); },
  };

  newline_rules = {
    [](const node_path& path)
    {
      auto parent = path.parent_node();
      auto list = parent == nullptr ? nullptr : statement_list(parent);
      return list != nullptr && follows_in(index_in(*list, path.node));
    },
    [](const node_path& path)
    {
      auto parent = path.parent_node();
      return parent != nullptr && parent->kind == node_kind::import_directives
          && follows_in(index_in(as<import_directives>(parent)->elements, path.node));
    },
    [](const node_path& path)
    {
      auto parent = path.parent_node();
      if(parent == nullptr || !has_package_or_imports(parent))
        return false;
      auto list = statement_list(parent);
      return list != nullptr && index_in(*list, path.node) == 0;
    },
    [](const node_path& path)
    {
      auto parent = path.parent_node();
      return path.node->kind == node_kind::import_directives && parent != nullptr
          && parent->kind == node_kind::kotlin_file && as<kotlin_file>(parent)->package_directive != nullptr;
    },
    [](const node_path& path)
    {
      auto parent = path.parent_node();
      return parent != nullptr && parent->kind == node_kind::when_expression
          && follows_in(index_in(as<when_expression>(parent)->branches, path.node));
    },
    is_accessor_after_expression,
    // An annotated binary expression would otherwise read as a binary expression of an annotated operand.
    [](const node_path& path)
    {
      auto parent = path.parent_node();
      return parent != nullptr && parent->kind == node_kind::annotated_expression
          && (path.node->kind == node_kind::binary_expression || path.node->kind == node_kind::binary_type_expression);
    },
  };

  separator_rules = {
    [](const node_path& child, const node_ptr& next)
    {
      auto parent = child.parent_node();
      if(next == nullptr || parent == nullptr || statement_list(parent) == nullptr)
        return false;
      return child.node->kind == node_kind::name_expression && is_modifier_text(as<name_expression>(child.node)->name)
          && is_declaration(next->kind);
    },
    [](const node_path& child, const node_ptr& next)
    {
      if(next == nullptr || child.node->kind != node_kind::call_expression)
        return false;
      return as<call_expression>(child.node)->lambda_arg == nullptr && lambda_expression_of(next) != nullptr;
    },
  };
}

std::string writer::write(const node_ptr& root, const extras_map* extras)
{
  std::stringstream ss;
  writer w(ss, extras);
  w.print(root);
  return ss.str();
}

void writer::print(const node_ptr& root)
{
  extras_since_last.clear();
  space_requested = false;
  last_char = '\0';
  within_written.clear();
  traverse(root);
}

bool writer::heuristics_enabled() const
{ return extras == nullptr || config.writing == write_mode::heuristic; }

void writer::append(std::string_view text)
{
  if(text.empty())
    return;
  if(heuristics_enabled())
  {
    const char next = text.front();
    if(std::any_of(space_rules.begin(), space_rules.end(), [this, next](const space_rule& r) { return r(last_char, next); }))
      do_append(" ");
  }
  do_append(text);
}

void writer::do_append(std::string_view text)
{
  if(text.empty())
    return;
  os << text;
  last_char = text.back();
}

void writer::visit(const node_path& path)
{
  if(is_extra(path.node->kind))
    raise<internal_error>(diagnostic_db::visit::extra_as_child(source_range{}, kind_name(path.node->kind)));

  write_extras_before(path);
  write_heuristic_newline(path);
  write_heuristic_space();

  within_written.push_back(false);
  write_content(path);
  const bool within_done = within_written.back();
  within_written.pop_back();
  if(!within_done)
    write_extras_within(path);

  write_extras_after(path);
}

void writer::write_extras_before(const node_path& path)
{
  if(extras != nullptr)
    write_extras(extras->before(path.node));
}

void writer::write_extras_within(const node_path& path)
{
  if(!within_written.empty())
    within_written.back() = true;
  if(extras != nullptr)
    write_extras(extras->within(path.node));
}

void writer::write_extras_after(const node_path& path)
{
  if(extras != nullptr)
    write_extras(extras->after(path.node));
}

void writer::write_extras(const extra_list& list)
{
  for(auto& e : list)
  {
    append(extra_text(e));
    extras_since_last.push_back(e);
  }
}

bool writer::extras_contain_newline_or_semicolon() const
{ return std::any_of(extras_since_last.begin(), extras_since_last.end(), is_newline_sensitive_extra); }

bool writer::extras_contain_semicolon() const
{
  return std::any_of(extras_since_last.begin(), extras_since_last.end(),
                     [](const node_ptr& e) { return e->kind == node_kind::semicolon; });
}

void writer::write_heuristic_newline(const node_path& path)
{
  if(!heuristics_enabled() || extras_contain_newline_or_semicolon())
    return;
  if(std::any_of(newline_rules.begin(), newline_rules.end(), [&path](const newline_rule& r) { return r(path); }))
  {
    append("\n");
    space_requested = false;
  }
}

void writer::write_heuristic_space()
{
  if(space_requested && extras_since_last.empty() && heuristics_enabled())
    append(" ");
  space_requested = false;
  extras_since_last.clear();
}

void writer::write_separator_after(const node_path& child, const node_ptr& next)
{
  if(!heuristics_enabled() || extras_contain_semicolon())
    return;
  if(std::any_of(separator_rules.begin(), separator_rules.end(),
                 [&child, &next](const separator_rule& r) { return r(child, next); }))
    append(";");
}

template<typename T>
void writer::children(const node_path& path, const list_of<T>& list, std::string_view sep)
{
  for(std::size_t i = 0; i < list.size(); ++i)
  {
    auto child_path = path.child_path(list[i]);
    visit(child_path);
    const bool has_next = i + 1 < list.size();
    if(has_next)
      append(sep);
    write_separator_after(child_path, has_next ? node_ptr(list[i + 1]) : nullptr);
  }
}

template<typename T>
void writer::delimited(const node_path& path, std::string_view open, const list_of<T>& list,
                       const node_ptr& comma, std::string_view close)
{
  append(open);
  children(path, list, ",");
  visit_child(path, comma);
  write_extras_within(path);
  append(close);
}

void writer::block(const node_path& path, const node_list& statements)
{
  append("{");
  children(path, statements);
  write_extras_within(path);
  append("}");
}

void writer::label(const std::string& text)
{
  if(text.empty())
    return;
  append("@");
  append(text);
}

void writer::write_content(const node_path& path)
{
  const node_ptr& node = path.node;
  switch(node->kind)
  {
  case node_kind::kotlin_file:
    {
      auto n = as<kotlin_file>(node);
      children(path, n->annotation_sets);
      visit_child(path, n->package_directive);
      visit_child(path, n->import_directives);
      children(path, n->declarations);
      write_extras_within(path);
    } break;
  case node_kind::kotlin_script:
    {
      auto n = as<kotlin_script>(node);
      children(path, n->annotation_sets);
      visit_child(path, n->package_directive);
      visit_child(path, n->import_directives);
      children(path, n->expressions);
      write_extras_within(path);
    } break;
  case node_kind::package_directive:
    {
      auto n = as<package_directive>(node);
      visit_child(path, n->modifiers);
      visit_child(path, n->package_keyword);
      children(path, n->names, ".");
    } break;
  case node_kind::import_directives:
    children(path, as<import_directives>(node)->elements);
    break;
  case node_kind::import_directive:
    {
      auto n = as<import_directive>(node);
      visit_child(path, n->import_keyword);
      children(path, n->names, ".");
      visit_child(path, n->import_alias);
    } break;
  case node_kind::import_alias:
    append("as");
    visit_child(path, as<import_alias>(node)->name);
    break;

  case node_kind::class_declaration:
    {
      auto n = as<class_declaration>(node);
      visit_child(path, n->modifiers);
      visit_child(path, n->declaration_keyword);
      visit_child(path, n->name);
      visit_child(path, n->type_params);
      visit_child(path, n->primary_constructor);
      if(n->class_parents != nullptr)
      {
        append(":");
        visit_child(path, n->class_parents);
      }
      visit_child(path, n->type_constraint_set);
      visit_child(path, n->class_body);
    } break;
  case node_kind::class_parents:
    children(path, as<class_parents>(node)->elements, ",");
    break;
  case node_kind::call_constructor_parent:
    {
      auto n = as<call_constructor_parent>(node);
      visit_child(path, n->type);
      visit_child(path, n->args);
      visit_child(path, n->lambda_arg);
    } break;
  case node_kind::delegated_type_parent:
    {
      auto n = as<delegated_type_parent>(node);
      visit_child(path, n->type);
      visit_child(path, n->by_keyword);
      visit_child(path, n->expression);
    } break;
  case node_kind::type_parent:
    visit_child(path, as<type_parent>(node)->type);
    break;
  case node_kind::primary_constructor:
    {
      auto n = as<primary_constructor>(node);
      visit_child(path, n->modifiers);
      visit_child(path, n->constructor_keyword);
      visit_child(path, n->params);
    } break;
  case node_kind::class_body:
    {
      auto n = as<class_body>(node);
      append("{");
      children(path, n->enum_entries, ",");
      if(n->enum_trailing_comma)
        append(",");
      if(!n->enum_entries.empty() && !n->declarations.empty() && heuristics_enabled() && !extras_contain_semicolon())
      {
        const bool semicolon_follows = extras != nullptr && std::any_of(
            extras->before(n->declarations.front()).begin(), extras->before(n->declarations.front()).end(),
            [](const node_ptr& e) { return e->kind == node_kind::semicolon; });
        if(!semicolon_follows)
          append(";");
      }
      children(path, n->declarations);
      write_extras_within(path);
      append("}");
    } break;
  case node_kind::enum_entry:
    {
      auto n = as<enum_entry>(node);
      visit_child(path, n->modifiers);
      visit_child(path, n->name);
      visit_child(path, n->args);
      visit_child(path, n->class_body);
    } break;
  case node_kind::init_declaration:
    {
      auto n = as<init_declaration>(node);
      visit_child(path, n->modifiers);
      append("init");
      visit_child(path, n->block);
    } break;
  case node_kind::function_declaration:
    {
      auto n = as<function_declaration>(node);
      visit_child(path, n->modifiers);
      visit_child(path, n->fun_keyword);
      visit_child(path, n->type_params);
      if(n->receiver_type_ref != nullptr)
      {
        visit_child(path, n->receiver_type_ref);
        append(".");
      }
      visit_child(path, n->name);
      visit_child(path, n->params);
      if(n->type_ref != nullptr)
      {
        append(":");
        visit_child(path, n->type_ref);
      }
      children(path, n->post_modifiers);
      visit_child(path, n->equals);
      visit_child(path, n->body);
    } break;
  case node_kind::function_params:
    {
      auto n = as<function_params>(node);
      delimited(path, "(", n->elements, n->trailing_comma, ")");
    } break;
  case node_kind::function_param:
    {
      auto n = as<function_param>(node);
      visit_child(path, n->modifiers);
      visit_child(path, n->val_or_var);
      visit_child(path, n->name);
      if(n->type_ref != nullptr)
      {
        append(":");
        visit_child(path, n->type_ref);
      }
      visit_child(path, n->equals);
      visit_child(path, n->default_value);
    } break;
  case node_kind::property_declaration:
    {
      auto n = as<property_declaration>(node);
      visit_child(path, n->modifiers);
      visit_child(path, n->val_or_var);
      visit_child(path, n->type_params);
      if(n->receiver_type_ref != nullptr)
      {
        visit_child(path, n->receiver_type_ref);
        append(".");
      }
      visit_child(path, n->lpar);
      children(path, n->variables, ",");
      visit_child(path, n->trailing_comma);
      visit_child(path, n->rpar);
      visit_child(path, n->type_constraint_set);
      visit_child(path, n->equals);
      visit_child(path, n->initializer);
      visit_child(path, n->property_delegate);
      children(path, n->accessors);
    } break;
  case node_kind::property_delegate:
    {
      auto n = as<property_delegate>(node);
      visit_child(path, n->by_keyword);
      visit_child(path, n->expression);
    } break;
  case node_kind::variable:
    {
      auto n = as<variable>(node);
      visit_child(path, n->modifiers);
      visit_child(path, n->name);
      if(n->type_ref != nullptr)
      {
        append(":");
        visit_child(path, n->type_ref);
      }
    } break;
  case node_kind::getter:
    {
      auto n = as<getter>(node);
      visit_child(path, n->modifiers);
      visit_child(path, n->get_keyword);
      visit_child(path, n->lpar);
      visit_child(path, n->rpar);
      if(n->type_ref != nullptr)
      {
        append(":");
        visit_child(path, n->type_ref);
      }
      children(path, n->post_modifiers);
      visit_child(path, n->equals);
      visit_child(path, n->body);
    } break;
  case node_kind::setter:
    {
      auto n = as<setter>(node);
      visit_child(path, n->modifiers);
      visit_child(path, n->set_keyword);
      visit_child(path, n->params);
      children(path, n->post_modifiers);
      visit_child(path, n->equals);
      visit_child(path, n->body);
    } break;
  case node_kind::type_alias_declaration:
    {
      auto n = as<type_alias_declaration>(node);
      visit_child(path, n->modifiers);
      append("typealias");
      visit_child(path, n->name);
      visit_child(path, n->type_params);
      append("=");
      visit_child(path, n->type_ref);
    } break;
  case node_kind::secondary_constructor_declaration:
    {
      auto n = as<secondary_constructor_declaration>(node);
      visit_child(path, n->modifiers);
      visit_child(path, n->constructor_keyword);
      visit_child(path, n->params);
      if(n->delegation_call != nullptr)
      {
        append(":");
        visit_child(path, n->delegation_call);
      }
      visit_child(path, n->block);
    } break;
  case node_kind::delegation_call:
    {
      auto n = as<delegation_call>(node);
      visit_child(path, n->target);
      visit_child(path, n->args);
    } break;
  case node_kind::type_params:
    {
      auto n = as<type_params>(node);
      delimited(path, "<", n->elements, n->trailing_comma, ">");
    } break;
  case node_kind::type_param:
    {
      auto n = as<type_param>(node);
      visit_child(path, n->modifiers);
      visit_child(path, n->name);
      if(n->type_ref != nullptr)
      {
        append(":");
        visit_child(path, n->type_ref);
      }
    } break;

  case node_kind::function_type:
    {
      auto n = as<function_type>(node);
      visit_child(path, n->context_receivers);
      visit_child(path, n->receiver);
      visit_child(path, n->params);
      append("->");
      visit_child(path, n->return_type_ref);
    } break;
  case node_kind::context_receivers:
    {
      auto n = as<context_receivers>(node);
      append("context");
      delimited(path, "(", n->elements, n->trailing_comma, ")");
    } break;
  case node_kind::context_receiver:
    visit_child(path, as<context_receiver>(node)->type_ref);
    break;
  case node_kind::function_type_receiver:
    visit_child(path, as<function_type_receiver>(node)->type_ref);
    append(".");
    break;
  case node_kind::function_type_params:
    {
      auto n = as<function_type_params>(node);
      delimited(path, "(", n->elements, n->trailing_comma, ")");
    } break;
  case node_kind::function_type_param:
    {
      auto n = as<function_type_param>(node);
      if(n->name != nullptr)
      {
        visit_child(path, n->name);
        append(":");
      }
      visit_child(path, n->type_ref);
    } break;
  case node_kind::simple_type:
    {
      auto n = as<simple_type>(node);
      children(path, n->qualifiers, ".");
      if(!n->qualifiers.empty())
        append(".");
      visit_child(path, n->name);
      visit_child(path, n->type_args);
    } break;
  case node_kind::simple_type_qualifier:
    {
      auto n = as<simple_type_qualifier>(node);
      visit_child(path, n->name);
      visit_child(path, n->type_args);
    } break;
  case node_kind::nullable_type:
    {
      auto n = as<nullable_type>(node);
      visit_child(path, n->lpar);
      visit_child(path, n->modifiers);
      visit_child(path, n->type);
      visit_child(path, n->rpar);
      append("?");
    } break;
  case node_kind::dynamic_type:
    append("dynamic");
    break;
  case node_kind::type_args:
    {
      auto n = as<type_args>(node);
      delimited(path, "<", n->elements, n->trailing_comma, ">");
    } break;
  case node_kind::type_arg:
    {
      auto n = as<type_arg>(node);
      visit_child(path, n->modifiers);
      if(n->asterisk)
        append("*");
      else
        visit_child(path, n->type_ref);
    } break;
  case node_kind::type_ref:
    {
      auto n = as<type_ref>(node);
      visit_child(path, n->lpar);
      visit_child(path, n->modifiers);
      visit_child(path, n->type);
      visit_child(path, n->rpar);
    } break;
  case node_kind::value_args:
    {
      auto n = as<value_args>(node);
      delimited(path, "(", n->elements, n->trailing_comma, ")");
    } break;
  case node_kind::value_arg:
    {
      auto n = as<value_arg>(node);
      if(n->name != nullptr)
      {
        visit_child(path, n->name);
        append("=");
      }
      if(n->asterisk)
        append("*");
      visit_child(path, n->expression);
    } break;

  case node_kind::if_expression:
    {
      auto n = as<if_expression>(node);
      visit_child(path, n->if_keyword);
      append("(");
      visit_child(path, n->condition);
      append(")");
      visit_child(path, n->body);
      if(n->else_body != nullptr)
      {
        append("else");
        visit_child(path, n->else_body);
      }
    } break;
  case node_kind::try_expression:
    {
      auto n = as<try_expression>(node);
      append("try");
      visit_child(path, n->block);
      children(path, n->catch_clauses);
      if(n->finally_block != nullptr)
      {
        append("finally");
        visit_child(path, n->finally_block);
      }
    } break;
  case node_kind::catch_clause:
    {
      auto n = as<catch_clause>(node);
      visit_child(path, n->catch_keyword);
      visit_child(path, n->params);
      visit_child(path, n->block);
    } break;
  case node_kind::for_expression:
    {
      auto n = as<for_expression>(node);
      visit_child(path, n->for_keyword);
      append("(");
      visit_child(path, n->loop_param);
      append("in");
      visit_child(path, n->loop_range);
      append(")");
      visit_child(path, n->body);
    } break;
  case node_kind::while_expression:
    {
      auto n = as<while_expression>(node);
      if(n->do_while)
      {
        append("do");
        visit_child(path, n->body);
      }
      visit_child(path, n->while_keyword);
      append("(");
      visit_child(path, n->condition);
      append(")");
      if(!n->do_while)
        visit_child(path, n->body);
    } break;
  case node_kind::binary_expression:
    {
      auto n = as<binary_expression>(node);
      visit_child(path, n->lhs);
      visit_child(path, n->op);
      visit_child(path, n->rhs);
    } break;
  case node_kind::binary_infix_expression:
    {
      auto n = as<binary_infix_expression>(node);
      visit_child(path, n->lhs);
      visit_child(path, n->op);
      visit_child(path, n->rhs);
    } break;
  case node_kind::unary_expression:
    {
      auto n = as<unary_expression>(node);
      if(n->prefix)
        visit_child(path, n->op);
      visit_child(path, n->expression);
      if(!n->prefix)
        visit_child(path, n->op);
    } break;
  case node_kind::binary_type_expression:
    {
      auto n = as<binary_type_expression>(node);
      visit_child(path, n->lhs);
      visit_child(path, n->op);
      visit_child(path, n->rhs);
    } break;
  case node_kind::callable_reference_expression:
    {
      auto n = as<callable_reference_expression>(node);
      visit_child(path, n->lhs);
      append("::");
      visit_child(path, n->rhs);
    } break;
  case node_kind::class_literal_expression:
    visit_child(path, as<class_literal_expression>(node)->lhs);
    append("::");
    append("class");
    break;
  case node_kind::expression_receiver:
    visit_child(path, as<expression_receiver>(node)->expression);
    break;
  case node_kind::type_receiver:
    {
      auto n = as<type_receiver>(node);
      visit_child(path, n->type);
      for(std::size_t i = 0; i < n->question_marks; ++i)
        append("?");
    } break;
  case node_kind::parenthesized_expression:
    append("(");
    visit_child(path, as<parenthesized_expression>(node)->inner_expression);
    write_extras_within(path);
    append(")");
    break;
  case node_kind::string_literal_expression:
    {
      auto n = as<string_literal_expression>(node);
      const std::string_view quote = n->raw ? "\"\"\"" : "\"";
      append(quote);
      children(path, n->entries);
      write_extras_within(path);
      do_append(quote);
    } break;
  case node_kind::literal_string_entry:
    do_append(as<literal_string_entry>(node)->text);
    break;
  case node_kind::escape_string_entry:
    do_append(as<escape_string_entry>(node)->text);
    break;
  case node_kind::template_string_entry:
    {
      auto n = as<template_string_entry>(node);
      do_append(n->short_template ? "$" : "${");
      visit_child(path, n->expression);
      if(!n->short_template)
        do_append("}");
    } break;
  case node_kind::constant_literal_expression:
    append(as<constant_literal_expression>(node)->value);
    break;
  case node_kind::lambda_expression:
    {
      auto n = as<lambda_expression>(node);
      append("{");
      visit_child(path, n->params);
      visit_child(path, n->arrow);
      visit_child(path, n->lambda_body);
      write_extras_within(path);
      append("}");
    } break;
  case node_kind::lambda_params:
    {
      auto n = as<lambda_params>(node);
      children(path, n->elements, ",");
      visit_child(path, n->trailing_comma);
    } break;
  case node_kind::lambda_param:
    {
      auto n = as<lambda_param>(node);
      visit_child(path, n->lpar);
      children(path, n->variables, ",");
      visit_child(path, n->trailing_comma);
      visit_child(path, n->rpar);
      visit_child(path, n->colon);
      visit_child(path, n->destruct_type_ref);
    } break;
  case node_kind::lambda_body:
    children(path, as<lambda_body>(node)->statements);
    break;
  case node_kind::this_expression:
    append("this");
    label(as<this_expression>(node)->label);
    break;
  case node_kind::super_expression:
    {
      auto n = as<super_expression>(node);
      append("super");
      if(n->type_arg != nullptr)
      {
        append("<");
        visit_child(path, n->type_arg);
        append(">");
      }
      label(n->label);
    } break;
  case node_kind::when_expression:
    {
      auto n = as<when_expression>(node);
      visit_child(path, n->when_keyword);
      visit_child(path, n->lpar);
      visit_child(path, n->subject);
      visit_child(path, n->rpar);
      block(path, node_list(n->branches.begin(), n->branches.end()));
    } break;
  case node_kind::when_branch:
    {
      auto n = as<when_branch>(node);
      children(path, n->conditions, ",");
      visit_child(path, n->trailing_comma);
      visit_child(path, n->else_keyword);
      append("->");
      visit_child(path, n->body);
    } break;
  case node_kind::when_condition:
    {
      auto n = as<when_condition>(node);
      visit_child(path, n->op);
      visit_child(path, n->expression);
      visit_child(path, n->type_ref);
    } break;
  case node_kind::object_literal_expression:
    visit_child(path, as<object_literal_expression>(node)->declaration);
    break;
  case node_kind::throw_expression:
    append("throw");
    visit_child(path, as<throw_expression>(node)->expression);
    break;
  case node_kind::return_expression:
    {
      auto n = as<return_expression>(node);
      append("return");
      label(n->label);
      visit_child(path, n->expression);
    } break;
  case node_kind::continue_expression:
    append("continue");
    label(as<continue_expression>(node)->label);
    break;
  case node_kind::break_expression:
    append("break");
    label(as<break_expression>(node)->label);
    break;
  case node_kind::collection_literal_expression:
    {
      auto n = as<collection_literal_expression>(node);
      delimited(path, "[", n->expressions, n->trailing_comma, "]");
    } break;
  case node_kind::name_expression:
    append(as<name_expression>(node)->name);
    break;
  case node_kind::labeled_expression:
    {
      auto n = as<labeled_expression>(node);
      append(n->label);
      append("@");
      visit_child(path, n->expression);
    } break;
  case node_kind::annotated_expression:
    {
      auto n = as<annotated_expression>(node);
      children(path, n->annotation_sets);
      visit_child(path, n->expression);
    } break;
  case node_kind::call_expression:
    {
      auto n = as<call_expression>(node);
      visit_child(path, n->expression);
      visit_child(path, n->type_args);
      visit_child(path, n->args);
      visit_child(path, n->lambda_arg);
    } break;
  case node_kind::lambda_arg:
    {
      auto n = as<lambda_arg>(node);
      children(path, n->annotation_sets);
      if(!n->label.empty())
      {
        append(n->label);
        append("@");
      }
      visit_child(path, n->expression);
    } break;
  case node_kind::array_access_expression:
    {
      auto n = as<array_access_expression>(node);
      visit_child(path, n->expression);
      delimited(path, "[", n->indices, n->trailing_comma, "]");
    } break;
  case node_kind::anonymous_function_expression:
    visit_child(path, as<anonymous_function_expression>(node)->function);
    break;
  case node_kind::property_expression:
    visit_child(path, as<property_expression>(node)->declaration);
    break;
  case node_kind::block_expression:
    block(path, as<block_expression>(node)->statements);
    break;

  case node_kind::modifiers:
    children(path, as<modifiers>(node)->elements);
    break;
  case node_kind::annotation_set:
    {
      auto n = as<annotation_set>(node);
      visit_child(path, n->at);
      visit_child(path, n->target);
      visit_child(path, n->colon);
      visit_child(path, n->lbracket);
      children(path, n->annotations);
      visit_child(path, n->rbracket);
    } break;
  case node_kind::annotation:
    {
      auto n = as<annotation>(node);
      visit_child(path, n->type);
      visit_child(path, n->args);
      auto parent = path.parent_node();
      if(parent != nullptr && parent->kind == node_kind::annotation_set && as<annotation_set>(parent)->rbracket == nullptr)
        space_requested = true;
    } break;
  case node_kind::type_constraint_set:
    {
      auto n = as<type_constraint_set>(node);
      visit_child(path, n->where_keyword);
      visit_child(path, n->constraints);
    } break;
  case node_kind::type_constraints:
    children(path, as<type_constraints>(node)->elements, ",");
    break;
  case node_kind::type_constraint:
    {
      auto n = as<type_constraint>(node);
      children(path, n->annotation_sets);
      visit_child(path, n->name);
      append(":");
      visit_child(path, n->type_ref);
    } break;
  case node_kind::contract:
    {
      auto n = as<contract>(node);
      visit_child(path, n->contract_keyword);
      visit_child(path, n->effects);
    } break;
  case node_kind::contract_effects:
    {
      auto n = as<contract_effects>(node);
      delimited(path, "[", n->elements, n->trailing_comma, "]");
    } break;
  case node_kind::contract_effect:
    visit_child(path, as<contract_effect>(node)->expression);
    break;

  case node_kind::keyword:
    append(as<keyword>(node)->text());
    break;

  default:
    raise<internal_error>(diagnostic_db::visit::unhandled_kind(source_range{}, kind_name(node->kind), "writer"));
  }
}

}
