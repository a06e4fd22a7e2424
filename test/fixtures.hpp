#pragma once

#include "raw_tree.hpp"

#include <converter.hpp>
#include <ast.hpp>

#include <string>

// Small sources converted by hand the way a parser adapter would.
namespace ktree::test
{

// `val <name> = <value>`
inline raw_ptr raw_property(const std::string& name, raw_ptr value)
{
  return node("PROPERTY", leaf("val", "val"), ws(" "), node("VARIABLE", leaf("IDENTIFIER", name)), ws(" "),
              leaf("EQ", "="), ws(" "), std::move(value));
}

inline variable_ptr convert_variable(extras_converter& c, raw_node& raw)
{
  auto name = c.make<name_expression>(&raw.at(0), std::string(raw.at(0).text()));
  return c.make<variable>(&raw, nullptr, name, nullptr);
}

inline property_declaration_ptr convert_property(extras_converter& c, raw_node& raw, node_ptr value)
{
  auto val = c.make_keyword(&raw.at(0), keyword_kind::val);
  auto var = convert_variable(c, raw.at(2));
  auto eq = c.make_keyword(&raw.at(4), keyword_kind::equal);
  return c.make<property_declaration>(&raw, nullptr, val, nullptr, nullptr, nullptr, list_of<variable> { var },
                                      nullptr, nullptr, nullptr, eq, value, nullptr, node_list {});
}

inline node_ptr convert_integer(extras_converter& c, raw_node& raw)
{ return c.make<constant_literal_expression>(&raw, std::string(raw.text()), constant_form::integer); }

// val x = 1; val y = 2
struct two_properties
{
  raw_ptr raw = node("FILE", raw_property("x", leaf("INTEGER_CONSTANT", "1")), semi(), ws(" "),
                     raw_property("y", leaf("INTEGER_CONSTANT", "2")));
  std::string source = raw->layout();
  extras_converter conv { "two_properties.kt", source };
  node_ptr root;

  two_properties()
  {
    auto& first = raw->at(0);
    auto& second = raw->at(3);
    auto x = convert_property(conv, first, convert_integer(conv, first.at(6)));
    auto y = convert_property(conv, second, convert_integer(conv, second.at(6)));
    root = conv.make<kotlin_file>(raw.get(), list_of<annotation_set> {}, nullptr, nullptr, node_list { x, y });
  }
};

// fun setup() {
//     // do something
// }
struct commented_function
{
  raw_ptr raw = node("FILE",
                     node("FUN", leaf("fun", "fun"), ws(" "), leaf("IDENTIFIER", "setup"),
                          node("VALUE_PARAMETER_LIST", tok("("), tok(")")), ws(" "),
                          node("BLOCK", tok("{"), ws("\n    "), cmt("// do something"), ws("\n"), tok("}"))));
  std::string source = raw->layout();
  extras_converter conv { "commented_function.kt", source };
  node_ptr root;
  block_expression_ptr body;

  commented_function()
  {
    auto& fun = raw->at(0);
    auto kw = conv.make_keyword(&fun.at(0), keyword_kind::fun);
    auto name = conv.make<name_expression>(&fun.at(2), "setup");
    auto params = conv.make<function_params>(&fun.at(3), list_of<function_param> {}, nullptr);
    body = conv.make<block_expression>(&fun.at(5), node_list {});
    auto decl = conv.make<function_declaration>(&fun, nullptr, kw, nullptr, nullptr, name, params, nullptr,
                                                node_list {}, nullptr, body);
    root = conv.make<kotlin_file>(raw.get(), list_of<annotation_set> {}, nullptr, nullptr, node_list { decl });
  }
};

// val x = "" // x is empty
struct commented_property
{
  raw_ptr raw = node("FILE",
                     [] {
                       auto p = raw_property("x", node("STRING_TEMPLATE", tok("\""), tok("\"")));
                       p->add(ws(" "));
                       p->add(cmt("// x is empty"));
                       return p;
                     }());
  std::string source = raw->layout();
  extras_converter conv { "commented_property.kt", source };
  node_ptr root;
  node_ptr literal;

  commented_property()
  {
    auto& prop = raw->at(0);
    literal = conv.make<string_literal_expression>(&prop.at(6), node_list {}, false);
    auto decl = convert_property(conv, prop, literal);
    root = conv.make<kotlin_file>(raw.get(), list_of<annotation_set> {}, nullptr, nullptr, node_list { decl });
  }
};

}
