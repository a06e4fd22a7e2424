#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <ast.hpp>
#include <errors.hpp>
#include <keyword.hpp>
#include <node_util.hpp>
#include <child_slots.hpp>

using namespace ktree;

static keyword_ptr kw(keyword_kind k) { return mk<keyword>(k); }
static name_expression_ptr name(const char* n) { return mk<name_expression>(n); }
static variable_ptr var(const char* n) { return mk<variable>(nullptr, name(n), nullptr); }

static node_ptr integer(const char* v)
{ return mk<constant_literal_expression>(v, constant_form::integer); }

TEST_CASE( "keywords", "[keyword]" ) {
  REQUIRE(keyword_from_text("val") == keyword_kind::val);
  REQUIRE(keyword_from_text("..<") == keyword_kind::range_until);
  REQUIRE_FALSE(keyword_from_text("nope").has_value());

  REQUIRE(keyword_text(keyword_kind::excl_excl) == "!!");
  REQUIRE(has_category(keyword_kind::in, keyword_category::when_range_operator));
  REQUIRE(has_category(keyword_kind::in, keyword_category::modifier));
  REQUIRE_FALSE(has_category(keyword_kind::as, keyword_category::binary_operator));

  REQUIRE(is_modifier_text("data"));
  REQUIRE(is_modifier_text("suspend"));
  REQUIRE_FALSE(is_modifier_text("x"));
}

TEST_CASE( "identity", "[node]" ) {
  auto a = name("a");
  auto b = name("a");
  REQUIRE(a->id != b->id);
  REQUIRE(structurally_equal(a, b));

  name_expression copy(*a);
  REQUIRE(copy.id != a->id);
  REQUIRE(copy.name == "a");

  REQUIRE_FALSE(structurally_equal(a, name("b")));
  REQUIRE_FALSE(structurally_equal(a, integer("1")));
}

TEST_CASE( "categories and names", "[node]" ) {
  REQUIRE(is_expression(node_kind::when_expression));
  REQUIRE(is_declaration(node_kind::property_declaration));
  REQUIRE(is_statement(node_kind::property_declaration));
  REQUIRE(is_statement(node_kind::name_expression));
  REQUIRE_FALSE(is_statement(node_kind::when_branch));
  REQUIRE(is_type(node_kind::nullable_type));
  REQUIRE(is_extra(node_kind::blank_lines));
  REQUIRE_FALSE(is_extra(node_kind::keyword));

  REQUIRE(std::string(kind_name(node_kind::name_expression)) == "expression.name_expression");
  REQUIRE(std::string(kind_name(node_kind::whitespace)) == "extra.whitespace");
}

TEST_CASE( "property invariants", "[node][invariant]" ) {
  SECTION( "two variables need parentheses" ) {
    REQUIRE_THROWS_AS(mk<property_declaration>(nullptr, kw(keyword_kind::val), nullptr, nullptr, nullptr,
                                               list_of<variable> { var("a"), var("b") }, nullptr, nullptr, nullptr,
                                               kw(keyword_kind::equal), name("pair"), nullptr, node_list {}),
                      invariant_violation);
  }
  SECTION( "destructuring with parentheses" ) {
    auto p = mk<property_declaration>(nullptr, kw(keyword_kind::val), nullptr, nullptr, kw(keyword_kind::lpar),
                                      list_of<variable> { var("a"), var("b") }, kw(keyword_kind::comma),
                                      kw(keyword_kind::rpar), nullptr, kw(keyword_kind::equal), name("pair"),
                                      nullptr, node_list {});
    REQUIRE(p->variables.size() == 2);
  }
  SECTION( "single variable cannot be parenthesized" ) {
    REQUIRE_THROWS_AS(mk<property_declaration>(nullptr, kw(keyword_kind::val), nullptr, nullptr,
                                               kw(keyword_kind::lpar), list_of<variable> { var("a") }, nullptr,
                                               kw(keyword_kind::rpar), nullptr, nullptr, nullptr, nullptr,
                                               node_list {}),
                      invariant_violation);
  }
  SECTION( "equals without initializer" ) {
    REQUIRE_THROWS_AS(mk<property_declaration>(nullptr, kw(keyword_kind::val), nullptr, nullptr, nullptr,
                                               list_of<variable> { var("a") }, nullptr, nullptr, nullptr,
                                               kw(keyword_kind::equal), nullptr, nullptr, node_list {}),
                      invariant_violation);
  }
  SECTION( "wrong keyword for val_or_var" ) {
    REQUIRE_THROWS_AS(mk<property_declaration>(nullptr, kw(keyword_kind::fun), nullptr, nullptr, nullptr,
                                               list_of<variable> { var("a") }, nullptr, nullptr, nullptr,
                                               nullptr, nullptr, nullptr, node_list {}),
                      invariant_violation);
  }
  SECTION( "two getters" ) {
    auto get = [] { return mk<getter>(nullptr, kw(keyword_kind::get), nullptr, nullptr, nullptr, node_list {},
                                      nullptr, nullptr); };
    REQUIRE_THROWS_AS(mk<property_declaration>(nullptr, kw(keyword_kind::val), nullptr, nullptr, nullptr,
                                               list_of<variable> { var("a") }, nullptr, nullptr, nullptr,
                                               nullptr, nullptr, nullptr, node_list { get(), get() }),
                      invariant_violation);
  }
  SECTION( "delegate and initializer together" ) {
    REQUIRE_THROWS_AS(mk<property_declaration>(nullptr, kw(keyword_kind::val), nullptr, nullptr, nullptr,
                                               list_of<variable> { var("a") }, nullptr, nullptr, nullptr,
                                               kw(keyword_kind::equal), integer("1"),
                                               mk<property_delegate>(kw(keyword_kind::by), name("lazy")),
                                               node_list {}),
                      invariant_violation);
  }
}

TEST_CASE( "accessor invariants", "[node][invariant]" ) {
  auto params = [] {
    return mk<function_params>(list_of<function_param> {
      mk<function_param>(nullptr, nullptr, name("v"), nullptr, nullptr, nullptr) }, nullptr);
  };

  SECTION( "setter parameter without a body" ) {
    REQUIRE_THROWS_AS(mk<setter>(nullptr, kw(keyword_kind::set), params(), node_list {}, nullptr, nullptr),
                      invariant_violation);
  }
  SECTION( "setter body without a parameter" ) {
    REQUIRE_THROWS_AS(mk<setter>(nullptr, kw(keyword_kind::set), nullptr, node_list {}, nullptr,
                                 mk<block_expression>(node_list {})),
                      invariant_violation);
  }
  SECTION( "setter with both or neither" ) {
    REQUIRE_NOTHROW(mk<setter>(nullptr, kw(keyword_kind::set), nullptr, node_list {}, nullptr, nullptr));
    REQUIRE_NOTHROW(mk<setter>(nullptr, kw(keyword_kind::set), params(), node_list {}, nullptr,
                               mk<block_expression>(node_list {})));
  }
}

TEST_CASE( "type argument invariants", "[node][invariant]" ) {
  auto int_type = [] {
    return mk<type_ref>(nullptr, nullptr, mk<simple_type>(list_of<simple_type_qualifier> {}, name("Int"), nullptr),
                        nullptr);
  };

  SECTION( "asterisk and type together" ) {
    REQUIRE_THROWS_AS(mk<type_arg>(nullptr, int_type(), true), invariant_violation);
  }
  SECTION( "neither asterisk nor type" ) {
    REQUIRE_THROWS_AS(mk<type_arg>(nullptr, nullptr, false), invariant_violation);
  }
  SECTION( "one of them" ) {
    REQUIRE(mk<type_arg>(nullptr, nullptr, true)->asterisk);
    REQUIRE(mk<type_arg>(nullptr, int_type(), false)->type_ref != nullptr);
  }
}

TEST_CASE( "when invariants", "[node][invariant]" ) {
  auto cond = mk<when_condition>(nullptr, integer("1"), nullptr);

  REQUIRE_THROWS_AS(mk<when_branch>(list_of<when_condition> { cond }, nullptr, kw(keyword_kind::else_), name("a")),
                    invariant_violation);
  REQUIRE_THROWS_AS(mk<when_branch>(list_of<when_condition> {}, nullptr, nullptr, name("a")),
                    invariant_violation);
  REQUIRE_NOTHROW(mk<when_branch>(list_of<when_condition> {}, nullptr, kw(keyword_kind::else_), name("a")));

  auto type = mk<type_ref>(nullptr, nullptr, mk<simple_type>(list_of<simple_type_qualifier> {}, name("Int"), nullptr),
                           nullptr);
  REQUIRE_THROWS_AS(mk<when_condition>(kw(keyword_kind::is), name("a"), nullptr), invariant_violation);
  REQUIRE_NOTHROW(mk<when_condition>(kw(keyword_kind::is), nullptr, type));
  REQUIRE_THROWS_AS(mk<when_condition>(kw(keyword_kind::in), nullptr, type), invariant_violation);
  REQUIRE_THROWS_AS(mk<when_condition>(kw(keyword_kind::plus), name("a"), nullptr), invariant_violation);

  REQUIRE_THROWS_AS(mk<when_expression>(kw(keyword_kind::when), kw(keyword_kind::lpar), nullptr,
                                        kw(keyword_kind::rpar), list_of<when_branch> {}),
                    invariant_violation);
}

TEST_CASE( "expression invariants", "[node][invariant]" ) {
  SECTION( "postfix operators" ) {
    REQUIRE_NOTHROW(mk<unary_expression>(name("a"), kw(keyword_kind::excl_excl), false));
    REQUIRE_THROWS_AS(mk<unary_expression>(name("a"), kw(keyword_kind::minus), false), invariant_violation);
    REQUIRE_THROWS_AS(mk<unary_expression>(name("a"), kw(keyword_kind::excl_excl), true), invariant_violation);
  }
  SECTION( "short templates" ) {
    REQUIRE_NOTHROW(mk<template_string_entry>(name("a"), true));
    REQUIRE_NOTHROW(mk<template_string_entry>(mk<this_expression>(""), true));
    REQUIRE_THROWS_AS(mk<template_string_entry>(mk<this_expression>("outer"), true), invariant_violation);
    REQUIRE_THROWS_AS(mk<template_string_entry>(integer("1"), true), invariant_violation);
  }
  SECTION( "calls" ) {
    REQUIRE_THROWS_AS(mk<call_expression>(name("f"), nullptr, nullptr, nullptr), invariant_violation);
    auto targs = mk<type_args>(list_of<type_arg> { mk<type_arg>(nullptr, nullptr, true) }, nullptr);
    REQUIRE_NOTHROW(mk<call_expression>(name("Foo"), targs, nullptr, nullptr));
  }
  SECTION( "categories are checked" ) {
    REQUIRE_THROWS_AS(mk<binary_expression>(name("a"), kw(keyword_kind::plus), kw(keyword_kind::val)),
                      invariant_violation);
    REQUIRE_THROWS_AS(mk<binary_expression>(name("a"), kw(keyword_kind::lpar), name("b")), invariant_violation);
    REQUIRE_THROWS_AS(mk<block_expression>(node_list { var("a") }), invariant_violation);
  }
  SECTION( "escape entries start with a backslash" ) {
    REQUIRE_NOTHROW(mk<escape_string_entry>("\\n"));
    REQUIRE_THROWS_AS(mk<escape_string_entry>("n"), invariant_violation);
  }
  SECTION( "trailing comma needs an element" ) {
    REQUIRE_THROWS_AS(mk<value_args>(list_of<value_arg> {}, kw(keyword_kind::comma)), invariant_violation);
  }
}

TEST_CASE( "modifier invariants", "[node][invariant]" ) {
  auto ann = [] { return mk<annotation>(mk<simple_type>(list_of<simple_type_qualifier> {}, name("A"), nullptr),
                                        nullptr); };

  REQUIRE_THROWS_AS(mk<modifiers>(node_list { kw(keyword_kind::val) }), invariant_violation);
  REQUIRE_THROWS_AS(mk<annotation_set>(kw(keyword_kind::at), nullptr, nullptr, nullptr,
                                       list_of<annotation> { ann(), ann() }, nullptr),
                    invariant_violation);
  REQUIRE_NOTHROW(mk<annotation_set>(kw(keyword_kind::at), nullptr, nullptr, kw(keyword_kind::lbracket),
                                     list_of<annotation> { ann(), ann() }, kw(keyword_kind::rbracket)));
  REQUIRE_THROWS_AS(mk<annotation_set>(kw(keyword_kind::at), kw(keyword_kind::file), nullptr, nullptr,
                                       list_of<annotation> { ann() }, nullptr),
                    invariant_violation);
}

TEST_CASE( "error messages", "[node][invariant]" ) {
  try
  {
    mk<import_alias>(nullptr);
    FAIL("no exception");
  }
  catch(const invariant_violation& e)
  {
    REQUIRE(e.level() == diag_level::error);
    REQUIRE(std::string(e.what()).find("\"import_alias.name\" must be present.") != std::string::npos);
  }
}

TEST_CASE( "class queries", "[node]" ) {
  auto enum_class = mk<class_declaration>(mk<modifiers>(node_list { kw(keyword_kind::enum_) }),
                                          kw(keyword_kind::class_), name("E"), nullptr, nullptr, nullptr, nullptr,
                                          nullptr);
  REQUIRE(enum_class->is_class());
  REQUIRE(enum_class->is_enum());
  REQUIRE_FALSE(enum_class->is_object());

  auto companion = mk<class_declaration>(mk<modifiers>(node_list { kw(keyword_kind::companion) }),
                                         kw(keyword_kind::object), nullptr, nullptr, nullptr, nullptr, nullptr,
                                         nullptr);
  REQUIRE(companion->is_companion());

  REQUIRE_THROWS_AS(mk<class_declaration>(nullptr, kw(keyword_kind::interface), nullptr, nullptr, nullptr, nullptr,
                                          nullptr, nullptr),
                    invariant_violation);
  REQUIRE_THROWS_AS(mk<object_literal_expression>(enum_class), invariant_violation);
}

TEST_CASE( "checked casts", "[node]" ) {
  node_ptr n = name("a");
  REQUIRE(node_cast<name_expression>(n, "test")->name == "a");
  REQUIRE(node_cast<name_expression>(nullptr, "test") == nullptr);
  REQUIRE_THROWS_AS(node_cast<variable>(n, "test"), invariant_violation);
}

TEST_CASE( "expressions read as types", "[node][types]" ) {
  SECTION( "name" ) {
    auto t = to_type(name("String"));
    REQUIRE(t->kind == node_kind::simple_type);
    REQUIRE(as<simple_type>(t)->name->name == "String");
  }
  SECTION( "call with type arguments only" ) {
    auto targs = mk<type_args>(list_of<type_arg> { mk<type_arg>(nullptr, nullptr, true) }, nullptr);
    auto t = to_type(mk<call_expression>(name("List"), targs, nullptr, nullptr));
    REQUIRE(t->kind == node_kind::simple_type);
    REQUIRE(as<simple_type>(t)->type_args == targs);
  }
  SECTION( "qualified" ) {
    auto dotted = mk<binary_expression>(mk<binary_expression>(name("a"), kw(keyword_kind::dot), name("b")),
                                        kw(keyword_kind::dot), name("C"));
    auto t = as<simple_type>(to_type(dotted));
    REQUIRE(t->qualifiers.size() == 2);
    REQUIRE(t->qualifiers[0]->name->name == "a");
    REQUIRE(t->name->name == "C");
  }
  SECTION( "not a type" ) {
    REQUIRE(to_type(integer("1")) == nullptr);
  }
  SECTION( "class literal of a nullable type" ) {
    auto recv = mk<type_receiver>(mk<simple_type>(list_of<simple_type_qualifier> {}, name("A"), nullptr), 2);
    auto lit = mk<class_literal_expression>(recv);
    auto t = lit->lhs_as_type();
    REQUIRE(t->kind == node_kind::nullable_type);
    auto inner = as<nullable_type>(t)->type;
    REQUIRE(inner->kind == node_kind::nullable_type);
    REQUIRE(as<nullable_type>(inner)->type == recv->type);
  }
  SECTION( "callable reference on an expression" ) {
    auto ref = mk<callable_reference_expression>(mk<expression_receiver>(name("Foo")), name("bar"));
    REQUIRE(ref->lhs_as_type()->kind == node_kind::simple_type);
    auto unbound = mk<callable_reference_expression>(nullptr, name("bar"));
    REQUIRE(unbound->lhs_as_type() == nullptr);
  }
}

TEST_CASE( "child slots", "[node][slots]" ) {
  SECTION( "do while lists the body first" ) {
    auto loop = mk<while_expression>(kw(keyword_kind::while_), name("c"),
                                     mk<block_expression>(node_list {}), true);
    auto slots = child_slots(loop);
    REQUIRE(slots.size() == 3);
    REQUIRE(std::string(slots[0].name) == "body");
    REQUIRE(std::string(slots[1].name) == "while_keyword");
    REQUIRE(std::string(slots[2].name) == "condition");
  }
  SECTION( "absent optional slots are reported" ) {
    auto v = var("a");
    auto slots = child_slots(v);
    REQUIRE(slots.size() == 3);
    REQUIRE(slots[0].single == nullptr);
    REQUIRE(slots[1].single == v->name);
  }
  SECTION( "attributes" ) {
    auto c = mk<comment>("// hi", true, true);
    auto attrs = node_attributes(c);
    REQUIRE(attrs.size() == 3);
    REQUIRE(std::string(attrs[0].key) == "text");
    REQUIRE(attrs[0].value == "// hi");
  }
  SECTION( "extras are not children" ) {
    REQUIRE_THROWS_AS(child_slots(mk<semicolon>()), internal_error);
  }
}

TEST_CASE( "lambda lookup", "[node]" ) {
  auto lambda = mk<lambda_expression>(nullptr, nullptr, nullptr);
  auto labeled = mk<labeled_expression>("l", lambda);
  REQUIRE(lambda_expression_of(lambda) == lambda);
  REQUIRE(lambda_expression_of(labeled) == lambda);
  REQUIRE(lambda_expression_of(name("a")) == nullptr);

  auto call = mk<call_expression>(name("run"), nullptr, nullptr,
                                  mk<lambda_arg>(list_of<annotation_set> {}, "", lambda));
  REQUIRE(call->lambda() == lambda);
}
