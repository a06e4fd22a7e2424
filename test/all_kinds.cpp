#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <ast.hpp>
#include <visitor.hpp>
#include <mutable_visitor.hpp>
#include <writer.hpp>
#include <dumper.hpp>
#include <node_util.hpp>

#include <algorithm>
#include <set>

using namespace ktree;

namespace
{

keyword_ptr kw(keyword_kind k) { return mk_keyword(k); }
name_expression_ptr nm(const char* n) { return mk<name_expression>(n); }
simple_type_ptr st(const char* n) { return mk<simple_type>(list_of<simple_type_qualifier> {}, nm(n), nullptr); }
type_ref_ptr tr(node_ptr type) { return mk<type_ref>(nullptr, nullptr, type, nullptr); }
block_expression_ptr blk(const node_list& statements = {}) { return mk<block_expression>(statements); }
node_ptr num(const char* v) { return mk<constant_literal_expression>(v, constant_form::integer); }
value_args_ptr no_args() { return mk<value_args>(list_of<value_arg> {}, nullptr); }
function_params_ptr no_params() { return mk<function_params>(list_of<function_param> {}, nullptr); }
variable_ptr var(const char* n) { return mk<variable>(nullptr, nm(n), nullptr); }

annotation_set_ptr single_annotation(const char* n)
{
  return mk<annotation_set>(kw(keyword_kind::at), nullptr, nullptr, nullptr,
                            list_of<annotation> { mk<annotation>(st(n), nullptr) }, nullptr);
}

node_ptr data_class()
{
  auto mods = mk<modifiers>(node_list {
    kw(keyword_kind::data),
    mk<annotation_set>(kw(keyword_kind::at), nullptr, nullptr, kw(keyword_kind::lbracket),
                       list_of<annotation> { mk<annotation>(st("A"), nullptr), mk<annotation>(st("B"), nullptr) },
                       kw(keyword_kind::rbracket)) });

  auto tparams = mk<type_params>(list_of<type_param> {
    mk<type_param>(mk<modifiers>(node_list { kw(keyword_kind::reified) }), nm("T"), tr(st("Any"))) },
    kw(keyword_kind::comma));

  auto ctor_param = mk<function_param>(nullptr, kw(keyword_kind::val), nm("p"),
                                       tr(mk<nullable_type>(nullptr, nullptr, st("Int"), nullptr)),
                                       kw(keyword_kind::equal), num("0"));
  auto ctor = mk<primary_constructor>(mk<modifiers>(node_list { kw(keyword_kind::private_) }),
                                      kw(keyword_kind::constructor),
                                      mk<function_params>(list_of<function_param> { ctor_param }, nullptr));

  auto parents = mk<class_parents>(node_list {
    mk<call_constructor_parent>(st("Base"), no_args(), nullptr),
    mk<delegated_type_parent>(st("I"), kw(keyword_kind::by), nm("p")),
    mk<type_parent>(st("J")) });

  auto constraints = mk<type_constraint_set>(kw(keyword_kind::where), mk<type_constraints>(list_of<type_constraint> {
    mk<type_constraint>(list_of<annotation_set> {}, nm("T"), tr(st("Any"))) }));

  auto get = mk<getter>(nullptr, kw(keyword_kind::get), kw(keyword_kind::lpar), kw(keyword_kind::rpar),
                        tr(st("Int")), node_list {}, kw(keyword_kind::equal), num("1"));
  auto set = mk<setter>(nullptr, kw(keyword_kind::set),
                        mk<function_params>(list_of<function_param> {
                          mk<function_param>(nullptr, nullptr, nm("v"), nullptr, nullptr, nullptr) }, nullptr),
                        node_list {}, nullptr, blk());
  auto delegated = mk<property_declaration>(nullptr, kw(keyword_kind::var), nullptr, nullptr, nullptr,
                                            list_of<variable> { var("v") }, nullptr, nullptr, nullptr, nullptr,
                                            nullptr, mk<property_delegate>(kw(keyword_kind::by), nm("lazy")),
                                            node_list { get, set });

  auto body = mk<class_body>(list_of<enum_entry> {}, false, node_list {
    mk<init_declaration>(nullptr, blk()),
    mk<secondary_constructor_declaration>(nullptr, kw(keyword_kind::constructor), no_params(),
                                          mk<delegation_call>(kw(keyword_kind::this_), no_args()), blk()),
    mk<type_alias_declaration>(nullptr, nm("Alias"), nullptr, tr(mk<dynamic_type>())),
    delegated });

  return mk<class_declaration>(mods, kw(keyword_kind::class_), nm("C"), tparams, ctor, parents, constraints, body);
}

node_ptr enum_class()
{
  auto entry = mk<enum_entry>(nullptr, nm("X"),
                              mk<value_args>(list_of<value_arg> { mk<value_arg>(nullptr, false, num("1")) }, nullptr),
                              mk<class_body>(list_of<enum_entry> {}, false, node_list {}));
  auto fun = mk<function_declaration>(nullptr, kw(keyword_kind::fun), nullptr, nullptr, nm("g"), no_params(),
                                      nullptr, node_list {}, nullptr, blk());
  return mk<class_declaration>(mk<modifiers>(node_list { kw(keyword_kind::enum_) }), kw(keyword_kind::class_),
                               nm("E"), nullptr, nullptr, nullptr, nullptr,
                               mk<class_body>(list_of<enum_entry> { entry }, true, node_list { fun }));
}

node_list expressions()
{
  auto qualified = mk<simple_type>(list_of<simple_type_qualifier> { mk<simple_type_qualifier>(nm("kotlin"), nullptr) },
                                   nm("Int"), nullptr);

  auto catcher = mk<catch_clause>(kw(keyword_kind::catch_),
                                  mk<function_params>(list_of<function_param> {
                                    mk<function_param>(nullptr, nullptr, nm("e"), tr(st("Exception")), nullptr,
                                                       nullptr) }, nullptr),
                                  blk());

  auto str = mk<string_literal_expression>(node_list {
    mk<literal_string_entry>("a"),
    mk<escape_string_entry>("\\n"),
    mk<template_string_entry>(nm("b"), true),
    mk<template_string_entry>(mk<binary_expression>(nm("c"), kw(keyword_kind::plus), num("1")), false) }, false);

  auto destructuring = mk<lambda_param>(kw(keyword_kind::lpar), list_of<variable> { var("x"), var("y") }, nullptr,
                                        kw(keyword_kind::rpar), kw(keyword_kind::colon), tr(st("Pair")));
  auto lambda = mk<lambda_expression>(mk<lambda_params>(list_of<lambda_param> { destructuring }, nullptr),
                                      kw(keyword_kind::arrow), mk<lambda_body>(node_list { nm("x") }));

  auto when = mk<when_expression>(kw(keyword_kind::when), kw(keyword_kind::lpar), nm("x"), kw(keyword_kind::rpar),
                                  list_of<when_branch> {
                                    mk<when_branch>(list_of<when_condition> {
                                                      mk<when_condition>(kw(keyword_kind::in), nm("r"), nullptr),
                                                      mk<when_condition>(kw(keyword_kind::is), nullptr, tr(qualified)) },
                                                    kw(keyword_kind::comma), nullptr, nm("a")),
                                    mk<when_branch>(list_of<when_condition> {}, nullptr, kw(keyword_kind::else_),
                                                    nm("b")) });

  auto object = mk<class_declaration>(nullptr, kw(keyword_kind::object), nullptr, nullptr, nullptr,
                                      mk<class_parents>(node_list { mk<type_parent>(st("I")) }), nullptr,
                                      mk<class_body>(list_of<enum_entry> {}, false, node_list {}));

  auto call = mk<call_expression>(nm("run"),
                                  mk<type_args>(list_of<type_arg> {
                                    mk<type_arg>(mk<modifiers>(node_list { kw(keyword_kind::out) }), tr(st("T")), false),
                                    mk<type_arg>(nullptr, nullptr, true) }, nullptr),
                                  mk<value_args>(list_of<value_arg> { mk<value_arg>(nm("named"), true, nm("xs")) },
                                                 kw(keyword_kind::comma)),
                                  mk<lambda_arg>(list_of<annotation_set> {}, "l",
                                                 mk<lambda_expression>(nullptr, nullptr, nullptr)));

  auto anonymous = mk<function_declaration>(nullptr, kw(keyword_kind::fun), nullptr, nullptr, nullptr, no_params(),
                                            nullptr, node_list {}, kw(keyword_kind::equal), num("1"));

  auto pair = mk<property_declaration>(nullptr, kw(keyword_kind::val), nullptr, nullptr, kw(keyword_kind::lpar),
                                       list_of<variable> { var("a"), var("b") }, nullptr, kw(keyword_kind::rpar),
                                       nullptr, kw(keyword_kind::equal), nm("pair"), nullptr, node_list {});

  return {
    mk<if_expression>(kw(keyword_kind::if_), nm("c"), blk(), blk()),
    mk<try_expression>(blk(), list_of<catch_clause> { catcher }, blk()),
    mk<for_expression>(kw(keyword_kind::for_), mk<lambda_param>(nullptr, list_of<variable> { var("i") }, nullptr,
                                                                nullptr, nullptr, nullptr),
                       nm("xs"), blk()),
    mk<while_expression>(kw(keyword_kind::while_), nm("c"), blk(), false),
    mk<while_expression>(kw(keyword_kind::while_), nm("c"), blk(), true),
    mk<binary_expression>(nm("a"), kw(keyword_kind::elvis), nm("b")),
    mk<binary_infix_expression>(nm("a"), nm("to"), nm("b")),
    mk<unary_expression>(nm("a"), kw(keyword_kind::excl_excl), false),
    mk<binary_type_expression>(nm("a"), kw(keyword_kind::as), tr(st("T"))),
    mk<callable_reference_expression>(mk<expression_receiver>(nm("Foo")), nm("bar")),
    mk<class_literal_expression>(mk<type_receiver>(st("Foo"), 1)),
    mk<parenthesized_expression>(nm("a")),
    str,
    mk<constant_literal_expression>("1.5", constant_form::real),
    lambda,
    mk<this_expression>("outer"),
    mk<super_expression>(mk<type_arg>(nullptr, tr(st("Base")), false), ""),
    when,
    mk<object_literal_expression>(object),
    mk<throw_expression>(nm("e")),
    mk<return_expression>("f", nm("x")),
    mk<continue_expression>("l"),
    mk<break_expression>(""),
    mk<collection_literal_expression>(node_list { num("1") }, kw(keyword_kind::comma)),
    mk<labeled_expression>("l", nm("x")),
    mk<annotated_expression>(list_of<annotation_set> { single_annotation("Ann") }, nm("x")),
    call,
    mk<array_access_expression>(nm("arr"), node_list { num("0") }, nullptr),
    mk<anonymous_function_expression>(anonymous),
    mk<property_expression>(pair),
    blk(),
  };
}

node_ptr function()
{
  auto fn_type = mk<function_type>(
    mk<context_receivers>(list_of<context_receiver> { mk<context_receiver>(tr(st("Ctx"))) }, nullptr),
    mk<function_type_receiver>(tr(st("R"))),
    mk<function_type_params>(list_of<function_type_param> { mk<function_type_param>(nm("x"), tr(st("Int"))) },
                             nullptr),
    tr(st("Unit")));

  auto params = mk<function_params>(list_of<function_param> {
    mk<function_param>(nullptr, nullptr, nm("f"), tr(fn_type), nullptr, nullptr) }, kw(keyword_kind::comma));

  auto effects = mk<contract>(kw(keyword_kind::contract), mk<contract_effects>(list_of<contract_effect> {
    mk<contract_effect>(nm("returns")) }, nullptr));

  return mk<function_declaration>(mk<modifiers>(node_list { kw(keyword_kind::suspend) }), kw(keyword_kind::fun),
                                  nullptr, tr(st("String")), nm("f"), params, tr(st("Unit")), node_list { effects },
                                  nullptr, blk(expressions()));
}

node_ptr everything()
{
  auto file_annotation = mk<annotation_set>(
    kw(keyword_kind::at), kw(keyword_kind::file), kw(keyword_kind::colon), nullptr,
    list_of<annotation> { mk<annotation>(st("Suppress"), mk<value_args>(list_of<value_arg> {
      mk<value_arg>(nullptr, false, mk<string_literal_expression>(node_list { mk<literal_string_entry>("x") }, false)) },
      nullptr)) },
    nullptr);

  auto package = mk<package_directive>(nullptr, kw(keyword_kind::package), list_of<name_expression> { nm("a"), nm("b") });
  auto imports = mk<import_directives>(list_of<import_directive> {
    mk<import_directive>(kw(keyword_kind::import), list_of<name_expression> { nm("c") }, mk<import_alias>(nm("d"))) });

  return mk<kotlin_file>(list_of<annotation_set> { file_annotation }, package, imports, node_list {
    data_class(),
    enum_class(),
    mk<class_declaration>(mk<modifiers>(node_list { kw(keyword_kind::companion) }), kw(keyword_kind::object),
                          nullptr, nullptr, nullptr, nullptr, nullptr, nullptr),
    function() });
}

// Swaps every keyword and name for a fresh but equal node, forcing a rebuild of every ancestor.
node_ptr refresh(const node_path& path)
{
  if(path.node->kind == node_kind::keyword)
    return mk_keyword(as<keyword>(path.node)->which);
  if(path.node->kind == node_kind::name_expression)
    return mk<name_expression>(as<name_expression>(path.node)->name);
  return path.node;
}

}

TEST_CASE( "every node kind is traversed", "[all_kinds][visitor]" ) {
  auto file = everything();
  auto script = mk<kotlin_script>(list_of<annotation_set> {}, nullptr, nullptr, node_list { nm("x"), num("2") });

  std::set<node_kind> seen;
  const auto collect = [&](const node_path& path) { seen.insert(path.node->kind); };
  visitor::traverse(file, collect);
  visitor::traverse(script, collect);

  for(std::size_t i = 0; i < node_kind_count; ++i)
  {
    const auto kind = static_cast<node_kind>(i);
    if(is_extra(kind))
      continue;
    INFO(kind_name(kind));
    CHECK(seen.count(kind) == 1);
  }
}

TEST_CASE( "every node kind is rebuilt", "[all_kinds][mutable_visitor]" ) {
  auto file = everything();

  REQUIRE(mutable_visitor::traverse(file, {}) == file);

  auto rebuilt = mutable_visitor::traverse(file, refresh);
  REQUIRE(rebuilt != file);
  REQUIRE(structurally_equal(rebuilt, file));
  REQUIRE(writer::write(rebuilt) == writer::write(file));

  std::size_t shared = 0;
  visitor::traverse(rebuilt, [&](const node_path& path)
  {
    if(path.node->kind == node_kind::keyword || path.node->kind == node_kind::name_expression)
      return;
    visitor::traverse(file, [&](const node_path& original)
    {
      if(original.node == path.node)
        ++shared;
    });
  });
  // Nodes without keyword or name descendants keep their identity.
  REQUIRE(shared > 0);
}

TEST_CASE( "every node kind is written", "[all_kinds][writer]" ) {
  const auto text = writer::write(everything());

  REQUIRE(text.find("@file:Suppress(\"x\")") == 0);
  REQUIRE(text.find("package a.b\nimport c as d\n") != std::string::npos);
  REQUIRE(text.find("data@[A B]class C<reified T:Any,>") != std::string::npos);
  REQUIRE(text.find("typealias Alias=dynamic") != std::string::npos);
  REQUIRE(text.find("var v by lazy\nget():Int=1\nset(v){}") != std::string::npos);
  REQUIRE(text.find("\nenum class E{X(1){},;fun g(){}}") != std::string::npos);
  REQUIRE(text.find("do{}while(c)") != std::string::npos);
  REQUIRE(text.find("Foo::bar") != std::string::npos);
  REQUIRE(text.find("Foo?::class") != std::string::npos);
  REQUIRE(text.find("\"a\\n$b${c+1}\"") != std::string::npos);
  REQUIRE(text.find("{(x,y):Pair->x}") != std::string::npos);
  REQUIRE(text.find("when(x){in r,is kotlin.Int,->a\nelse->b}") != std::string::npos);
  REQUIRE(text.find("run<out T,*>(named=*xs,)l@{}") != std::string::npos);
  REQUIRE(text.find("val(a,b)=pair") != std::string::npos);

  const auto script = mk<kotlin_script>(list_of<annotation_set> {}, nullptr, nullptr, node_list { nm("x"), num("2") });
  REQUIRE(writer::write(script) == "x\n2");
}

TEST_CASE( "every node kind is dumped", "[all_kinds][dumper]" ) {
  auto file = everything();

  std::size_t nodes = 0;
  visitor::traverse(file, [&](const node_path&) { ++nodes; });

  const auto dump = dumper::dump(file, nullptr, true);
  REQUIRE(static_cast<std::size_t>(std::count(dump.begin(), dump.end(), '\n')) == nodes);
  REQUIRE(dump.find("kotlin_file\n") == 0);
  REQUIRE(dump.find("expression.while_expression{do_while=\"true\"}") != std::string::npos);
  REQUIRE(dump.find("expression.constant_literal_expression{text=\"1.5\", form=\"real\"}") != std::string::npos);
}
