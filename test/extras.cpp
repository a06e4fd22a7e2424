#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "fixtures.hpp"

#include <extras_map.hpp>
#include <converter.hpp>
#include <writer.hpp>
#include <config.hpp>
#include <errors.hpp>
#include <diagnostic.hpp>

#include <algorithm>

using namespace ktree;

static bool has_message(const std::string& fragment)
{
  auto messages = diagnostic.messages();
  return std::any_of(messages.begin(), messages.end(), [&](const nlohmann::json& m)
      { return m["message"].get<std::string>().find(fragment) != std::string::npos; });
}

TEST_CASE( "extras table", "[extras]" ) {
  extras_table table;
  auto a = mk<name_expression>("a");
  auto b = mk<name_expression>("b");
  auto space = mk<whitespace>(" ");
  auto semi = mk<semicolon>();

  REQUIRE(table.before(a).empty());
  REQUIRE(table.empty());

  table.set_before(a, { space });
  table.append_after(a, { semi });
  table.append_after(a, { space });
  REQUIRE(table.size() == 1);
  REQUIRE(table.before(a).size() == 1);
  REQUIRE(table.after(a).size() == 2);
  REQUIRE(table.after(a)[0] == semi);

  SECTION( "lookups of other nodes are empty" ) {
    REQUIRE(table.before(b).empty());
    REQUIRE(table.within(b).empty());
    REQUIRE(table.after(b).empty());
  }
  SECTION( "moving extras to a replacement" ) {
    table.move_extras(a, b);
    REQUIRE(table.before(a).empty());
    REQUIRE(table.after(a).empty());
    REQUIRE(table.before(b).size() == 1);
    REQUIRE(table.after(b).size() == 2);
    REQUIRE(table.size() == 1);
  }
  SECTION( "moving from a node without extras clears the target" ) {
    auto c = mk<name_expression>("c");
    table.move_extras(c, a);
    REQUIRE(table.empty());
  }
  SECTION( "clearing every list drops the entry" ) {
    table.set_before(a, {});
    table.set_after(a, {});
    REQUIRE(table.empty());
  }
  SECTION( "appending nothing creates no entry" ) {
    table.append_within(b, {});
    REQUIRE(table.size() == 1);
  }
  SECTION( "erase" ) {
    table.erase(a);
    REQUIRE(table.after(a).empty());
  }
}

TEST_CASE( "trivia placement", "[extras][converter]" ) {
  SECTION( "semicolon joins the preceding statement" ) {
    test::two_properties src;
    auto& extras = src.conv.extras();
    auto file = as<kotlin_file>(src.root);
    auto x = file->declarations[0];
    auto y = file->declarations[1];

    REQUIRE(extras.after(x).size() == 1);
    REQUIRE(extras.after(x)[0]->kind == node_kind::semicolon);
    REQUIRE(extras.before(y).size() == 1);
    REQUIRE(extras.before(y)[0]->kind == node_kind::whitespace);
    REQUIRE(extras.within(src.root).empty());

    auto var = as<property_declaration>(x)->variables[0];
    REQUIRE(extras.before(var).size() == 1);
    REQUIRE(extra_text(extras.before(var)[0]) == " ");
  }
  SECTION( "trailing comment on the same line" ) {
    test::commented_property src;
    auto& after = src.conv.extras().after(src.literal);
    REQUIRE(after.size() == 2);
    REQUIRE(after[0]->kind == node_kind::whitespace);
    REQUIRE(after[1]->kind == node_kind::comment);
    auto c = as<comment>(after[1]);
    REQUIRE(c->text == "// x is empty");
    REQUIRE_FALSE(c->starts_line);
    REQUIRE(c->ends_line);
  }
  SECTION( "trivia between tokens belongs to the enclosing node" ) {
    const auto saved = config;
    config.record_info = true;
    diagnostic.reset();
    test::commented_function src;
    config = saved;
    auto& within = src.conv.extras().within(src.body);
    REQUIRE(within.size() == 3);
    auto c = as<comment>(within[1]);
    REQUIRE(c->starts_line);
    REQUIRE(c->ends_line);
    REQUIRE(has_message("attached to the enclosing node"));
    diagnostic.reset();
  }
}

TEST_CASE( "semicolon after a space", "[extras][converter]" ) {
  // {foo() ;
  // {}}
  auto raw = test::node("BLOCK", test::tok("{"),
                        test::node("CALL", test::leaf("IDENTIFIER", "foo"),
                                   test::node("VALUE_ARGUMENT_LIST", test::tok("("), test::tok(")"))),
                        test::ws(" "), test::semi(), test::ws("\n"),
                        test::node("LAMBDA", test::tok("{"), test::tok("}")), test::tok("}"));
  const auto source = raw->layout();
  extras_converter conv { "semi.kt", source };

  auto& call_raw = raw->at(1);
  auto callee = conv.make<name_expression>(&call_raw.at(0), "foo");
  auto args = conv.make<value_args>(&call_raw.at(1), list_of<value_arg> {}, nullptr);
  auto call = conv.make<call_expression>(&call_raw, callee, nullptr, args, nullptr);
  auto lambda = conv.make<lambda_expression>(&raw->at(5), nullptr, nullptr, nullptr);
  auto block = conv.make<block_expression>(raw.get(), node_list { call, lambda });
  conv.fill_extras(*raw);
  REQUIRE(conv.node_of(*raw) == block);

  auto& after = conv.extras().after(call);
  REQUIRE(after.size() == 2);
  REQUIRE(after[0]->kind == node_kind::whitespace);
  REQUIRE(after[1]->kind == node_kind::semicolon);
  REQUIRE(conv.extras().before(lambda).size() == 1);
}

TEST_CASE( "comment flags across element boundaries", "[extras][converter]" ) {
  // val a = 1; /* c */ fun f() {}
  auto raw = test::node("FILE", test::raw_property("a", test::leaf("INTEGER_CONSTANT", "1")), test::semi(),
                        test::ws(" "),
                        test::node("FUN", test::cmt("/* c */"), test::ws(" "), test::leaf("fun", "fun"), test::ws(" "),
                                   test::leaf("IDENTIFIER", "f"),
                                   test::node("VALUE_PARAMETER_LIST", test::tok("("), test::tok(")")), test::ws(" "),
                                   test::node("BLOCK", test::tok("{"), test::tok("}"))));
  const auto source = raw->layout();
  extras_converter conv { "boundary.kt", source };

  auto prop = test::convert_property(conv, raw->at(0), test::convert_integer(conv, raw->at(0).at(6)));
  auto& fun = raw->at(3);
  auto kw = conv.make_keyword(&fun.at(2), keyword_kind::fun);
  auto name = conv.make<name_expression>(&fun.at(4), "f");
  auto params = conv.make<function_params>(&fun.at(5), list_of<function_param> {}, nullptr);
  auto body = conv.make<block_expression>(&fun.at(7), node_list {});
  auto decl = conv.make<function_declaration>(&fun, nullptr, kw, nullptr, nullptr, name, params, nullptr,
                                              node_list {}, nullptr, body);
  auto root = conv.make<kotlin_file>(raw.get(), list_of<annotation_set> {}, nullptr, nullptr,
                                     node_list { prop, decl });

  auto& before = conv.extras().before(kw);
  REQUIRE(before.size() == 2);
  REQUIRE(before[0]->kind == node_kind::comment);
  auto c = as<comment>(before[0]);
  REQUIRE_FALSE(c->starts_line);
  REQUIRE_FALSE(c->ends_line);
  REQUIRE(writer::write(root, &conv.extras()) == "val a = 1; /* c */ fun f() {}");
}

TEST_CASE( "empty parameter list with a space", "[extras][converter]" ) {
  auto raw = test::node("FILE", test::node("FUN", test::leaf("fun", "fun"), test::ws(" "), test::leaf("IDENTIFIER", "f"),
                                           test::node("VALUE_PARAMETER_LIST", test::tok("("), test::ws(" "),
                                                      test::tok(")"))));
  const auto source = raw->layout();
  extras_converter conv { "params.kt", source };

  auto& fun = raw->at(0);
  auto kw = conv.make_keyword(&fun.at(0), keyword_kind::fun);
  auto name = conv.make<name_expression>(&fun.at(2), "f");
  auto params = conv.make<function_params>(&fun.at(3), list_of<function_param> {}, nullptr);
  auto decl = conv.make<function_declaration>(&fun, nullptr, kw, nullptr, nullptr, name, params, nullptr,
                                              node_list {}, nullptr, nullptr);
  auto root = conv.make<kotlin_file>(raw.get(), list_of<annotation_set> {}, nullptr, nullptr, node_list { decl });

  REQUIRE(conv.extras().within(params).size() == 1);
  REQUIRE(writer::write(root, &conv.extras()) == "fun f( )");
}

TEST_CASE( "blank lines", "[extras][config]" ) {
  const auto saved = config;

  auto build = []
  {
    auto raw = test::node("FILE", test::raw_property("x", test::leaf("INTEGER_CONSTANT", "1")), test::ws("\n\n\n"),
                          test::raw_property("y", test::leaf("INTEGER_CONSTANT", "2")));
    return raw;
  };

  SECTION( "collapsed" ) {
    config.collapse_blank_lines = true;
    auto raw = build();
    const auto source = raw->layout();
    extras_converter conv { "blank.kt", source };
    auto x = test::convert_property(conv, raw->at(0), test::convert_integer(conv, raw->at(0).at(6)));
    auto y = test::convert_property(conv, raw->at(2), test::convert_integer(conv, raw->at(2).at(6)));
    auto root = conv.make<kotlin_file>(raw.get(), list_of<annotation_set> {}, nullptr, nullptr, node_list { x, y });
    config = saved;

    auto& before = conv.extras().before(y);
    REQUIRE(before.size() == 1);
    REQUIRE(before[0]->kind == node_kind::blank_lines);
    REQUIRE(as<blank_lines>(before[0])->count == 2);
    REQUIRE(writer::write(root, &conv.extras()) == "val x = 1\n\n\nval y = 2");
  }
  SECTION( "kept as whitespace" ) {
    config.collapse_blank_lines = false;
    auto raw = build();
    const auto source = raw->layout();
    extras_converter conv { "blank.kt", source };
    auto x = test::convert_property(conv, raw->at(0), test::convert_integer(conv, raw->at(0).at(6)));
    auto y = test::convert_property(conv, raw->at(2), test::convert_integer(conv, raw->at(2).at(6)));
    auto root = conv.make<kotlin_file>(raw.get(), list_of<annotation_set> {}, nullptr, nullptr, node_list { x, y });
    config = saved;

    REQUIRE(conv.extras().after(x).empty());
    auto& before = conv.extras().before(y);
    REQUIRE(before.size() == 1);
    REQUIRE(as<whitespace>(before[0])->text == "\n\n\n");
    REQUIRE(writer::write(root, &conv.extras()) == "val x = 1\n\n\nval y = 2");
  }
  config = saved;
}

TEST_CASE( "raw elements converted twice", "[extras][converter]" ) {
  const auto saved = config;
  config.record_info = true;
  diagnostic.reset();

  auto raw = test::node("FILE", test::raw_property("x", test::leaf("INTEGER_CONSTANT", "1")));
  const auto source = raw->layout();
  extras_converter conv { "twice.kt", source };

  auto& prop = raw->at(0);
  auto& identifier = prop.at(2).at(0);
  auto first = conv.make<name_expression>(&identifier, "x");
  auto second = conv.make<name_expression>(&identifier, "x");
  REQUIRE(first != second);
  REQUIRE(conv.node_of(identifier) == second);
  REQUIRE(has_message("converted more than once"));

  auto var = conv.make<variable>(&prop.at(2), nullptr, second, nullptr);
  auto val = conv.make_keyword(&prop.at(0), keyword_kind::val);
  auto eq = conv.make_keyword(&prop.at(4), keyword_kind::equal);
  auto decl = conv.make<property_declaration>(&prop, nullptr, val, nullptr, nullptr, nullptr,
                                              list_of<variable> { var }, nullptr, nullptr, nullptr, eq,
                                              test::convert_integer(conv, prop.at(6)), nullptr, node_list {});
  auto root = conv.make<kotlin_file>(raw.get(), list_of<annotation_set> {}, nullptr, nullptr, node_list { decl });

  REQUIRE(writer::write(root, &conv.extras()) == "val x = 1");
  config = saved;
  diagnostic.reset();
}

TEST_CASE( "converter failures", "[extras][converter]" ) {
  auto raw = test::node("FILE", test::node("TYPEALIAS", test::leaf("typealias", "typealias"), test::ws(" "),
                                           test::leaf("IDENTIFIER", "T")));
  const auto source = raw->layout();
  extras_converter conv { "fail.kt", source };

  SECTION( "root never converted" ) {
    REQUIRE_THROWS_AS(conv.fill_extras(*raw), invariant_violation);
  }
  SECTION( "unsupported construct" ) {
    try
    {
      conv.unsupported(raw->at(0).at(2));
      FAIL("no exception");
    }
    catch(const unsupported_construct& e)
    {
      const auto& diag = e.diagnostic();
      REQUIRE(diag["message"].get<std::string>() == "Unsupported construct \"IDENTIFIER\".");
      REQUIRE(diag["range"]["module"].get<std::string>() == "fail.kt");
      REQUIRE(diag["range"]["row_beg"].get<std::size_t>() == 1);
      REQUIRE(diag["range"]["col_beg"].get<std::size_t>() == 11);
    }
  }
}

TEST_CASE( "source ranges", "[extras]" ) {
  const std::string text = "val x\n  = 1";
  auto r = source_range::from_offsets("r.kt", text, 8, 9);
  REQUIRE(r.row_beg == 2);
  REQUIRE(r.column_beg == 3);
  REQUIRE(r.row_end == 2);
  REQUIRE(r.column_end == 4);
  REQUIRE(r.to_string() == "r.kt:2:3");

  auto wide = source_range::from_offsets("r.kt", text, 0, 3) + r;
  REQUIRE(wide.row_beg == 1);
  REQUIRE(wide.column_end == 4);
}
