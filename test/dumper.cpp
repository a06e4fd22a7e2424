#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "fixtures.hpp"

#include <dumper.hpp>

using namespace ktree;

TEST_CASE( "dump with extras", "[dumper]" ) {
  test::commented_property src;

  const std::string expected =
    "kotlin_file\n"
    "  declaration.property_declaration\n"
    "    keyword.val\n"
    "    BEFORE: extra.whitespace\n"
    "    declaration.variable\n"
    "      expression.name_expression\n"
    "    BEFORE: extra.whitespace\n"
    "    keyword.=\n"
    "    BEFORE: extra.whitespace\n"
    "    expression.string_literal_expression\n"
    "    AFTER: extra.whitespace\n"
    "    AFTER: extra.comment\n";

  REQUIRE(dumper::dump(src.root, &src.conv.extras(), false) == expected);
}

TEST_CASE( "dump without extras", "[dumper]" ) {
  test::commented_property src;

  const std::string expected =
    "kotlin_file\n"
    "  declaration.property_declaration\n"
    "    keyword.val\n"
    "    declaration.variable\n"
    "      expression.name_expression\n"
    "    keyword.=\n"
    "    expression.string_literal_expression\n";

  REQUIRE(dumper::dump(src.root, nullptr, false) == expected);
}

TEST_CASE( "within extras follow the children", "[dumper]" ) {
  test::commented_function src;

  const std::string expected =
    "kotlin_file\n"
    "  declaration.function_declaration\n"
    "    keyword.fun\n"
    "    BEFORE: extra.whitespace\n"
    "    expression.name_expression\n"
    "    declaration.function_params\n"
    "    BEFORE: extra.whitespace\n"
    "    expression.block_expression\n"
    "      WITHIN: extra.whitespace\n"
    "      WITHIN: extra.comment\n"
    "      WITHIN: extra.whitespace\n";

  REQUIRE(dumper::dump(src.root, &src.conv.extras(), false) == expected);
}

TEST_CASE( "verbose dump", "[dumper]" ) {
  test::commented_property src;

  const auto dump = dumper::dump(src.root, &src.conv.extras(), true);

  REQUIRE(dump.find("    keyword.val{text=\"val\"}\n") != std::string::npos);
  REQUIRE(dump.find("      expression.name_expression{text=\"x\"}\n") != std::string::npos);
  REQUIRE(dump.find("expression.string_literal_expression{raw=\"false\"}") != std::string::npos);
  REQUIRE(dump.find("AFTER: extra.comment{text=\"// x is empty\", starts_line=\"false\", ends_line=\"true\"}")
          != std::string::npos);
  REQUIRE(dump.find("kotlin_file\n") == 0);
}

TEST_CASE( "escaping", "[dumper]" ) {
  REQUIRE(escape("plain") == "plain");
  REQUIRE(escape("a\nb") == "a\\nb");
  REQUIRE(escape("\t\r\b") == "\\t\\r\\b");
  REQUIRE(escape("say \"hi\"") == "say \\\"hi\\\"");
  REQUIRE(escape("C:\\dir") == "C:\\\\dir");

  auto quoted = mk<name_expression>("`a\"b`");
  REQUIRE(dumper::dump(quoted, nullptr, true) == "expression.name_expression{text=\"`a\\\"b`\"}\n");
}
