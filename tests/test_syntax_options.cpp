#include "test_harness.h"

#include <stdexcept>

#include "sqlan/syntax_options.h"

namespace {

using sqlan::SyntaxOptions;

void test_presets() {
  SyntaxOptions server = SyntaxOptions::sql_server();
  expect_true(server.is_identifier_prefix('@'), "sql server @");
  expect_true(server.is_identifier_prefix('#'), "sql server #");
  expect_true(server.is_identifier_prefix('$'), "sql server $");
  expect_true(server.auto_parameter_prefix() == '@', "sql server auto prefix");
  expect_true(SyntaxOptions::oracle().auto_parameter_prefix() == ':', "oracle auto prefix");
  expect_true(!SyntaxOptions::oracle().is_identifier_prefix('@'), "oracle has no @");
  expect_true(SyntaxOptions::sqlite().is_identifier_prefix('?'), "sqlite ?");
  expect_true(SyntaxOptions::postgresql().auto_parameter_prefix() == '$', "postgres auto prefix");
  expect_true(SyntaxOptions::defaults().identifier_prefixes() == server.identifier_prefixes(),
              "defaults are sql server");
}

void test_auto_prefix_is_added_and_duplicates_removed() {
  SyntaxOptions options("::#", '@');
  expect_true(options.identifier_prefixes() == ":#@", "deduplicated and extended");
  expect_true(options.is_identifier_prefix('@'), "auto prefix accepted");
}

void test_empty_prefix_set_rejected() {
  bool threw = false;
  try {
    SyntaxOptions options("", '@');
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  expect_true(threw, "empty prefix set throws invalid_argument");
}

void test_dialect_from_name() {
  expect_true(sqlan::dialect_from_name("MSSQL").has_value(), "mssql alias");
  expect_true(sqlan::dialect_from_name(" postgres ").has_value(), "postgres alias trimmed");
  auto oracle = sqlan::dialect_from_name("Oracle");
  expect_true(oracle.has_value() && oracle->auto_parameter_prefix() == ':', "oracle resolved");
  expect_true(!sqlan::dialect_from_name("db2").has_value(), "unknown dialect");
}

}  // namespace

void register_syntax_options_tests(std::vector<TestCase>& tests) {
  tests.push_back({"syntax_presets", test_presets});
  tests.push_back({"syntax_auto_prefix_is_added_and_duplicates_removed",
                   test_auto_prefix_is_added_and_duplicates_removed});
  tests.push_back({"syntax_empty_prefix_set_rejected", test_empty_prefix_set_rejected});
  tests.push_back({"syntax_dialect_from_name", test_dialect_from_name});
}
