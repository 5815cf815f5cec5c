#include "test_harness.h"

#include "render/sql_text.h"
#include "sqlan/sqlan.h"

namespace {

std::string canonical(const std::string& sql,
                      const sqlan::SyntaxOptions& syntax = sqlan::SyntaxOptions::defaults()) {
  auto result = sqlan::parse_sql(sql, syntax);
  if (!result.query) {
    expect_true(false, "parse failed: " + sql);
    return {};
  }
  return result.query->to_sql();
}

void test_whitespace_and_comments_are_normalized() {
  expect_str(canonical("SELECT  a ,b\nFROM t -- note\nWHERE x=1 /* done */"),
             "SELECT a, b FROM t WHERE x = 1", "normalized");
}

void test_token_spacing_rules() {
  expect_str(canonical("SELECT f ( x ), t . *, COUNT( DISTINCT id ) FROM t"),
             "SELECT f(x), t.*, COUNT(DISTINCT id) FROM t", "calls and qualifiers");
  expect_str(canonical("SELECT a FROM t WHERE a IN(1,2) AND NOT(b = 1) OR EXISTS(SELECT 1)"),
             "SELECT a FROM t WHERE a IN (1, 2) AND NOT (b = 1) OR EXISTS (SELECT 1)",
             "keywords before parentheses");
  expect_str(canonical("SELECT t.[Order Id] FROM [dbo].[Orders] t"),
             "SELECT t.[Order Id] FROM [dbo].[Orders] t", "bracketed identifiers");
  expect_str(canonical("SELECT a::int, b || c FROM t", sqlan::SyntaxOptions::postgresql()),
             "SELECT a::int, b || c FROM t", "cast and concatenation");
}

void test_canonical_form_is_a_fixed_point() {
  const char* queries[] = {
      "select a,b from t where x=1 order by a",
      "WITH x AS (SELECT 1 AS v) SELECT v FROM x",
      "INSERT INTO t (a,b) VALUES (1,'x'),(2,'y')",
      "UPDATE t SET a=a+1 WHERE id IN (SELECT id FROM u)",
      "DELETE FROM t WHERE NOT EXISTS (SELECT 1 FROM u WHERE u.id=t.id)",
      "SELECT CASE WHEN a>1 THEN 'x' ELSE 'y' END AS k FROM t",
  };
  for (const char* sql : queries) {
    std::string once = canonical(sql);
    expect_str(canonical(once), once, std::string("fixed point for ") + sql);
  }
}

void test_spacing_function() {
  expect_true(!sqlan::needs_space_between("a", ","), "no space before comma");
  expect_true(sqlan::needs_space_between(",", "b"), "space after comma");
  expect_true(!sqlan::needs_space_between("(", "x"), "no space after open paren");
  expect_true(!sqlan::needs_space_between("count", "("), "call");
  expect_true(sqlan::needs_space_between("from", "("), "keyword before paren");
  expect_true(sqlan::needs_space_between("=", "("), "operator before paren");
  expect_true(!sqlan::needs_space_between("t", "."), "no space before dot");
  expect_str(sqlan::join_tokens({"SELECT", "a", ",", "b"}), "SELECT a, b", "joined");
}

}  // namespace

void register_reconstruction_tests(std::vector<TestCase>& tests) {
  tests.push_back({"reconstruction_whitespace_and_comments_are_normalized",
                   test_whitespace_and_comments_are_normalized});
  tests.push_back({"reconstruction_token_spacing_rules", test_token_spacing_rules});
  tests.push_back({"reconstruction_canonical_form_is_a_fixed_point", test_canonical_form_is_a_fixed_point});
  tests.push_back({"reconstruction_spacing_function", test_spacing_function});
}
