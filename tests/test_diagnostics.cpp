#include "test_harness.h"

#include "sqlan/diagnostics.h"

namespace {

void test_locate_position() {
  const std::string sql = "SELECT a\nFROM t\nWHERE";
  auto start = sqlan::locate_position(sql, 0);
  expect_eq(start.line, 1, "start line");
  expect_eq(start.column, 1, "start column");
  auto second = sqlan::locate_position(sql, 11);
  expect_eq(second.line, 2, "second line");
  expect_eq(second.column, 3, "second column");
  auto third = sqlan::locate_position(sql, 16);
  expect_eq(third.line, 3, "third line");
  expect_eq(third.column, 1, "third column");
  auto clamped = sqlan::locate_position("abc", 100);
  expect_eq(clamped.line, 1, "clamped line");
  expect_eq(clamped.column, 4, "clamped to end");
}

void test_code_frame() {
  expect_str(sqlan::render_code_frame("SELECT a FROM t )", 16),
             "1 | SELECT a FROM t )\n"
             "  | " + std::string(16, ' ') + "^",
             "single line frame");
  expect_str(sqlan::render_code_frame("SELECT a\nFROM t\nWHERE", 21),
             "3 | WHERE\n"
             "  |      ^",
             "frame shows only the offending line");
  expect_str(sqlan::render_code_frame("", 0), "", "empty input has no frame");
}

void test_render_parse_error() {
  const std::string sql = "SELECT a FROM t WHERE";
  auto result = sqlan::parse_sql(sql);
  expect_true(result.error.has_value(), "error expected");
  if (!result.error) return;
  expect_str(sqlan::render_parse_error(sql, *result.error),
             "error: Expected predicate after WHERE.\n"
             " --> line 1, col 22\n"
             "1 | SELECT a FROM t WHERE\n"
             "  | " + std::string(21, ' ') + "^",
             "rendered diagnostic");
}

}  // namespace

void register_diagnostics_tests(std::vector<TestCase>& tests) {
  tests.push_back({"diagnostics_locate_position", test_locate_position});
  tests.push_back({"diagnostics_code_frame", test_code_frame});
  tests.push_back({"diagnostics_render_parse_error", test_render_parse_error});
}
