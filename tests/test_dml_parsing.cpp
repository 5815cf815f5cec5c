#include "test_harness.h"

#include <stdexcept>

#include "sqlan/sqlan.h"

namespace {

using sqlan::StatementKind;

void test_insert_values() {
  const std::string sql = "INSERT INTO products(name, price) VALUES ('Widget', 9.99)";
  auto result = sqlan::parse_sql(sql);
  expect_true(result.query.has_value(), "parse succeeds");
  if (!result.query) return;
  const auto* insert = result.query->root().as_insert();
  expect_true(insert != nullptr, "insert body");
  if (insert == nullptr) return;
  expect_str(insert->target.to_sql(), "products(name, price)", "target with columns");
  expect_true(insert->values.has_value(), "values present");
  expect_str(insert->values->to_sql(), "('Widget', 9.99)", "values text");
  expect_true(insert->source_query == nullptr, "no source query");
  expect_str(result.query->to_sql(), sql, "round trip");
}

void test_insert_multi_row_returning() {
  auto result = sqlan::parse_sql("insert into t (a, b) values (1, 2), (3, 4) returning id");
  expect_true(result.query.has_value(), "parse succeeds");
  if (!result.query) return;
  const auto* insert = result.query->root().as_insert();
  expect_eq(insert->values->items().size(), 2, "two rows");
  expect_true(insert->returning.has_value(), "returning present");
  expect_str(result.query->to_sql(), "INSERT INTO t(a, b) VALUES (1, 2), (3, 4) RETURNING id",
             "canonical text");
}

void test_insert_from_select() {
  auto result = sqlan::parse_sql("INSERT INTO archive SELECT * FROM logs WHERE created < '2020-01-01'");
  expect_true(result.query.has_value(), "parse succeeds");
  if (!result.query) return;
  auto* insert = result.query->root().as_insert();
  expect_true(insert->source_query != nullptr, "source query parsed");
  expect_true(!insert->values.has_value(), "no values");
  expect_eq(result.query->all_statements().size(), 2, "insert and its source");
  bool threw = false;
  try {
    insert->ensure_values();
  } catch (const std::logic_error&) {
    threw = true;
  }
  expect_true(threw, "values cannot be added next to a source query");
}

void test_insert_output_clause() {
  const std::string sql = "INSERT INTO t(a) OUTPUT inserted.id VALUES (1)";
  auto result = sqlan::parse_sql(sql);
  expect_true(result.query.has_value(), "parse succeeds");
  if (!result.query) return;
  const auto* insert = result.query->root().as_insert();
  expect_true(insert->output.has_value(), "output present");
  expect_str(insert->output->to_sql(), "inserted.id", "output text");
  expect_str(result.query->to_sql(), sql, "round trip");
}

void test_update() {
  const std::string sql =
      "UPDATE accounts SET balance = balance - 100, updated_at = NOW() WHERE id = @id";
  auto result = sqlan::parse_sql(sql);
  expect_true(result.query.has_value(), "parse succeeds");
  if (!result.query) return;
  const auto* update = result.query->root().as_update();
  expect_true(update != nullptr, "update body");
  if (update == nullptr) return;
  expect_str(update->target.to_sql(), "accounts", "target");
  expect_eq(update->set.items().size(), 2, "two assignments");
  expect_str(update->where->to_sql(), "id = @id", "where");
  expect_str(result.query->to_sql(), sql, "round trip");
}

void test_update_with_from() {
  const std::string sql = "UPDATE t SET a = s.a FROM t INNER JOIN s ON s.id = t.id WHERE s.flag = 1";
  auto result = sqlan::parse_sql(sql);
  expect_true(result.query.has_value(), "parse succeeds");
  if (!result.query) return;
  const auto* update = result.query->root().as_update();
  expect_true(update->from.has_value(), "from present");
  expect_str(update->from->to_sql(), "t INNER JOIN s ON s.id = t.id", "from text");
  expect_str(result.query->to_sql(), sql, "round trip");
}

void test_delete_using_returning() {
  const std::string sql =
      "DELETE FROM sessions s USING users u WHERE u.id = s.user_id RETURNING s.id";
  auto result = sqlan::parse_sql(sql);
  expect_true(result.query.has_value(), "parse succeeds");
  if (!result.query) return;
  const auto& root = result.query->root();
  expect_true(root.kind() == StatementKind::Delete, "delete kind");
  const auto* del = root.as_delete();
  expect_true(!del->target.has_value(), "no target");
  expect_str(del->from.to_sql(), "sessions s", "from");
  expect_true(del->using_tables.has_value(), "using present");
  expect_str(del->using_tables->to_sql(), "users u", "using");
  expect_str(del->returning->to_sql(), "s.id", "returning");
  expect_str(root.to_sql(), sql, "round trip");
}

void test_delete_with_target() {
  const std::string sql = "DELETE t FROM t INNER JOIN x ON x.id = t.id WHERE x.gone = 1";
  auto result = sqlan::parse_sql(sql);
  expect_true(result.query.has_value(), "parse succeeds");
  if (!result.query) return;
  const auto* del = result.query->root().as_delete();
  expect_true(del->target.has_value(), "target present");
  expect_str(del->target->to_sql(), "t", "target");
  expect_str(result.query->to_sql(), sql, "round trip");
}

void test_sql_server_prefixes_round_trip() {
  const std::string sql = "SELECT * FROM #temp WHERE Id = @id";
  auto result = sqlan::parse_sql(sql, sqlan::SyntaxOptions::sql_server());
  expect_true(result.query.has_value(), "parse succeeds");
  if (!result.query) return;
  expect_str(result.query->to_sql(), sql, "round trip");
}

}  // namespace

void register_dml_parsing_tests(std::vector<TestCase>& tests) {
  tests.push_back({"dml_insert_values", test_insert_values});
  tests.push_back({"dml_insert_multi_row_returning", test_insert_multi_row_returning});
  tests.push_back({"dml_insert_from_select", test_insert_from_select});
  tests.push_back({"dml_insert_output_clause", test_insert_output_clause});
  tests.push_back({"dml_update", test_update});
  tests.push_back({"dml_update_with_from", test_update_with_from});
  tests.push_back({"dml_delete_using_returning", test_delete_using_returning});
  tests.push_back({"dml_delete_with_target", test_delete_with_target});
  tests.push_back({"dml_sql_server_prefixes_round_trip", test_sql_server_prefixes_round_trip});
}
