#include "test_harness.h"

#include <stdexcept>

#include "sqlan/sqlan.h"

namespace {

void test_build_up_a_select() {
  auto result = sqlan::parse_sql("SELECT table1.champ1 FROM table1");
  expect_true(result.query.has_value(), "parse succeeds");
  if (!result.query) return;
  sqlan::SelectStatement* select = result.query->root().as_select();
  select->select.add_comma_separated_element("table1.champ2");
  select->ensure_where().add_raw("table1.champ1 IS NOT NULL");
  select->ensure_order_by().add_raw("table1.champ1");
  expect_str(result.query->to_sql(),
             "SELECT table1.champ1, table1.champ2 FROM table1 WHERE table1.champ1 IS NOT NULL "
             "ORDER BY table1.champ1",
             "mutated statement");
  expect_eq(select->select.items().size(), 2, "select list items");
  expect_eq(select->order_by->items().size(), 1, "order by items");
}

void test_ensure_is_idempotent_and_empty_segments_are_omitted() {
  auto result = sqlan::parse_sql("SELECT a FROM t");
  if (!result.query) {
    expect_true(false, "parse succeeds");
    return;
  }
  sqlan::SelectStatement* select = result.query->root().as_select();
  sqlan::Segment& first = select->ensure_where();
  sqlan::Segment& second = select->ensure_where();
  expect_true(&first == &second, "same segment returned");
  expect_true(first.is_empty(), "new segment is empty");
  expect_str(result.query->to_sql(), "SELECT a FROM t", "empty where is not rendered");
}

void test_add_conjunction() {
  auto result = sqlan::parse_sql("SELECT a FROM t WHERE a = 1");
  if (!result.query) {
    expect_true(false, "parse succeeds");
    return;
  }
  sqlan::SelectStatement* select = result.query->root().as_select();
  select->where->add_conjunction("AND", "b = 2");
  select->ensure_having().add_conjunction("AND", "COUNT(*) > 1");
  expect_str(select->where->to_sql(), "a = 1 AND b = 2", "conjunction appended");
  expect_str(select->having->to_sql(), "COUNT(*) > 1", "conjunction skipped on empty segment");

  bool blank_expression = false;
  try {
    select->where->add_conjunction("OR", "  ");
  } catch (const std::invalid_argument&) {
    blank_expression = true;
  }
  expect_true(blank_expression, "blank expression rejected");

  bool blank_conjunction = false;
  try {
    select->where->add_conjunction("", "c = 3");
  } catch (const std::invalid_argument&) {
    blank_conjunction = true;
  }
  expect_true(blank_conjunction, "blank conjunction rejected on non-empty segment");
  expect_str(select->where->to_sql(), "a = 1 AND b = 2", "failed calls leave the segment untouched");
}

void test_fragments_with_subqueries() {
  auto result = sqlan::parse_sql("SELECT id FROM customers");
  if (!result.query) {
    expect_true(false, "parse succeeds");
    return;
  }
  sqlan::SelectStatement* select = result.query->root().as_select();
  expect_eq(result.query->all_statements().size(), 1, "before mutation");
  select->ensure_where().add_raw("id IN (SELECT customer_id FROM vip)");
  expect_eq(result.query->all_statements().size(), 2, "fragment subquery is enumerated");

  bool threw = false;
  try {
    select->where->add_conjunction("AND", "id IN (SELECT FROM banned)");
  } catch (const std::runtime_error& ex) {
    threw = std::string(ex.what()).rfind("SQL parse error: ", 0) == 0;
  }
  expect_true(threw, "bad fragment subquery reports a parse error");
  expect_str(result.query->to_sql(),
             "SELECT id FROM customers WHERE id IN (SELECT customer_id FROM vip)",
             "rendered with fragment subquery");
}

void test_aliases_in_added_elements() {
  auto result = sqlan::parse_sql("SELECT region FROM sales GROUP BY region");
  if (!result.query) {
    expect_true(false, "parse succeeds");
    return;
  }
  sqlan::SelectStatement* select = result.query->root().as_select();
  select->select.add_comma_separated_element("SUM(amount) AS total, COUNT(*) n");
  expect_eq(select->select.items().size(), 3, "two elements added");
  if (select->select.items().size() != 3) return;
  expect_true(select->select.items()[1].alias == std::string("total"), "explicit alias inferred");
  expect_true(select->select.items()[2].alias == std::string("n"), "implicit alias inferred");
  expect_str(select->select.to_sql(), "region, SUM(amount) AS total, COUNT(*) n", "select text");
}

void test_add_raw_extends_last_item() {
  auto result = sqlan::parse_sql("SELECT price FROM t");
  if (!result.query) {
    expect_true(false, "parse succeeds");
    return;
  }
  sqlan::Segment& select = result.query->root().as_select()->select;
  select.add_raw("* 2");
  expect_eq(select.items().size(), 1, "still one item");
  expect_str(select.item_sql(0), "price * 2", "item extended");
  bool threw = false;
  try {
    select.add_raw("");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  expect_true(threw, "blank fragment rejected");
}

void test_lookup_by_name_after_mutation() {
  auto result = sqlan::parse_sql("DELETE FROM logs");
  if (!result.query) {
    expect_true(false, "parse succeeds");
    return;
  }
  expect_true(result.query->root().segment("Where") == nullptr, "no where yet");
  result.query->root().as_delete()->ensure_where().add_raw("created < '2020-01-01'");
  expect_true(result.query->root().segment("Where") != nullptr, "where found by name");
  expect_str(result.query->to_sql(), "DELETE FROM logs WHERE created < '2020-01-01'", "delete text");
}

}  // namespace

void register_segment_mutation_tests(std::vector<TestCase>& tests) {
  tests.push_back({"mutation_build_up_a_select", test_build_up_a_select});
  tests.push_back({"mutation_ensure_is_idempotent_and_empty_segments_are_omitted",
                   test_ensure_is_idempotent_and_empty_segments_are_omitted});
  tests.push_back({"mutation_add_conjunction", test_add_conjunction});
  tests.push_back({"mutation_fragments_with_subqueries", test_fragments_with_subqueries});
  tests.push_back({"mutation_aliases_in_added_elements", test_aliases_in_added_elements});
  tests.push_back({"mutation_add_raw_extends_last_item", test_add_raw_extends_last_item});
  tests.push_back({"mutation_lookup_by_name_after_mutation", test_lookup_by_name_after_mutation});
}
