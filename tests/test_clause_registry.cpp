#include "test_harness.h"

#include "parser/clause_registry.h"
#include "parser/lexer.h"

namespace {

using sqlan::ClauseStart;
using sqlan::SyntaxOptions;
using sqlan::tokenize;

void test_multi_keyword_clauses() {
  auto tokens = tokenize("GROUP BY a ORDER BY b", SyntaxOptions::defaults());
  expect_eq(sqlan::match_clause(tokens, 0, ClauseStart::GroupBy), 2, "GROUP BY width");
  expect_eq(sqlan::match_clause(tokens, 3, ClauseStart::OrderBy), 2, "ORDER BY width");
  expect_eq(sqlan::match_clause(tokens, 0, ClauseStart::OrderBy), 0, "GROUP is not ORDER");
  auto lone = tokenize("GROUP a", SyntaxOptions::defaults());
  expect_eq(sqlan::match_clause(lone, 0, ClauseStart::GroupBy), 0, "GROUP alone does not match");
  auto dml = tokenize("INTO UPDATE DELETE SET", SyntaxOptions::defaults());
  expect_eq(sqlan::match_clause(dml, 0, ClauseStart::Into), 1, "INTO");
  expect_eq(sqlan::match_clause(dml, 1, ClauseStart::Update), 1, "UPDATE");
  expect_eq(sqlan::match_clause(dml, 2, ClauseStart::Delete), 1, "DELETE");
  expect_eq(sqlan::match_clause(dml, 3, ClauseStart::Set), 1, "SET");
  expect_eq(sqlan::clause_keywords(ClauseStart::StatementEnd).size(), 0, "statement end has no keywords");
}

void test_set_operators_and_select_variants() {
  auto tokens = tokenize("UNION EXCEPT INTERSECT WITH SELECT", SyntaxOptions::defaults());
  expect_true(sqlan::is_clause_start(tokens, 0, {ClauseStart::SetOperator}), "UNION");
  expect_true(sqlan::is_clause_start(tokens, 1, {ClauseStart::SetOperator}), "EXCEPT");
  expect_true(sqlan::is_clause_start(tokens, 2, {ClauseStart::SetOperator}), "INTERSECT");
  expect_true(sqlan::is_clause_start(tokens, 3, {ClauseStart::Select}), "WITH opens a select");
  expect_true(sqlan::is_clause_start(tokens, 4, {ClauseStart::Select}), "SELECT");
}

void test_statement_end() {
  auto tokens = tokenize("a ; b", SyntaxOptions::defaults());
  expect_true(!sqlan::is_clause_start(tokens, 0, {ClauseStart::StatementEnd}), "identifier");
  expect_true(sqlan::is_clause_start(tokens, 1, {ClauseStart::StatementEnd}), "semicolon");
  expect_true(sqlan::is_clause_start(tokens, 3, {ClauseStart::StatementEnd}), "end of input");
}

void test_identifiers_never_start_clauses() {
  auto tokens = tokenize("[FROM] \"WHERE\"", SyntaxOptions::defaults());
  expect_true(!sqlan::is_clause_start(tokens, 0, {ClauseStart::From}), "bracketed FROM");
  expect_true(!sqlan::is_clause_start(tokens, 1, {ClauseStart::Where}), "quoted WHERE");
  expect_true(std::string(sqlan::clause_name(ClauseStart::GroupBy)) == "GroupBy", "clause name");
}

}  // namespace

void register_clause_registry_tests(std::vector<TestCase>& tests) {
  tests.push_back({"clause_multi_keyword_clauses", test_multi_keyword_clauses});
  tests.push_back({"clause_set_operators_and_select_variants", test_set_operators_and_select_variants});
  tests.push_back({"clause_statement_end", test_statement_end});
  tests.push_back({"clause_identifiers_never_start_clauses", test_identifiers_never_start_clauses});
}
