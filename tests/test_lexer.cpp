#include "test_harness.h"

#include "parser/lexer.h"

namespace {

using sqlan::SyntaxOptions;
using sqlan::TokenType;
using sqlan::tokenize;

void test_keywords_are_normalized() {
  auto tokens = tokenize("select Name from Users", SyntaxOptions::defaults());
  expect_eq(tokens.size(), 4, "token count");
  if (tokens.size() != 4) return;
  expect_true(tokens[0].is_keyword, "select is keyword");
  expect_true(tokens[0].normalized == "SELECT", "select normalized");
  expect_true(tokens[0].text == "select", "select text kept");
  expect_true(tokens[1].is_identifier, "Name is identifier");
  expect_true(tokens[1].normalized == "Name", "identifier casing kept");
  expect_true(tokens[3].text == "Users", "table text");
}

void test_positions_are_byte_offsets() {
  auto tokens = tokenize("SELECT  a,b", SyntaxOptions::defaults());
  expect_eq(tokens.size(), 4, "token count");
  if (tokens.size() != 4) return;
  expect_eq(tokens[0].pos, 0, "SELECT offset");
  expect_eq(tokens[1].pos, 8, "a offset");
  expect_eq(tokens[2].pos, 9, "comma offset");
  expect_eq(tokens[3].pos, 10, "b offset");
}

void test_string_literal_with_escaped_quote() {
  auto tokens = tokenize("WHERE name = 'O''Brien'", SyntaxOptions::defaults());
  expect_eq(tokens.size(), 4, "token count");
  if (tokens.size() != 4) return;
  expect_true(tokens[3].type == TokenType::String, "string type");
  expect_true(tokens[3].text == "'O''Brien'", "string kept verbatim");
  expect_true(!tokens[3].is_identifier, "string is not identifier");
}

void test_delimited_identifiers() {
  auto tokens = tokenize("SELECT [Order Id], \"Total\" FROM t", SyntaxOptions::defaults());
  expect_eq(tokens.size(), 6, "token count");
  if (tokens.size() != 6) return;
  expect_true(tokens[1].text == "[Order Id]", "bracketed kept");
  expect_true(tokens[1].is_identifier, "bracketed is identifier");
  expect_true(tokens[3].text == "\"Total\"", "quoted kept");
  expect_true(tokens[3].is_identifier, "quoted is identifier");
}

void test_prefixed_identifiers_follow_dialect() {
  auto server = tokenize("WHERE Id = @id AND t = #tmp", SyntaxOptions::sql_server());
  expect_eq(server.size(), 8, "sql server token count");
  if (server.size() == 8) {
    expect_true(server[3].text == "@id", "@id single token");
    expect_true(server[7].text == "#tmp", "#tmp single token");
  }
  auto pg = tokenize("WHERE Id = @id", SyntaxOptions::postgresql());
  expect_eq(pg.size(), 5, "postgres splits @");
  auto oracle = tokenize("WHERE Id = :id", SyntaxOptions::oracle());
  expect_eq(oracle.size(), 4, "oracle keeps :id");
  if (oracle.size() == 4) {
    expect_true(oracle[3].text == ":id", ":id text");
  }
}

void test_comments_are_skipped() {
  auto tokens = tokenize("SELECT a -- trailing\n, /* block */ b", SyntaxOptions::defaults());
  expect_eq(tokens.size(), 4, "comments removed");
  auto unterminated = tokenize("SELECT a /* never closed", SyntaxOptions::defaults());
  expect_eq(unterminated.size(), 2, "unterminated block comment runs to end");
}

void test_two_character_operators() {
  auto tokens = tokenize("a >= 1 AND b <> 2 AND c != 3 AND d <= 4 AND e || f AND g::int",
                         SyntaxOptions::postgresql());
  bool saw_ge = false;
  bool saw_ne = false;
  bool saw_bang = false;
  bool saw_le = false;
  bool saw_concat = false;
  bool saw_cast = false;
  for (const auto& token : tokens) {
    saw_ge = saw_ge || token.text == ">=";
    saw_ne = saw_ne || token.text == "<>";
    saw_bang = saw_bang || token.text == "!=";
    saw_le = saw_le || token.text == "<=";
    saw_concat = saw_concat || token.text == "||";
    saw_cast = saw_cast || token.text == "::";
  }
  expect_true(saw_ge && saw_ne && saw_bang && saw_le, "comparison operators");
  expect_true(saw_concat, "concatenation operator");
  expect_true(saw_cast, "cast operator");
}

void test_numbers_and_unterminated_string() {
  auto tokens = tokenize("LIMIT 10 OFFSET 2.5", SyntaxOptions::defaults());
  expect_eq(tokens.size(), 4, "token count");
  if (tokens.size() == 4) {
    expect_true(tokens[1].type == TokenType::Number, "number type");
    expect_true(tokens[3].text == "2.5", "decimal kept");
  }
  auto open = tokenize("SELECT 'abc", SyntaxOptions::defaults());
  expect_eq(open.size(), 2, "unterminated string is one token");
  if (open.size() == 2) {
    expect_true(open[1].text == "'abc", "unterminated string runs to end");
  }
}

}  // namespace

void register_lexer_tests(std::vector<TestCase>& tests) {
  tests.push_back({"lexer_keywords_are_normalized", test_keywords_are_normalized});
  tests.push_back({"lexer_positions_are_byte_offsets", test_positions_are_byte_offsets});
  tests.push_back({"lexer_string_literal_with_escaped_quote", test_string_literal_with_escaped_quote});
  tests.push_back({"lexer_delimited_identifiers", test_delimited_identifiers});
  tests.push_back({"lexer_prefixed_identifiers_follow_dialect", test_prefixed_identifiers_follow_dialect});
  tests.push_back({"lexer_comments_are_skipped", test_comments_are_skipped});
  tests.push_back({"lexer_two_character_operators", test_two_character_operators});
  tests.push_back({"lexer_numbers_and_unterminated_string", test_numbers_and_unterminated_string});
}
