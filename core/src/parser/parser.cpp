#include "parser_internal.h"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "util/string_util.h"

namespace sqlan {

Parser::Parser(std::vector<Token> tokens,
               const SyntaxOptions& syntax,
               size_t depth,
               size_t max_depth,
               size_t end_position)
    : tokens_(std::move(tokens)),
      syntax_(syntax),
      depth_(depth),
      max_depth_(max_depth),
      end_position_(end_position) {}

bool Parser::parse_full(std::unique_ptr<Statement>& out) {
  if (depth_ > max_depth_) {
    return set_error("Maximum nesting depth of " + std::to_string(max_depth_) + " exceeded.");
  }
  if (!parse_statement_with_optional_cte(out)) return false;
  while (match_symbol(";")) {
    advance();
  }
  if (!at_end()) {
    return set_error("Unexpected token '" + current().text + "' after end of statement.");
  }
  return true;
}

bool Parser::parse_statement_with_optional_cte(std::unique_ptr<Statement>& out) {
  std::optional<WithClause> with;
  if (match_keyword("WITH")) {
    WithClause clause;
    if (!parse_with_clause(clause)) return false;
    with = std::move(clause);
  }
  return parse_statement_core(std::move(with), out);
}

/// Parses `WITH [RECURSIVE] name [(columns)] AS (statement) [, ...]`.
/// MUST parse each body as a full nested statement and MUST keep definition order.
/// Inputs are tokens at WITH; outputs are the populated clause or an error.
bool Parser::parse_with_clause(WithClause& out) {
  advance();
  if (match_keyword("RECURSIVE")) {
    advance();
    out.recursive = true;
  }
  while (true) {
    std::string name;
    if (!expect_identifier(name)) return false;
    std::optional<std::vector<std::string>> columns;
    if (match_symbol("(")) {
      advance();
      std::vector<std::string> names;
      while (true) {
        std::string column;
        if (!expect_identifier(column)) return false;
        names.push_back(column);
        if (!match_symbol(",")) break;
        advance();
      }
      if (!expect_symbol(")")) return false;
      columns = std::move(names);
    }
    if (!expect_keyword("AS")) return false;
    if (!match_symbol("(")) {
      return set_error("Expected '(' after AS in WITH clause but found " + describe_current() + ".");
    }
    size_t open = pos_;
    size_t close = find_matching_paren(tokens_, open);
    if (close == std::string::npos) {
      return set_error_at("Unterminated parenthesis in WITH clause definition.", tokens_[open].pos);
    }
    std::vector<Token> body(tokens_.begin() + static_cast<std::ptrdiff_t>(open + 1),
                            tokens_.begin() + static_cast<std::ptrdiff_t>(close));
    std::unique_ptr<Statement> statement;
    if (!parse_nested(std::move(body), tokens_[close].pos, statement)) return false;
    pos_ = close + 1;
    out.definitions.emplace_back(std::move(name), std::move(columns), std::move(statement));
    if (!match_symbol(",")) break;
    advance();
  }
  return true;
}

bool Parser::parse_statement_core(std::optional<WithClause> with, std::unique_ptr<Statement>& out) {
  using Handler = bool (Parser::*)(std::optional<Statement::Body>&);
  static const std::unordered_map<std::string, Handler> kHandlers = {
      {"SELECT", &Parser::parse_select},
      {"INSERT", &Parser::parse_insert},
      {"UPDATE", &Parser::parse_update},
      {"DELETE", &Parser::parse_delete},
  };
  if (at_end()) {
    return set_error("Unexpected end of input while expecting a statement.");
  }
  const Token& token = current();
  auto it = token.is_keyword ? kHandlers.find(token.normalized) : kHandlers.end();
  if (it == kHandlers.end()) {
    return set_error("Unsupported statement starting with '" + token.text + "'.");
  }
  std::optional<Statement::Body> body;
  if (!(this->*(it->second))(body)) return false;
  out = std::make_unique<Statement>(std::move(*body), std::move(with));
  return true;
}

bool Parser::parse_nested(std::vector<Token> tokens,
                          size_t end_position,
                          std::unique_ptr<Statement>& out) {
  Parser nested(std::move(tokens), syntax_, depth_ + 1, max_depth_, end_position);
  if (!nested.parse_full(out)) {
    error_ = nested.error_;
    return false;
  }
  return true;
}

bool Parser::lower_all(std::vector<SegmentPart>& out) {
  return build_parts(tokens_, out);
}

bool Parser::read_fragment_items(SegmentKind kind, std::vector<LoweredItem>& out) {
  if (!read_items(kind, {ClauseStart::StatementEnd}, out)) return false;
  if (!at_end()) {
    return set_error("Unexpected token '" + current().text + "' in fragment.");
  }
  return true;
}

ParseResult parse_sql_impl(const std::string& sql, const ParseOptions& options) {
  ParseResult result;
  if (util::is_blank(sql)) {
    result.error = ParseError{"SQL text must not be empty.", 0};
    return result;
  }
  Parser parser(tokenize(sql, options.syntax), options.syntax, 0, options.max_depth, sql.size());
  std::unique_ptr<Statement> root;
  if (!parser.parse_full(root)) {
    result.error = parser.error();
    return result;
  }
  result.query.emplace(std::move(root), options.syntax);
  return result;
}

std::vector<SegmentPart> lower_fragment(const std::string& sql, const SyntaxOptions& syntax) {
  Parser parser(tokenize(sql, syntax), syntax, 0, ParseOptions().max_depth, sql.size());
  std::vector<SegmentPart> parts;
  if (!parser.lower_all(parts)) {
    throw std::runtime_error("SQL parse error: " + parser.error()->message);
  }
  return parts;
}

std::vector<LoweredItem> lower_list_fragment(const std::string& sql,
                                             const SyntaxOptions& syntax,
                                             SegmentKind kind) {
  Parser parser(tokenize(sql, syntax), syntax, 0, ParseOptions().max_depth, sql.size());
  std::vector<LoweredItem> items;
  if (!parser.read_fragment_items(kind, items)) {
    throw std::runtime_error("SQL parse error: " + parser.error()->message);
  }
  return items;
}

}  // namespace sqlan
