#include "parser_internal.h"

#include <cstddef>

namespace sqlan {

/// Parses `INSERT INTO target [OUTPUT ...] (VALUES ... | statement) [RETURNING ...]`.
/// MUST accept exactly one of VALUES or a nested SELECT/WITH source.
/// Inputs are tokens at INSERT; outputs are an InsertStatement body or an error.
bool Parser::parse_insert(std::optional<Statement::Body>& out) {
  InsertStatement insert(syntax_);
  advance();
  if (!expect_keyword("INTO")) return false;
  if (!read_target(insert.target,
                   {ClauseStart::Output, ClauseStart::Values, ClauseStart::Select,
                    ClauseStart::Returning, ClauseStart::StatementEnd},
                   "Expected target table after INSERT INTO.")) {
    return false;
  }
  if (match_keyword("OUTPUT")) {
    advance();
    Segment output("Output", syntax_, SegmentKind::AliasedList);
    if (!read_clause_body(output, ClauseStart::Output,
                          {ClauseStart::Values, ClauseStart::Select, ClauseStart::Returning,
                           ClauseStart::StatementEnd})) {
      return false;
    }
    insert.output = std::move(output);
  }
  if (match_keyword("VALUES")) {
    advance();
    Segment values("Values", syntax_, SegmentKind::ExpressionList);
    if (!read_clause_body(values, ClauseStart::Values,
                          {ClauseStart::Returning, ClauseStart::StatementEnd})) {
      return false;
    }
    insert.values = std::move(values);
  } else if (match_clause(tokens_, pos_, ClauseStart::Select) > 0) {
    if (!parse_insert_source(insert)) return false;
  } else {
    return set_error("Expected VALUES or SELECT clause in INSERT statement.");
  }
  if (match_keyword("RETURNING")) {
    advance();
    Segment returning("Returning", syntax_, SegmentKind::ExpressionList);
    if (!read_clause_body(returning, ClauseStart::Returning, {ClauseStart::StatementEnd})) {
      return false;
    }
    insert.returning = std::move(returning);
  }
  out = Statement::Body(std::move(insert));
  return true;
}

/// Parses the SELECT/WITH data source of an INSERT up to a top-level RETURNING.
bool Parser::parse_insert_source(InsertStatement& insert) {
  size_t depth = 0;
  size_t end = pos_;
  for (; end < tokens_.size(); ++end) {
    const Token& token = tokens_[end];
    if (depth == 0) {
      if (token.text == ")" || token.text == ";") break;
      if (token.is_keyword && token.normalized == "RETURNING") break;
    }
    if (token.text == "(") {
      ++depth;
    } else if (token.text == ")") {
      --depth;
    }
  }
  std::vector<Token> source(tokens_.begin() + static_cast<std::ptrdiff_t>(pos_),
                            tokens_.begin() + static_cast<std::ptrdiff_t>(end));
  size_t end_position = end < tokens_.size() ? tokens_[end].pos : end_position_;
  if (!parse_nested(std::move(source), end_position, insert.source_query)) return false;
  pos_ = end;
  return true;
}

/// Parses `UPDATE target SET ... [OUTPUT ...] [FROM ...] [WHERE ...] [RETURNING ...]`.
bool Parser::parse_update(std::optional<Statement::Body>& out) {
  static const std::vector<OptionalClause<UpdateStatement>> kClauses = {
      {ClauseStart::Output, SegmentKind::AliasedList, &UpdateStatement::output},
      {ClauseStart::From, SegmentKind::TableList, &UpdateStatement::from},
      {ClauseStart::Where, SegmentKind::Plain, &UpdateStatement::where},
      {ClauseStart::Returning, SegmentKind::ExpressionList, &UpdateStatement::returning},
  };
  UpdateStatement update(syntax_);
  advance();
  if (!read_target(update.target, {ClauseStart::Set, ClauseStart::StatementEnd},
                   "Expected target table after UPDATE.")) {
    return false;
  }
  if (!expect_keyword("SET")) return false;
  std::vector<ClauseStart> set_terminators;
  for (const auto& clause : kClauses) set_terminators.push_back(clause.clause);
  set_terminators.push_back(ClauseStart::StatementEnd);
  if (!read_clause_body(update.set, ClauseStart::Set, set_terminators)) return false;
  if (!read_optional_clauses(update, kClauses, {ClauseStart::StatementEnd})) return false;
  out = Statement::Body(std::move(update));
  return true;
}

/// Parses `DELETE [target] FROM ... [OUTPUT ...] [USING ...] [WHERE ...] [RETURNING ...]`.
bool Parser::parse_delete(std::optional<Statement::Body>& out) {
  static const std::vector<OptionalClause<DeleteStatement>> kClauses = {
      {ClauseStart::Output, SegmentKind::AliasedList, &DeleteStatement::output},
      {ClauseStart::Using, SegmentKind::TableList, &DeleteStatement::using_tables},
      {ClauseStart::Where, SegmentKind::Plain, &DeleteStatement::where},
      {ClauseStart::Returning, SegmentKind::ExpressionList, &DeleteStatement::returning},
  };
  DeleteStatement del(syntax_);
  advance();
  if (!match_keyword("FROM")) {
    std::vector<Token> target = read_section_tokens({ClauseStart::From, ClauseStart::StatementEnd});
    if (!target.empty()) {
      std::vector<SegmentPart> parts;
      if (!build_parts(target, parts)) return false;
      del.ensure_target().append_parts(std::move(parts));
    }
  }
  if (!expect_keyword("FROM")) return false;
  std::vector<ClauseStart> from_terminators;
  for (const auto& clause : kClauses) from_terminators.push_back(clause.clause);
  from_terminators.push_back(ClauseStart::StatementEnd);
  if (!read_clause_body(del.from, ClauseStart::From, from_terminators)) return false;
  if (!read_optional_clauses(del, kClauses, {ClauseStart::StatementEnd})) return false;
  out = Statement::Body(std::move(del));
  return true;
}

}  // namespace sqlan
