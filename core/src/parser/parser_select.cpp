#include "parser_internal.h"

namespace sqlan {

/// Parses `SELECT [DISTINCT] list [FROM ...] ... [OFFSET ...] [set-operator tail]`.
/// MUST read clauses in grammar order and MUST leave the cursor at the statement end.
/// Inputs are tokens at SELECT; outputs are a SelectStatement body or an error.
bool Parser::parse_select(std::optional<Statement::Body>& out) {
  static const std::vector<OptionalClause<SelectStatement>> kClauses = {
      {ClauseStart::From, SegmentKind::TableList, &SelectStatement::from},
      {ClauseStart::Where, SegmentKind::Plain, &SelectStatement::where},
      {ClauseStart::GroupBy, SegmentKind::ExpressionList, &SelectStatement::group_by},
      {ClauseStart::Having, SegmentKind::Plain, &SelectStatement::having},
      {ClauseStart::OrderBy, SegmentKind::ExpressionList, &SelectStatement::order_by},
      {ClauseStart::Limit, SegmentKind::Plain, &SelectStatement::limit},
      {ClauseStart::Offset, SegmentKind::Plain, &SelectStatement::offset},
  };
  static const std::vector<ClauseStart> kTrailing = {ClauseStart::SetOperator,
                                                     ClauseStart::StatementEnd};

  SelectStatement select(syntax_);
  advance();
  if (match_keyword("DISTINCT")) {
    advance();
    select.distinct = true;
  }

  std::vector<ClauseStart> list_terminators;
  for (const auto& clause : kClauses) list_terminators.push_back(clause.clause);
  list_terminators.insert(list_terminators.end(), kTrailing.begin(), kTrailing.end());
  if (!read_clause_body(select.select, ClauseStart::Select, list_terminators)) return false;

  if (!read_optional_clauses(select, kClauses, kTrailing)) return false;
  if (!parse_set_operator_tail(select)) return false;
  out = Statement::Body(std::move(select));
  return true;
}

/// Captures `UNION|EXCEPT|INTERSECT ...` to the statement end as the raw Tail segment.
bool Parser::parse_set_operator_tail(SelectStatement& select) {
  if (match_clause(tokens_, pos_, ClauseStart::SetOperator) == 0) return true;
  std::vector<Token> tokens;
  tokens.push_back(current());
  advance();
  if (match_keyword("ALL") || match_keyword("DISTINCT")) {
    tokens.push_back(current());
    advance();
  }
  std::vector<Token> rest = read_section_tokens({ClauseStart::StatementEnd});
  if (rest.empty()) {
    return set_error("Expected statement after " + tokens.front().normalized + ".");
  }
  tokens.insert(tokens.end(), rest.begin(), rest.end());
  std::vector<SegmentPart> parts;
  if (!build_parts(tokens, parts)) return false;
  select.ensure_tail().append_parts(std::move(parts));
  return true;
}

}  // namespace sqlan
