#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "clause_registry.h"
#include "lexer.h"
#include "query_parser_impl.h"

namespace sqlan {

/// An optional clause slot of a statement body, read in grammar order.
template <typename Body>
struct OptionalClause {
  ClauseStart clause;
  SegmentKind kind;
  std::optional<Segment> Body::*slot;
};

/// Implements the clause-oriented recursive-descent parser over a token list.
/// MUST preserve every token in some segment and MUST stop at the first error.
/// Inputs are tokens of one statement (or a nested slice); outputs are statements or errors.
class Parser {
 public:
  /// Constructs a parser over a token list.
  /// end_position is reported for errors at end of input (byte offset in the source).
  Parser(std::vector<Token> tokens,
         const SyntaxOptions& syntax,
         size_t depth,
         size_t max_depth,
         size_t end_position);

  /// Parses `[WITH ...] statement [;...]` and requires the input to be exhausted.
  /// MUST enforce the nesting limit before reading anything.
  /// Inputs are internal state; outputs are the statement or a recorded error.
  bool parse_full(std::unique_ptr<Statement>& out);
  /// Lowers the whole token list into parts (fragment mode).
  bool lower_all(std::vector<SegmentPart>& out);
  /// Reads the whole token list as list items of the given kind (fragment mode).
  bool read_fragment_items(SegmentKind kind, std::vector<LoweredItem>& out);

  const std::optional<ParseError>& error() const { return error_; }

 private:
  bool parse_statement_with_optional_cte(std::unique_ptr<Statement>& out);
  bool parse_with_clause(WithClause& out);
  bool parse_statement_core(std::optional<WithClause> with, std::unique_ptr<Statement>& out);

  bool parse_select(std::optional<Statement::Body>& out);
  bool parse_insert(std::optional<Statement::Body>& out);
  bool parse_update(std::optional<Statement::Body>& out);
  bool parse_delete(std::optional<Statement::Body>& out);
  bool parse_set_operator_tail(SelectStatement& select);
  bool parse_insert_source(InsertStatement& insert);

  /// Reads the body of an already consumed clause keyword into a segment.
  /// MUST reject empty bodies with a clause-specific message.
  bool read_clause_body(Segment& segment,
                        ClauseStart clause,
                        const std::vector<ClauseStart>& terminators);
  /// Reads one target span (INSERT INTO, UPDATE, DELETE) into a fresh segment.
  bool read_target(Segment& segment,
                   const std::vector<ClauseStart>& terminators,
                   const std::string& message);
  template <typename Body>
  bool read_optional_clauses(Body& body,
                             const std::vector<OptionalClause<Body>>& clauses,
                             const std::vector<ClauseStart>& trailing);

  bool read_items(SegmentKind kind,
                  const std::vector<ClauseStart>& terminators,
                  std::vector<LoweredItem>& out);
  bool read_expression(std::vector<Token>& out, const std::vector<ClauseStart>& terminators);
  bool read_table(std::vector<Token>& out, const std::vector<ClauseStart>& terminators);
  bool split_alias(const std::vector<Token>& tokens, LoweredItem& item);
  std::vector<Token> read_section_tokens(const std::vector<ClauseStart>& terminators);

  bool build_parts(const std::vector<Token>& tokens, std::vector<SegmentPart>& out);
  bool parse_nested(std::vector<Token> tokens, size_t end_position, std::unique_ptr<Statement>& out);

  bool at_end() const { return pos_ >= tokens_.size(); }
  const Token& current() const { return tokens_[pos_]; }
  void advance();
  bool match_keyword(const char* keyword) const;
  bool match_symbol(const char* symbol) const;
  bool expect_keyword(const char* keyword);
  bool expect_symbol(const char* symbol);
  bool expect_identifier(std::string& out);
  std::string describe_current() const;
  size_t current_position() const;

  bool set_error(const std::string& message);
  bool set_error_at(const std::string& message, size_t position);

  static size_t find_matching_paren(const std::vector<Token>& tokens, size_t open);
  static bool starts_statement(const Token& token);

  std::vector<Token> tokens_;
  const SyntaxOptions& syntax_;
  size_t pos_ = 0;
  size_t depth_ = 0;
  size_t max_depth_ = 0;
  size_t end_position_ = 0;
  std::optional<ParseError> error_;
};

template <typename Body>
bool Parser::read_optional_clauses(Body& body,
                                   const std::vector<OptionalClause<Body>>& clauses,
                                   const std::vector<ClauseStart>& trailing) {
  for (size_t i = 0; i < clauses.size(); ++i) {
    size_t width = match_clause(tokens_, pos_, clauses[i].clause);
    if (width == 0) continue;
    pos_ += width;
    // WHY: a clause body ends where any later clause of the same grammar begins.
    std::vector<ClauseStart> terminators;
    for (size_t j = i + 1; j < clauses.size(); ++j) terminators.push_back(clauses[j].clause);
    terminators.insert(terminators.end(), trailing.begin(), trailing.end());
    Segment segment(clause_name(clauses[i].clause), syntax_, clauses[i].kind);
    if (!read_clause_body(segment, clauses[i].clause, terminators)) return false;
    body.*(clauses[i].slot) = std::move(segment);
  }
  return true;
}

}  // namespace sqlan
