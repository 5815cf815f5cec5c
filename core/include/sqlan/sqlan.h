#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sqlan/formatting.h"
#include "sqlan/statement.h"
#include "sqlan/syntax_options.h"

namespace sqlan {

/// Describes a parse failure with a message and byte position.
/// MUST report positions relative to the parsed input string.
/// Inputs are parser diagnostics; outputs are error details only.
struct ParseError {
  std::string message;
  size_t position = 0;
};

/// Tunes a parse: dialect prefixes and the statement nesting limit.
struct ParseOptions {
  SyntaxOptions syntax = SyntaxOptions::defaults();
  size_t max_depth = 128;
};

/// A parsed SQL text: the root statement and the dialect it was read with.
/// MUST own the whole statement tree.
/// Inputs are parser output; outputs are traversal helpers and regenerated SQL.
class SqlQuery {
 public:
  SqlQuery(std::unique_ptr<Statement> root, SyntaxOptions syntax);

  Statement& root() { return *root_; }
  const Statement& root() const { return *root_; }
  const SyntaxOptions& syntax() const { return syntax_; }

  /// Depth-first enumeration: root, CTE bodies, segment subqueries, INSERT source.
  /// MUST be recomputed on each call so mutations are reflected.
  std::vector<const Statement*> all_statements() const;
  std::vector<Statement*> all_statements();

  /// Regenerates SQL text, canonical by default.
  std::string to_sql(const FormattingOptions& options = FormattingOptions()) const;

 private:
  std::unique_ptr<Statement> root_;
  SyntaxOptions syntax_;
};

/// Wraps either a parsed SqlQuery or a ParseError.
/// MUST contain exactly one of query or error.
/// Inputs are parser outputs; side effects are none.
struct ParseResult {
  std::optional<SqlQuery> query;
  std::optional<ParseError> error;
};

/// Parses one SQL statement (with optional CTEs and trailing semicolons).
/// MUST return errors without throwing on invalid syntax.
/// Inputs are SQL text and options; outputs are ParseResult with optional error.
ParseResult parse_sql(const std::string& sql, const ParseOptions& options);
ParseResult parse_sql(const std::string& sql, const SyntaxOptions& syntax);
ParseResult parse_sql(const std::string& sql);

}  // namespace sqlan
