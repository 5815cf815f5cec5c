#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "sqlan/formatting.h"
#include "sqlan/syntax_options.h"

namespace sqlan {

class Statement;

/// A verbatim source token kept inside a segment.
struct TokenPart {
  std::string text;
};

/// A parenthesized nested statement kept inside a segment.
/// MUST own its statement exclusively; the parentheses are regenerated around it.
/// Inputs are parsed statements; outputs are SQL through the owning segment.
struct SubqueryPart {
  explicit SubqueryPart(std::unique_ptr<Statement> nested);
  SubqueryPart(SubqueryPart&& other) noexcept;
  SubqueryPart& operator=(SubqueryPart&& other) noexcept;
  ~SubqueryPart();

  std::unique_ptr<Statement> statement;
};

using SegmentPart = std::variant<TokenPart, SubqueryPart>;

/// Describes how a segment body is split into items.
/// Plain bodies are a single span; list kinds split on top-level commas.
enum class SegmentKind { Plain, ExpressionList, AliasedList, TableList };

/// One comma-separated element of a list segment.
/// part_count covers the alias tokens; expression_part_count stops before them.
struct SegmentItem {
  size_t first_part = 0;
  size_t part_count = 0;
  size_t expression_part_count = 0;
  std::optional<std::string> alias;
};

/// Named clause body: an ordered run of token and subquery parts.
/// MUST regenerate its parts with canonical token spacing and MUST own nested statements.
/// Inputs are parser output or caller fragments; outputs are SQL text and item metadata.
class Segment {
 public:
  Segment(std::string name, SyntaxOptions syntax, SegmentKind kind = SegmentKind::Plain);

  const std::string& name() const { return name_; }
  SegmentKind kind() const { return kind_; }
  const SyntaxOptions& syntax() const { return syntax_; }
  const std::vector<SegmentPart>& parts() const { return parts_; }
  const std::vector<SegmentItem>& items() const { return items_; }
  bool is_empty() const { return parts_.empty(); }

  /// Nested statements of this segment in part order.
  std::vector<const Statement*> statements() const;
  std::vector<Statement*> statements();

  /// Regenerates the segment body on a single line.
  std::string to_sql() const;
  /// Regenerates one list item without its alias.
  /// MUST throw std::out_of_range for an unknown index.
  std::string item_sql(size_t index) const;

  /// Tokenizes a fragment and appends it to the segment (extending the last item).
  /// MUST throw std::invalid_argument for blank input and std::runtime_error when a
  /// nested subquery of the fragment fails to parse.
  void add_raw(const std::string& sql);
  /// Appends a comma (when not empty) and the fragment as new list item(s).
  /// MUST apply alias inference on aliased lists and MUST reject blank input.
  void add_comma_separated_element(const std::string& sql);
  /// Appends `<conjunction> <expression>`, or just the expression on an empty segment.
  /// MUST throw std::invalid_argument for a blank expression, or for a blank conjunction
  /// on a non-empty segment.
  void add_conjunction(const std::string& conjunction, const std::string& expression);

  /// Appends parsed parts as a new item; used by the parser.
  void append_item(std::vector<SegmentPart> parts,
                   size_t alias_part_count,
                   std::optional<std::string> alias);
  /// Appends parsed parts without item bookkeeping; used by the parser.
  void append_parts(std::vector<SegmentPart> parts);
  /// Appends a ',' separator part.
  void append_separator();

 private:
  std::string name_;
  SyntaxOptions syntax_;
  SegmentKind kind_;
  std::vector<SegmentPart> parts_;
  std::vector<SegmentItem> items_;
};

/// One `name[(columns)] AS (statement)` entry of a WITH clause.
struct CteDefinition {
  CteDefinition(std::string cte_name,
                std::optional<std::vector<std::string>> column_names,
                std::unique_ptr<Statement> body);
  CteDefinition(CteDefinition&& other) noexcept;
  CteDefinition& operator=(CteDefinition&& other) noexcept;
  ~CteDefinition();

  std::string name;
  std::optional<std::vector<std::string>> columns;
  std::unique_ptr<Statement> statement;

  std::string to_sql() const;
};

struct WithClause {
  bool recursive = false;
  std::vector<CteDefinition> definitions;

  std::string to_sql() const;
};

/// SELECT body. The select list is mandatory; other clauses are created lazily.
struct SelectStatement {
  explicit SelectStatement(const SyntaxOptions& syntax);

  bool distinct = false;
  Segment select;
  std::optional<Segment> from;
  std::optional<Segment> where;
  std::optional<Segment> group_by;
  std::optional<Segment> having;
  std::optional<Segment> order_by;
  std::optional<Segment> limit;
  std::optional<Segment> offset;
  // Trailing UNION/EXCEPT/INTERSECT keyword and the rest of the statement.
  std::optional<Segment> tail;

  Segment& ensure_from();
  Segment& ensure_where();
  Segment& ensure_group_by();
  Segment& ensure_having();
  Segment& ensure_order_by();
  Segment& ensure_limit();
  Segment& ensure_offset();
  Segment& ensure_tail();

  std::vector<const Segment*> segments() const;
  std::vector<Segment*> segments();
  std::string to_sql() const;
};

/// INSERT body. values and source_query are mutually exclusive.
struct InsertStatement {
  explicit InsertStatement(const SyntaxOptions& syntax);
  InsertStatement(InsertStatement&& other) noexcept;
  InsertStatement& operator=(InsertStatement&& other) noexcept;
  ~InsertStatement();

  Segment target;
  std::optional<Segment> output;
  std::optional<Segment> values;
  std::unique_ptr<Statement> source_query;
  std::optional<Segment> returning;

  /// MUST throw std::logic_error when the insert already reads from a source query.
  Segment& ensure_values();
  Segment& ensure_output();
  Segment& ensure_returning();

  std::vector<const Segment*> segments() const;
  std::vector<Segment*> segments();
  std::string to_sql() const;
};

struct UpdateStatement {
  explicit UpdateStatement(const SyntaxOptions& syntax);

  Segment target;
  Segment set;
  std::optional<Segment> output;
  std::optional<Segment> from;
  std::optional<Segment> where;
  std::optional<Segment> returning;

  Segment& ensure_output();
  Segment& ensure_from();
  Segment& ensure_where();
  Segment& ensure_returning();

  std::vector<const Segment*> segments() const;
  std::vector<Segment*> segments();
  std::string to_sql() const;
};

struct DeleteStatement {
  explicit DeleteStatement(const SyntaxOptions& syntax);

  std::optional<Segment> target;
  Segment from;
  std::optional<Segment> output;
  std::optional<Segment> using_tables;
  std::optional<Segment> where;
  std::optional<Segment> returning;

  Segment& ensure_target();
  Segment& ensure_output();
  Segment& ensure_using();
  Segment& ensure_where();
  Segment& ensure_returning();

  std::vector<const Segment*> segments() const;
  std::vector<Segment*> segments();
  std::string to_sql() const;
};

enum class StatementKind { Select, Insert, Update, Delete };

/// Uppercase display name of a statement kind.
const char* statement_kind_name(StatementKind kind);

/// A parsed statement: an optional WITH clause plus one typed body.
/// MUST own its segments, CTE bodies, nested subqueries and INSERT source query.
/// Inputs are parser output; outputs are SQL text and traversal helpers.
class Statement {
 public:
  using Body = std::variant<SelectStatement, InsertStatement, UpdateStatement, DeleteStatement>;

  explicit Statement(Body body, std::optional<WithClause> with = std::nullopt);

  StatementKind kind() const;
  const Body& body() const { return body_; }
  Body& body() { return body_; }
  const std::optional<WithClause>& with_clause() const { return with_; }
  std::optional<WithClause>& with_clause() { return with_; }

  SelectStatement* as_select() { return std::get_if<SelectStatement>(&body_); }
  const SelectStatement* as_select() const { return std::get_if<SelectStatement>(&body_); }
  InsertStatement* as_insert() { return std::get_if<InsertStatement>(&body_); }
  const InsertStatement* as_insert() const { return std::get_if<InsertStatement>(&body_); }
  UpdateStatement* as_update() { return std::get_if<UpdateStatement>(&body_); }
  const UpdateStatement* as_update() const { return std::get_if<UpdateStatement>(&body_); }
  DeleteStatement* as_delete() { return std::get_if<DeleteStatement>(&body_); }
  const DeleteStatement* as_delete() const { return std::get_if<DeleteStatement>(&body_); }

  /// Present segments in grammar order.
  std::vector<const Segment*> segments() const;
  std::vector<Segment*> segments();
  /// Looks up a present segment by name (Select, From, Where, ...).
  const Segment* segment(const std::string& name) const;
  Segment* segment(const std::string& name);

  /// Direct children: CTE bodies, segment subqueries, then the INSERT source query.
  std::vector<const Statement*> child_statements() const;
  std::vector<Statement*> child_statements();

  std::string to_sql() const;
  std::string to_sql(const FormattingOptions& options) const;

 private:
  const SyntaxOptions& syntax() const;

  Body body_;
  std::optional<WithClause> with_;
};

}  // namespace sqlan
