#include "sqlan/statement.h"

#include <stdexcept>

namespace sqlan {

namespace {

Segment& ensure_segment(std::optional<Segment>& slot,
                        const char* name,
                        const SyntaxOptions& syntax,
                        SegmentKind kind) {
  if (!slot.has_value()) {
    slot.emplace(name, syntax, kind);
  }
  return *slot;
}

template <typename Seg, typename Slot>
void push_present(std::vector<Seg*>& out, Slot& slot) {
  if (slot.has_value()) out.push_back(&*slot);
}

void append_clause(std::string& out, const char* keyword, const std::optional<Segment>& segment) {
  if (!segment.has_value() || segment->is_empty()) return;
  out += ' ';
  out += keyword;
  out += ' ';
  out += segment->to_sql();
}

template <typename Seg, typename Self>
std::vector<Seg*> select_segments(Self& self) {
  std::vector<Seg*> out;
  out.push_back(&self.select);
  push_present(out, self.from);
  push_present(out, self.where);
  push_present(out, self.group_by);
  push_present(out, self.having);
  push_present(out, self.order_by);
  push_present(out, self.limit);
  push_present(out, self.offset);
  push_present(out, self.tail);
  return out;
}

template <typename Seg, typename Self>
std::vector<Seg*> insert_segments(Self& self) {
  std::vector<Seg*> out;
  out.push_back(&self.target);
  push_present(out, self.output);
  push_present(out, self.values);
  push_present(out, self.returning);
  return out;
}

template <typename Seg, typename Self>
std::vector<Seg*> update_segments(Self& self) {
  std::vector<Seg*> out;
  out.push_back(&self.target);
  out.push_back(&self.set);
  push_present(out, self.output);
  push_present(out, self.from);
  push_present(out, self.where);
  push_present(out, self.returning);
  return out;
}

template <typename Seg, typename Self>
std::vector<Seg*> delete_segments(Self& self) {
  std::vector<Seg*> out;
  push_present(out, self.target);
  out.push_back(&self.from);
  push_present(out, self.output);
  push_present(out, self.using_tables);
  push_present(out, self.where);
  push_present(out, self.returning);
  return out;
}

}  // namespace

SubqueryPart::SubqueryPart(std::unique_ptr<Statement> nested) : statement(std::move(nested)) {}
SubqueryPart::SubqueryPart(SubqueryPart&& other) noexcept = default;
SubqueryPart& SubqueryPart::operator=(SubqueryPart&& other) noexcept = default;
SubqueryPart::~SubqueryPart() = default;

CteDefinition::CteDefinition(std::string cte_name,
                             std::optional<std::vector<std::string>> column_names,
                             std::unique_ptr<Statement> body)
    : name(std::move(cte_name)), columns(std::move(column_names)), statement(std::move(body)) {}
CteDefinition::CteDefinition(CteDefinition&& other) noexcept = default;
CteDefinition& CteDefinition::operator=(CteDefinition&& other) noexcept = default;
CteDefinition::~CteDefinition() = default;

std::string CteDefinition::to_sql() const {
  std::string out = name;
  if (columns.has_value()) {
    out += '(';
    for (size_t i = 0; i < columns->size(); ++i) {
      if (i > 0) out += ", ";
      out += (*columns)[i];
    }
    out += ')';
  }
  out += " AS (";
  out += statement->to_sql();
  out += ')';
  return out;
}

std::string WithClause::to_sql() const {
  std::string out = recursive ? "WITH RECURSIVE " : "WITH ";
  for (size_t i = 0; i < definitions.size(); ++i) {
    if (i > 0) out += ", ";
    out += definitions[i].to_sql();
  }
  return out;
}

SelectStatement::SelectStatement(const SyntaxOptions& syntax)
    : select("Select", syntax, SegmentKind::AliasedList) {}

Segment& SelectStatement::ensure_from() {
  return ensure_segment(from, "From", select.syntax(), SegmentKind::TableList);
}
Segment& SelectStatement::ensure_where() {
  return ensure_segment(where, "Where", select.syntax(), SegmentKind::Plain);
}
Segment& SelectStatement::ensure_group_by() {
  return ensure_segment(group_by, "GroupBy", select.syntax(), SegmentKind::ExpressionList);
}
Segment& SelectStatement::ensure_having() {
  return ensure_segment(having, "Having", select.syntax(), SegmentKind::Plain);
}
Segment& SelectStatement::ensure_order_by() {
  return ensure_segment(order_by, "OrderBy", select.syntax(), SegmentKind::ExpressionList);
}
Segment& SelectStatement::ensure_limit() {
  return ensure_segment(limit, "Limit", select.syntax(), SegmentKind::Plain);
}
Segment& SelectStatement::ensure_offset() {
  return ensure_segment(offset, "Offset", select.syntax(), SegmentKind::Plain);
}
Segment& SelectStatement::ensure_tail() {
  return ensure_segment(tail, "Tail", select.syntax(), SegmentKind::Plain);
}

std::vector<const Segment*> SelectStatement::segments() const {
  return select_segments<const Segment>(*this);
}
std::vector<Segment*> SelectStatement::segments() { return select_segments<Segment>(*this); }

std::string SelectStatement::to_sql() const {
  std::string out = distinct ? "SELECT DISTINCT " : "SELECT ";
  out += select.to_sql();
  append_clause(out, "FROM", from);
  append_clause(out, "WHERE", where);
  append_clause(out, "GROUP BY", group_by);
  append_clause(out, "HAVING", having);
  append_clause(out, "ORDER BY", order_by);
  append_clause(out, "LIMIT", limit);
  append_clause(out, "OFFSET", offset);
  if (tail.has_value() && !tail->is_empty()) {
    out += ' ';
    out += tail->to_sql();
  }
  return out;
}

InsertStatement::InsertStatement(const SyntaxOptions& syntax)
    : target("Target", syntax, SegmentKind::Plain) {}
InsertStatement::InsertStatement(InsertStatement&& other) noexcept = default;
InsertStatement& InsertStatement::operator=(InsertStatement&& other) noexcept = default;
InsertStatement::~InsertStatement() = default;

Segment& InsertStatement::ensure_values() {
  if (source_query) {
    throw std::logic_error("Cannot add VALUES to an INSERT that reads from a query.");
  }
  return ensure_segment(values, "Values", target.syntax(), SegmentKind::ExpressionList);
}
Segment& InsertStatement::ensure_output() {
  return ensure_segment(output, "Output", target.syntax(), SegmentKind::AliasedList);
}
Segment& InsertStatement::ensure_returning() {
  return ensure_segment(returning, "Returning", target.syntax(), SegmentKind::ExpressionList);
}

std::vector<const Segment*> InsertStatement::segments() const {
  return insert_segments<const Segment>(*this);
}
std::vector<Segment*> InsertStatement::segments() { return insert_segments<Segment>(*this); }

std::string InsertStatement::to_sql() const {
  std::string out = "INSERT INTO " + target.to_sql();
  append_clause(out, "OUTPUT", output);
  if (values.has_value() && !values->is_empty()) {
    append_clause(out, "VALUES", values);
  } else if (source_query) {
    out += ' ';
    out += source_query->to_sql();
  }
  append_clause(out, "RETURNING", returning);
  return out;
}

UpdateStatement::UpdateStatement(const SyntaxOptions& syntax)
    : target("Target", syntax, SegmentKind::Plain), set("Set", syntax, SegmentKind::ExpressionList) {}

Segment& UpdateStatement::ensure_output() {
  return ensure_segment(output, "Output", target.syntax(), SegmentKind::AliasedList);
}
Segment& UpdateStatement::ensure_from() {
  return ensure_segment(from, "From", target.syntax(), SegmentKind::TableList);
}
Segment& UpdateStatement::ensure_where() {
  return ensure_segment(where, "Where", target.syntax(), SegmentKind::Plain);
}
Segment& UpdateStatement::ensure_returning() {
  return ensure_segment(returning, "Returning", target.syntax(), SegmentKind::ExpressionList);
}

std::vector<const Segment*> UpdateStatement::segments() const {
  return update_segments<const Segment>(*this);
}
std::vector<Segment*> UpdateStatement::segments() { return update_segments<Segment>(*this); }

std::string UpdateStatement::to_sql() const {
  std::string out = "UPDATE " + target.to_sql() + " SET " + set.to_sql();
  append_clause(out, "OUTPUT", output);
  append_clause(out, "FROM", from);
  append_clause(out, "WHERE", where);
  append_clause(out, "RETURNING", returning);
  return out;
}

DeleteStatement::DeleteStatement(const SyntaxOptions& syntax)
    : from("From", syntax, SegmentKind::TableList) {}

Segment& DeleteStatement::ensure_target() {
  return ensure_segment(target, "Target", from.syntax(), SegmentKind::Plain);
}
Segment& DeleteStatement::ensure_output() {
  return ensure_segment(output, "Output", from.syntax(), SegmentKind::AliasedList);
}
Segment& DeleteStatement::ensure_using() {
  return ensure_segment(using_tables, "Using", from.syntax(), SegmentKind::TableList);
}
Segment& DeleteStatement::ensure_where() {
  return ensure_segment(where, "Where", from.syntax(), SegmentKind::Plain);
}
Segment& DeleteStatement::ensure_returning() {
  return ensure_segment(returning, "Returning", from.syntax(), SegmentKind::ExpressionList);
}

std::vector<const Segment*> DeleteStatement::segments() const {
  return delete_segments<const Segment>(*this);
}
std::vector<Segment*> DeleteStatement::segments() { return delete_segments<Segment>(*this); }

std::string DeleteStatement::to_sql() const {
  std::string out = "DELETE";
  if (target.has_value() && !target->is_empty()) {
    out += ' ';
    out += target->to_sql();
  }
  out += " FROM " + from.to_sql();
  append_clause(out, "OUTPUT", output);
  append_clause(out, "USING", using_tables);
  append_clause(out, "WHERE", where);
  append_clause(out, "RETURNING", returning);
  return out;
}

const char* statement_kind_name(StatementKind kind) {
  switch (kind) {
    case StatementKind::Select: return "SELECT";
    case StatementKind::Insert: return "INSERT";
    case StatementKind::Update: return "UPDATE";
    case StatementKind::Delete: return "DELETE";
  }
  return "UNKNOWN";
}

Statement::Statement(Body body, std::optional<WithClause> with)
    : body_(std::move(body)), with_(std::move(with)) {}

StatementKind Statement::kind() const {
  // Body alternatives are declared in StatementKind order.
  return static_cast<StatementKind>(body_.index());
}

std::vector<const Segment*> Statement::segments() const {
  return std::visit([](const auto& body) { return body.segments(); }, body_);
}

std::vector<Segment*> Statement::segments() {
  return std::visit([](auto& body) { return body.segments(); }, body_);
}

const Segment* Statement::segment(const std::string& name) const {
  for (const Segment* segment : segments()) {
    if (segment->name() == name) return segment;
  }
  return nullptr;
}

Segment* Statement::segment(const std::string& name) {
  for (Segment* segment : segments()) {
    if (segment->name() == name) return segment;
  }
  return nullptr;
}

std::vector<const Statement*> Statement::child_statements() const {
  std::vector<const Statement*> out;
  if (with_.has_value()) {
    for (const auto& definition : with_->definitions) out.push_back(definition.statement.get());
  }
  for (const Segment* segment : segments()) {
    for (const Statement* nested : segment->statements()) out.push_back(nested);
  }
  if (const InsertStatement* insert = as_insert()) {
    if (insert->source_query) out.push_back(insert->source_query.get());
  }
  return out;
}

std::vector<Statement*> Statement::child_statements() {
  std::vector<Statement*> out;
  if (with_.has_value()) {
    for (auto& definition : with_->definitions) out.push_back(definition.statement.get());
  }
  for (Segment* segment : segments()) {
    for (Statement* nested : segment->statements()) out.push_back(nested);
  }
  if (InsertStatement* insert = as_insert()) {
    if (insert->source_query) out.push_back(insert->source_query.get());
  }
  return out;
}

std::string Statement::to_sql() const {
  std::string body = std::visit([](const auto& value) { return value.to_sql(); }, body_);
  if (!with_.has_value() || with_->definitions.empty()) return body;
  return with_->to_sql() + " " + body;
}

std::string Statement::to_sql(const FormattingOptions& options) const {
  return format_sql(to_sql(), options, syntax());
}

const SyntaxOptions& Statement::syntax() const {
  if (const auto* select = as_select()) return select->select.syntax();
  if (const auto* insert = as_insert()) return insert->target.syntax();
  if (const auto* update = as_update()) return update->target.syntax();
  return std::get<DeleteStatement>(body_).from.syntax();
}

}  // namespace sqlan
