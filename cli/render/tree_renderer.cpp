#include "render/tree_renderer.h"

#include <cstddef>
#include <sstream>

namespace sqlan::cli {

namespace {

void pad(std::ostringstream& out, size_t depth) {
  out << std::string(depth * 2, ' ');
}

void render_statement(const Statement& statement, size_t depth, std::ostringstream& out);

void render_with(const WithClause& with, size_t depth, std::ostringstream& out) {
  pad(out, depth);
  out << (with.recursive ? "WITH RECURSIVE" : "WITH") << "\n";
  for (const auto& definition : with.definitions) {
    pad(out, depth + 1);
    out << definition.name;
    if (definition.columns.has_value()) {
      out << "(";
      for (size_t i = 0; i < definition.columns->size(); ++i) {
        if (i > 0) out << ", ";
        out << (*definition.columns)[i];
      }
      out << ")";
    }
    out << "\n";
    render_statement(*definition.statement, depth + 2, out);
  }
}

void render_segment(const Segment& segment, size_t depth, std::ostringstream& out) {
  pad(out, depth);
  out << segment.name() << ": " << segment.to_sql() << "\n";
  const auto& items = segment.items();
  // Single-item lists repeat the segment line, so only multi-item or aliased lists expand.
  bool expand = items.size() > 1 || (items.size() == 1 && items[0].alias.has_value());
  if (expand) {
    for (size_t i = 0; i < items.size(); ++i) {
      pad(out, depth + 1);
      out << "[" << (i + 1) << "] " << segment.item_sql(i);
      if (items[i].alias.has_value()) {
        out << "  alias=" << *items[i].alias;
      }
      out << "\n";
    }
  }
  for (const Statement* nested : segment.statements()) {
    pad(out, depth + 1);
    out << "subquery:\n";
    render_statement(*nested, depth + 2, out);
  }
}

void render_statement(const Statement& statement, size_t depth, std::ostringstream& out) {
  pad(out, depth);
  out << statement_kind_name(statement.kind());
  if (const SelectStatement* select = statement.as_select()) {
    if (select->distinct) out << " DISTINCT";
  }
  out << "\n";
  if (statement.with_clause().has_value()) {
    render_with(*statement.with_clause(), depth + 1, out);
  }
  for (const Segment* segment : statement.segments()) {
    render_segment(*segment, depth + 1, out);
  }
  if (const InsertStatement* insert = statement.as_insert()) {
    if (insert->source_query) {
      pad(out, depth + 1);
      out << "Source:\n";
      render_statement(*insert->source_query, depth + 2, out);
    }
  }
}

}  // namespace

std::string render_query_tree(const SqlQuery& query) {
  std::ostringstream out;
  render_statement(query.root(), 0, out);
  return out.str();
}

}  // namespace sqlan::cli
