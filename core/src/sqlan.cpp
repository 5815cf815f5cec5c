#include "sqlan/sqlan.h"

#include "parser/query_parser_impl.h"

namespace sqlan {

namespace {

template <typename Ptr, typename Node>
void collect_statements(Node& statement, std::vector<Ptr>& out) {
  out.push_back(&statement);
  for (auto* child : statement.child_statements()) {
    collect_statements(*child, out);
  }
}

}  // namespace

SqlQuery::SqlQuery(std::unique_ptr<Statement> root, SyntaxOptions syntax)
    : root_(std::move(root)), syntax_(std::move(syntax)) {}

std::vector<const Statement*> SqlQuery::all_statements() const {
  std::vector<const Statement*> out;
  collect_statements(static_cast<const Statement&>(*root_), out);
  return out;
}

std::vector<Statement*> SqlQuery::all_statements() {
  std::vector<Statement*> out;
  collect_statements(*root_, out);
  return out;
}

std::string SqlQuery::to_sql(const FormattingOptions& options) const {
  return format_sql(root_->to_sql(), options, syntax_);
}

ParseResult parse_sql(const std::string& sql, const ParseOptions& options) {
  return parse_sql_impl(sql, options);
}

ParseResult parse_sql(const std::string& sql, const SyntaxOptions& syntax) {
  ParseOptions options;
  options.syntax = syntax;
  return parse_sql_impl(sql, options);
}

ParseResult parse_sql(const std::string& sql) {
  return parse_sql_impl(sql, ParseOptions());
}

}  // namespace sqlan
