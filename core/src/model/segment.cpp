#include "sqlan/statement.h"

#include <stdexcept>

#include "parser/query_parser_impl.h"
#include "render/sql_text.h"
#include "util/string_util.h"

namespace sqlan {

namespace {

void collect_texts(const std::vector<SegmentPart>& parts,
                   size_t first,
                   size_t count,
                   std::vector<std::string>& out) {
  for (size_t i = first; i < first + count && i < parts.size(); ++i) {
    if (const auto* token = std::get_if<TokenPart>(&parts[i])) {
      out.push_back(token->text);
      continue;
    }
    const auto& subquery = std::get<SubqueryPart>(parts[i]);
    out.push_back("(");
    out.push_back(subquery.statement->to_sql());
    out.push_back(")");
  }
}

void require_text(const std::string& sql, const char* what) {
  if (util::is_blank(sql)) {
    throw std::invalid_argument(std::string(what) + " must not be empty.");
  }
}

}  // namespace

Segment::Segment(std::string name, SyntaxOptions syntax, SegmentKind kind)
    : name_(std::move(name)), syntax_(std::move(syntax)), kind_(kind) {}

std::vector<const Statement*> Segment::statements() const {
  std::vector<const Statement*> out;
  for (const auto& part : parts_) {
    if (const auto* subquery = std::get_if<SubqueryPart>(&part)) {
      out.push_back(subquery->statement.get());
    }
  }
  return out;
}

std::vector<Statement*> Segment::statements() {
  std::vector<Statement*> out;
  for (auto& part : parts_) {
    if (auto* subquery = std::get_if<SubqueryPart>(&part)) {
      out.push_back(subquery->statement.get());
    }
  }
  return out;
}

std::string Segment::to_sql() const {
  std::vector<std::string> texts;
  collect_texts(parts_, 0, parts_.size(), texts);
  return join_tokens(texts);
}

std::string Segment::item_sql(size_t index) const {
  const SegmentItem& item = items_.at(index);
  std::vector<std::string> texts;
  collect_texts(parts_, item.first_part, item.expression_part_count, texts);
  return join_tokens(texts);
}

void Segment::add_raw(const std::string& sql) {
  require_text(sql, "SQL fragment");
  if (kind_ != SegmentKind::Plain && items_.empty()) {
    append_items(*this, lower_list_fragment(sql, syntax_, kind_));
    return;
  }
  std::vector<SegmentPart> parts = lower_fragment(sql, syntax_);
  if (!items_.empty()) {
    // WHY: text appended after an alias means the alias no longer ends the item.
    SegmentItem& last = items_.back();
    last.part_count += parts.size();
    last.expression_part_count = last.part_count;
    last.alias.reset();
  }
  append_parts(std::move(parts));
}

void Segment::add_comma_separated_element(const std::string& sql) {
  require_text(sql, "SQL fragment");
  if (kind_ == SegmentKind::Plain) {
    std::vector<SegmentPart> parts = lower_fragment(sql, syntax_);
    if (!is_empty()) append_separator();
    append_parts(std::move(parts));
    return;
  }
  append_items(*this, lower_list_fragment(sql, syntax_, kind_));
}

void Segment::add_conjunction(const std::string& conjunction, const std::string& expression) {
  require_text(expression, "Expression");
  if (is_empty()) {
    add_raw(expression);
    return;
  }
  if (util::is_blank(conjunction)) {
    throw std::invalid_argument("Conjunction must not be empty when the segment has content.");
  }
  std::vector<SegmentPart> parts = lower_fragment(conjunction, syntax_);
  std::vector<SegmentPart> tail = lower_fragment(expression, syntax_);
  for (auto& part : tail) parts.push_back(std::move(part));
  if (!items_.empty()) {
    SegmentItem& last = items_.back();
    last.part_count += parts.size();
    last.expression_part_count = last.part_count;
    last.alias.reset();
  }
  append_parts(std::move(parts));
}

void Segment::append_item(std::vector<SegmentPart> parts,
                          size_t alias_part_count,
                          std::optional<std::string> alias) {
  SegmentItem item;
  item.first_part = parts_.size();
  item.part_count = parts.size();
  item.expression_part_count = parts.size() - alias_part_count;
  item.alias = std::move(alias);
  items_.push_back(std::move(item));
  append_parts(std::move(parts));
}

void Segment::append_parts(std::vector<SegmentPart> parts) {
  for (auto& part : parts) parts_.push_back(std::move(part));
}

void Segment::append_separator() {
  parts_.push_back(TokenPart{","});
}

}  // namespace sqlan
