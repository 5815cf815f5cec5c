#include "pretty_printer.h"

#include <optional>
#include <unordered_set>

#include "parser/lexer.h"
#include "sql_text.h"
#include "util/string_util.h"

namespace sqlan {

namespace {

enum class ListContext {
  None,
  SelectList,
  GroupByList,
  OrderByList,
  ValuesList,
  SetList,
  ReturningList
};

struct Line {
  size_t indent = 0;
  std::vector<std::string> tokens;
  bool leading_comma = false;
};

/// Saved layout state of an open parenthesis.
/// Multi-line frames restore the enclosing clause context at their ')'.
struct ParenFrame {
  bool multiline = false;
  ListContext list = ListContext::None;
  bool first_item = false;
  bool pending_comma = false;
  size_t clause_indent = 0;
  size_t base_indent = 0;
  size_t inline_depth = 0;
};

const std::unordered_set<std::string>& multiline_keywords() {
  static const std::unordered_set<std::string> kKeywords = {
      "SELECT", "FROM",      "WHERE", "GROUP",  "HAVING", "ORDER",  "LIMIT",
      "OFFSET", "VALUES",    "RETURNING", "SET", "INSERT", "UPDATE", "DELETE",
      "UNION",  "INTERSECT", "EXCEPT", "WITH"};
  return kKeywords;
}

bool is_join_modifier(const std::string& upper) {
  return upper == "INNER" || upper == "LEFT" || upper == "RIGHT" || upper == "FULL" ||
         upper == "CROSS";
}

class PrettyPrinter {
 public:
  PrettyPrinter(const std::vector<Token>& tokens, const FormattingOptions& options)
      : tokens_(tokens), options_(options), multiline_(tokens.size(), false) {
    mark_multiline_parens();
  }

  std::string run() {
    while (index_ < tokens_.size()) {
      if (inline_depth_ == 0 && handle_clause_start()) continue;
      handle_token(tokens_[index_]);
      ++index_;
    }
    commit();
    std::string out;
    for (size_t i = 0; i < lines_.size(); ++i) {
      if (i > 0) out += '\n';
      out += render_line(lines_[i]);
    }
    return out;
  }

 private:
  std::string keyword_at(size_t index) const {
    if (index >= tokens_.size() || !tokens_[index].is_keyword) return {};
    return tokens_[index].normalized;
  }

  /// Recognizes clause keywords at index_ and lays them out.
  /// MUST consume every token it handles and MUST leave other tokens to handle_token.
  bool handle_clause_start() {
    std::string word = keyword_at(index_);
    if (word.empty()) return false;
    if (word == "SELECT" || word == "VALUES" || word == "RETURNING" || word == "SET") {
      start_line(base_indent_);
      take();
      if (word == "SELECT" && keyword_at(index_) == "DISTINCT") take();
      commit();
      begin_list(word == "SELECT"      ? ListContext::SelectList
                 : word == "VALUES"    ? ListContext::ValuesList
                 : word == "RETURNING" ? ListContext::ReturningList
                                       : ListContext::SetList);
      return true;
    }
    if ((word == "GROUP" || word == "ORDER") && keyword_at(index_ + 1) == "BY") {
      start_line(base_indent_);
      take();
      take();
      commit();
      begin_list(word == "GROUP" ? ListContext::GroupByList : ListContext::OrderByList);
      return true;
    }
    if (word == "UNION" || word == "INTERSECT" || word == "EXCEPT") {
      start_line(base_indent_);
      take();
      std::string next = keyword_at(index_);
      if (next == "ALL" || next == "DISTINCT") take();
      commit();
      list_ = ListContext::None;
      return true;
    }
    if (word == "FROM" || word == "WHERE" || word == "HAVING" || word == "LIMIT" ||
        word == "OFFSET" || word == "USING" || word == "OUTPUT" || word == "INSERT" ||
        word == "UPDATE" || word == "DELETE" || word == "WITH") {
      start_line(base_indent_);
      take();
      list_ = ListContext::None;
      return true;
    }
    if (is_join_modifier(word)) {
      size_t next = index_ + 1;
      if (keyword_at(next) == "OUTER") ++next;
      // WHY: LEFT(...) and RIGHT(...) are also function names.
      if (keyword_at(next) != "JOIN") return false;
      start_line(base_indent_);
      take();
      list_ = ListContext::None;
      return true;
    }
    if (word == "JOIN") {
      bool continues_modifier = false;
      if (current_.has_value() && !current_->tokens.empty()) {
        std::string last = util::to_upper(current_->tokens.back());
        continues_modifier = is_join_modifier(last) || last == "OUTER";
      }
      if (!continues_modifier) start_line(base_indent_);
      take_at(base_indent_);
      list_ = ListContext::None;
      return true;
    }
    return false;
  }

  void handle_token(const Token& token) {
    bool in_list = list_ != ListContext::None;
    if (in_list && inline_depth_ == 0 && token.text == ",") {
      if (options_.mode == FormattingMode::Prefixed) {
        pending_comma_ = true;
      } else {
        append(",", item_indent());
        commit();
        first_item_ = true;
      }
      return;
    }
    if (token.text == ")" && !parens_.empty() && parens_.back().multiline) {
      close_multiline();
      return;
    }
    if (in_list) prepare_item_line();
    size_t indent = effective_indent();
    if (token.text == "(") {
      append("(", indent);
      open_paren();
      return;
    }
    if (token.text == ")" && !parens_.empty()) {
      parens_.pop_back();
      if (inline_depth_ > 0) --inline_depth_;
    }
    append(token.text, indent);
  }

  void open_paren() {
    if (!is_multiline_paren(index_)) {
      ParenFrame frame;
      parens_.push_back(frame);
      ++inline_depth_;
      return;
    }
    ParenFrame frame;
    frame.multiline = true;
    frame.list = list_;
    frame.first_item = first_item_;
    frame.pending_comma = pending_comma_;
    frame.clause_indent = clause_indent_;
    frame.base_indent = base_indent_;
    frame.inline_depth = inline_depth_;
    parens_.push_back(frame);
    size_t inner = (list_ != ListContext::None ? item_indent() : base_indent_) + options_.indent_size;
    commit();
    base_indent_ = inner;
    list_ = ListContext::None;
    first_item_ = false;
    pending_comma_ = false;
    inline_depth_ = 0;
  }

  void close_multiline() {
    ParenFrame frame = parens_.back();
    parens_.pop_back();
    commit();
    list_ = frame.list;
    first_item_ = frame.first_item;
    pending_comma_ = frame.pending_comma;
    clause_indent_ = frame.clause_indent;
    base_indent_ = frame.base_indent;
    inline_depth_ = frame.inline_depth;
    size_t indent = list_ != ListContext::None ? item_indent() : base_indent_;
    start_line(indent);
    current_->tokens.push_back(")");
  }

  /// A parenthesis is multi-line when a clause keyword sits directly inside it.
  /// Flags every '(' in one pass; unmatched parentheses look up to end of input.
  void mark_multiline_parens() {
    std::vector<size_t> open;
    for (size_t i = 0; i < tokens_.size(); ++i) {
      const Token& token = tokens_[i];
      if (token.text == "(") {
        open.push_back(i);
      } else if (token.text == ")") {
        if (!open.empty()) open.pop_back();
      } else if (!open.empty() && token.is_keyword &&
                 multiline_keywords().count(token.normalized) > 0) {
        multiline_[open.back()] = true;
      }
    }
  }

  bool is_multiline_paren(size_t open) const { return multiline_[open]; }

  void prepare_item_line() {
    if (pending_comma_) {
      size_t shift = options_.indent_size > 0 ? options_.indent_size - 1 : 0;
      start_line(clause_indent_ + shift);
      current_->tokens.push_back(",");
      current_->leading_comma = true;
      pending_comma_ = false;
      first_item_ = false;
      return;
    }
    if (first_item_) {
      start_line(item_indent());
      first_item_ = false;
    }
  }

  void begin_list(ListContext list) {
    list_ = list;
    first_item_ = true;
    pending_comma_ = false;
    clause_indent_ = base_indent_;
  }

  size_t item_indent() const { return clause_indent_ + options_.indent_size; }

  size_t effective_indent() const {
    if (list_ == ListContext::None) return base_indent_;
    return current_.has_value() ? current_->indent : item_indent();
  }

  void take() { take_at(current_.has_value() ? current_->indent : base_indent_); }

  void take_at(size_t indent) {
    append(tokens_[index_].text, indent);
    ++index_;
  }

  void append(const std::string& text, size_t indent) {
    if (!current_.has_value() || (current_->indent != indent && !current_->tokens.empty())) {
      start_line(indent);
    }
    current_->tokens.push_back(text);
  }

  void start_line(size_t indent) {
    commit();
    current_ = Line{indent, {}, false};
  }

  void commit() {
    if (current_.has_value() && !current_->tokens.empty()) {
      lines_.push_back(std::move(*current_));
    }
    current_.reset();
  }

  static std::string render_line(const Line& line) {
    std::string text = join_tokens(line.tokens);
    if (line.leading_comma && text.size() > 1 && text[0] == ',' && text[1] == ' ') {
      text.erase(1, 1);
    }
    return std::string(line.indent, ' ') + text;
  }

  const std::vector<Token>& tokens_;
  FormattingOptions options_;
  // Indexed by token; true for '(' tokens laid out over several lines.
  std::vector<bool> multiline_;
  size_t index_ = 0;
  std::vector<Line> lines_;
  std::optional<Line> current_;
  std::vector<ParenFrame> parens_;
  ListContext list_ = ListContext::None;
  bool first_item_ = false;
  bool pending_comma_ = false;
  size_t clause_indent_ = 0;
  size_t base_indent_ = 0;
  // Open single-line parentheses since the current clause context began.
  size_t inline_depth_ = 0;
};

}  // namespace

std::string pretty_print_tokens(const std::vector<Token>& tokens, const FormattingOptions& options) {
  PrettyPrinter printer(tokens, options);
  return printer.run();
}

std::string format_sql(const std::string& sql,
                       const FormattingOptions& options,
                       const SyntaxOptions& syntax) {
  if (options.mode == FormattingMode::Inline) return sql;
  return pretty_print_tokens(tokenize(sql, syntax), options);
}

std::optional<FormattingMode> formatting_mode_from_name(const std::string& name) {
  std::string lower = util::to_lower(util::trim_ws(name));
  if (lower == "inline") return FormattingMode::Inline;
  if (lower == "prefixed") return FormattingMode::Prefixed;
  if (lower == "suffixed") return FormattingMode::Suffixed;
  return std::nullopt;
}

const char* formatting_mode_name(FormattingMode mode) {
  switch (mode) {
    case FormattingMode::Inline: return "inline";
    case FormattingMode::Prefixed: return "prefixed";
    case FormattingMode::Suffixed: return "suffixed";
  }
  return "inline";
}

}  // namespace sqlan
