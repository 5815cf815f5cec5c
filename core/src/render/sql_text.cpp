#include "sql_text.h"

#include <cctype>
#include <unordered_set>

#include "util/string_util.h"

namespace sqlan {

namespace {

// Keywords after which an opening parenthesis keeps its leading space.
const std::unordered_set<std::string>& space_before_paren_keywords() {
  static const std::unordered_set<std::string> kKeywords = {
      "SELECT", "FROM",   "WHERE",  "GROUP",     "HAVING", "ORDER",  "LIMIT",    "OFFSET",
      "VALUES", "IN",     "EXISTS", "JOIN",      "INNER",  "LEFT",   "RIGHT",    "FULL",
      "OUTER",  "ON",     "USING",  "RETURNING", "OUTPUT", "UPDATE", "INSERT",   "DELETE",
      "SET",    "AS",     "DISTINCT", "WITH",    "UNION",  "INTERSECT", "EXCEPT", "CASE",
      "WHEN",   "THEN",   "ELSE",   "AND",       "OR",     "NOT"};
  return kKeywords;
}

bool ends_with_opener(const std::string& token) {
  char last = token.back();
  return last == '(' || last == '[' || last == '.';
}

}  // namespace

bool needs_space_between(const std::string& previous, const std::string& current) {
  if (previous.empty() || current.empty()) return false;
  char first = current.front();
  if (first == ',' || first == ')' || first == '.' || first == ';' || first == ']') {
    return false;
  }
  // Prefixed identifiers such as :id keep their space; bare colons do not.
  if (current == ":" || current == "::" || previous == "::") return false;
  if (current == "(") {
    if (space_before_paren_keywords().count(util::to_upper(previous)) > 0) return true;
    // WHY: identifiers and literals glue to '(' so calls stay `f(x)`.
    char last = previous.back();
    return !std::isalnum(static_cast<unsigned char>(last)) && !ends_with_opener(previous);
  }
  return !ends_with_opener(previous);
}

std::string join_tokens(const std::vector<std::string>& tokens) {
  std::string out;
  const std::string* previous = nullptr;
  for (const auto& token : tokens) {
    if (token.empty()) continue;
    if (previous != nullptr && needs_space_between(*previous, token)) {
      out.push_back(' ');
    }
    out += token;
    previous = &token;
  }
  return out;
}

}  // namespace sqlan
