#include "clause_registry.h"

#include <unordered_map>

namespace sqlan {

namespace {

using KeywordTable = std::unordered_map<int, std::vector<std::vector<std::string>>>;

const KeywordTable& keyword_table() {
  static const KeywordTable kTable = {
      {static_cast<int>(ClauseStart::Select), {{"SELECT"}, {"WITH"}}},
      {static_cast<int>(ClauseStart::From), {{"FROM"}}},
      {static_cast<int>(ClauseStart::Where), {{"WHERE"}}},
      {static_cast<int>(ClauseStart::GroupBy), {{"GROUP", "BY"}}},
      {static_cast<int>(ClauseStart::Having), {{"HAVING"}}},
      {static_cast<int>(ClauseStart::OrderBy), {{"ORDER", "BY"}}},
      {static_cast<int>(ClauseStart::Limit), {{"LIMIT"}}},
      {static_cast<int>(ClauseStart::Offset), {{"OFFSET"}}},
      {static_cast<int>(ClauseStart::Into), {{"INTO"}}},
      {static_cast<int>(ClauseStart::Values), {{"VALUES"}}},
      {static_cast<int>(ClauseStart::Output), {{"OUTPUT"}}},
      {static_cast<int>(ClauseStart::Returning), {{"RETURNING"}}},
      {static_cast<int>(ClauseStart::Using), {{"USING"}}},
      {static_cast<int>(ClauseStart::Set), {{"SET"}}},
      {static_cast<int>(ClauseStart::Update), {{"UPDATE"}}},
      {static_cast<int>(ClauseStart::Delete), {{"DELETE"}}},
      {static_cast<int>(ClauseStart::SetOperator), {{"UNION"}, {"EXCEPT"}, {"INTERSECT"}}},
      {static_cast<int>(ClauseStart::StatementEnd), {}},
  };
  return kTable;
}

bool matches_sequence(const std::vector<Token>& tokens,
                      size_t position,
                      const std::vector<std::string>& sequence) {
  if (position + sequence.size() > tokens.size()) return false;
  for (size_t i = 0; i < sequence.size(); ++i) {
    const Token& token = tokens[position + i];
    if (!token.is_keyword || token.normalized != sequence[i]) return false;
  }
  return true;
}

}  // namespace

const std::vector<std::vector<std::string>>& clause_keywords(ClauseStart clause) {
  return keyword_table().at(static_cast<int>(clause));
}

size_t match_clause(const std::vector<Token>& tokens, size_t position, ClauseStart clause) {
  for (const auto& sequence : clause_keywords(clause)) {
    if (matches_sequence(tokens, position, sequence)) return sequence.size();
  }
  return 0;
}

bool is_clause_start(const std::vector<Token>& tokens,
                     size_t position,
                     const std::vector<ClauseStart>& candidates) {
  for (ClauseStart clause : candidates) {
    if (clause == ClauseStart::StatementEnd) {
      if (position >= tokens.size() || tokens[position].text == ";") return true;
      continue;
    }
    if (match_clause(tokens, position, clause) > 0) return true;
  }
  return false;
}

const char* clause_name(ClauseStart clause) {
  switch (clause) {
    case ClauseStart::Select: return "Select";
    case ClauseStart::From: return "From";
    case ClauseStart::Where: return "Where";
    case ClauseStart::GroupBy: return "GroupBy";
    case ClauseStart::Having: return "Having";
    case ClauseStart::OrderBy: return "OrderBy";
    case ClauseStart::Limit: return "Limit";
    case ClauseStart::Offset: return "Offset";
    case ClauseStart::Into: return "Into";
    case ClauseStart::Values: return "Values";
    case ClauseStart::Output: return "Output";
    case ClauseStart::Returning: return "Returning";
    case ClauseStart::Using: return "Using";
    case ClauseStart::Set: return "Set";
    case ClauseStart::Update: return "Update";
    case ClauseStart::Delete: return "Delete";
    case ClauseStart::SetOperator: return "SetOperator";
    case ClauseStart::StatementEnd: return "StatementEnd";
  }
  return "Unknown";
}

}  // namespace sqlan
