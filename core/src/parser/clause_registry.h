#pragma once

#include <string>
#include <vector>

#include "tokens.h"

namespace sqlan {

/// Enumerates the keyword sequences that can open a clause.
/// MUST stay closed: clause bodies are bounded by membership in this set.
enum class ClauseStart {
  Select,
  From,
  Where,
  GroupBy,
  Having,
  OrderBy,
  Limit,
  Offset,
  Into,
  Values,
  Output,
  Returning,
  Using,
  Set,
  Update,
  Delete,
  SetOperator,
  StatementEnd
};

/// Returns the keyword sequences that open a clause (empty for StatementEnd).
/// MUST return uppercase keywords in match order.
/// Inputs are clause kinds; outputs are references to static tables.
const std::vector<std::vector<std::string>>& clause_keywords(ClauseStart clause);

/// Tests whether one of the candidate clauses starts at the given position.
/// StatementEnd matches at end of input and before a ';' token.
/// Inputs are the token list, a position and candidates; outputs are booleans.
bool is_clause_start(const std::vector<Token>& tokens,
                     size_t position,
                     const std::vector<ClauseStart>& candidates);

/// Returns the number of tokens a keyword sequence of the clause consumes at position.
/// Inputs are tokens, a position and a clause; outputs are 0 when nothing matches.
size_t match_clause(const std::vector<Token>& tokens, size_t position, ClauseStart clause);

/// Stable clause name used for segment names and diagnostics.
const char* clause_name(ClauseStart clause);

}  // namespace sqlan
