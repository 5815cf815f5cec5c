#pragma once

#include <string>
#include <vector>

namespace sqlan {

/// Decides whether a single space separates two adjacent tokens in regenerated SQL.
/// MUST be a pure function of the two token texts so output is a fixed point.
/// Inputs are previous and current token texts; outputs are booleans.
bool needs_space_between(const std::string& previous, const std::string& current);

/// Joins token texts on one line with the canonical spacing rule.
/// Inputs are token texts; outputs are SQL text with no side effects.
std::string join_tokens(const std::vector<std::string>& tokens);

}  // namespace sqlan
