#pragma once

#include <string>
#include <vector>

#include "parser/tokens.h"
#include "sqlan/formatting.h"

namespace sqlan {

/// Lays out an already tokenized statement on clause-aware lines.
/// MUST depend only on the token texts so re-formatting its own output is a fixed point.
/// Inputs are tokens and layout options; outputs are newline-joined text.
std::string pretty_print_tokens(const std::vector<Token>& tokens, const FormattingOptions& options);

}  // namespace sqlan
