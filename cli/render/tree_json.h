#pragma once

#include <string>

#include "sqlan/sqlan.h"

namespace sqlan::cli {

/// Serializes the statement tree to JSON for --output json.
/// MUST throw std::runtime_error when the build lacks nlohmann/json.
/// Inputs are a parsed query and layout options; outputs are JSON text.
std::string render_query_json(const SqlQuery& query, const FormattingOptions& options);
/// Applies ANSI coloring to JSON for readability when enabled.
/// MUST NOT alter JSON semantics and MUST be disabled for non-TTY output.
std::string colorize_json(const std::string& input, bool enable);

}  // namespace sqlan::cli
