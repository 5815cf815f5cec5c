#pragma once

#include <cstddef>
#include <string>

#include "sqlan/sqlan.h"

namespace sqlan {

/// A 1-based line/column position inside SQL text.
struct SourceLocation {
  size_t line = 1;
  size_t column = 1;
};

/// Converts a byte offset into a line/column pair.
/// MUST clamp offsets past the end to one column after the last character.
/// Inputs are SQL text and a byte offset; outputs are 1-based coordinates.
SourceLocation locate_position(const std::string& sql, size_t position);

/// Renders the source line holding a position with a caret under it.
/// Inputs are SQL text and a byte offset; outputs are a two-line frame or an empty string.
std::string render_code_frame(const std::string& sql, size_t position);

/// Renders a parse error as `error: <message>`, its location and a code frame.
/// MUST be deterministic for stable golden tests.
std::string render_parse_error(const std::string& sql, const ParseError& error);

}  // namespace sqlan
