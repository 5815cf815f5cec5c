#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sqlan/sqlan.h"

namespace sqlan {

/// One comma-separated list element after span-to-parts lowering.
/// alias_part_count counts the trailing parts that spell the alias (0, 1 or 2).
struct LoweredItem {
  std::vector<SegmentPart> parts;
  size_t alias_part_count = 0;
  std::optional<std::string> alias;
};

/// Parses SQL text into a statement tree with error reporting.
/// MUST be deterministic and MUST not throw on parse errors.
/// Inputs are SQL text and options; outputs are ParseResult with optional error.
ParseResult parse_sql_impl(const std::string& sql, const ParseOptions& options);

/// Lowers a caller fragment into segment parts, parsing parenthesized subqueries.
/// MUST throw std::runtime_error("SQL parse error: ...") when a subquery fails to parse.
/// Inputs are fragment text and dialect; outputs are parts.
std::vector<SegmentPart> lower_fragment(const std::string& sql, const SyntaxOptions& syntax);

/// Lowers a caller fragment into list items using the reader for the segment kind.
/// MUST throw std::runtime_error("SQL parse error: ...") on reader errors.
/// Inputs are fragment text, dialect and list kind; outputs are items.
std::vector<LoweredItem> lower_list_fragment(const std::string& sql,
                                             const SyntaxOptions& syntax,
                                             SegmentKind kind);

/// Appends lowered items to a segment, separating them with ',' parts.
/// Inputs are the target segment and items; side effects mutate the segment.
void append_items(Segment& segment, std::vector<LoweredItem> items);

}  // namespace sqlan
