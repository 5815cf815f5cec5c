#pragma once

#include <string>

#include "sqlan/sqlan.h"

namespace sqlan::cli {

/// Renders an indented outline of the statement tree for --output tree.
/// MUST list every statement, present segment, list item and alias in tree order.
/// Inputs are a parsed query; outputs are text with no side effects.
std::string render_query_tree(const SqlQuery& query);

}  // namespace sqlan::cli
