#include "parser_internal.h"

#include <cstddef>
#include <string>

namespace sqlan {

namespace {

bool is_keyword_token(const Token& token, const char* word) {
  return token.is_keyword && token.normalized == word;
}

std::string empty_clause_message(ClauseStart clause) {
  switch (clause) {
    case ClauseStart::Where: return "Expected predicate after WHERE.";
    case ClauseStart::Having: return "Expected predicate after HAVING.";
    case ClauseStart::Limit: return "Expected expression after LIMIT.";
    case ClauseStart::Offset: return "Expected expression after OFFSET.";
    default: break;
  }
  return std::string("Expected expression after ") + clause_name(clause) + ".";
}

}  // namespace

bool Parser::read_clause_body(Segment& segment,
                              ClauseStart clause,
                              const std::vector<ClauseStart>& terminators) {
  if (segment.kind() == SegmentKind::Plain) {
    std::vector<Token> tokens = read_section_tokens(terminators);
    if (tokens.empty()) return set_error(empty_clause_message(clause));
    std::vector<SegmentPart> parts;
    if (!build_parts(tokens, parts)) return false;
    segment.append_parts(std::move(parts));
    return true;
  }
  std::vector<LoweredItem> items;
  if (!read_items(segment.kind(), terminators, items)) return false;
  append_items(segment, std::move(items));
  return true;
}

bool Parser::read_target(Segment& segment,
                         const std::vector<ClauseStart>& terminators,
                         const std::string& message) {
  std::vector<Token> tokens = read_section_tokens(terminators);
  if (tokens.empty()) return set_error(message);
  std::vector<SegmentPart> parts;
  if (!build_parts(tokens, parts)) return false;
  segment.append_parts(std::move(parts));
  return true;
}

/// Reads comma-separated items until a terminator, a ')' or the end of input.
/// MUST split only on top-level commas and MUST keep alias tokens inside the item parts.
/// Inputs are the list kind and terminators; outputs are lowered items or an error.
bool Parser::read_items(SegmentKind kind,
                        const std::vector<ClauseStart>& terminators,
                        std::vector<LoweredItem>& out) {
  while (true) {
    std::vector<Token> tokens;
    if (kind == SegmentKind::TableList) {
      if (!read_table(tokens, terminators)) return false;
    } else if (!read_expression(tokens, terminators)) {
      return false;
    }
    LoweredItem item;
    if (kind == SegmentKind::AliasedList && !split_alias(tokens, item)) return false;
    if (!build_parts(tokens, item.parts)) return false;
    out.push_back(std::move(item));
    if (!match_symbol(",")) break;
    advance();
  }
  return true;
}

/// Reads one expression, tracking parenthesis and CASE ... END depth.
/// MUST stop at a top-level ',' or clause start, and at an unmatched ')' or ';'.
bool Parser::read_expression(std::vector<Token>& out, const std::vector<ClauseStart>& terminators) {
  size_t paren_depth = 0;
  size_t case_depth = 0;
  while (!at_end()) {
    const Token& token = current();
    if (paren_depth == 0) {
      if (token.text == ")" || token.text == ";") break;
      if (case_depth == 0) {
        if (token.text == ",") break;
        if (is_clause_start(tokens_, pos_, terminators)) break;
      }
    }
    if (token.text == "(") {
      ++paren_depth;
    } else if (token.text == ")") {
      --paren_depth;
    } else if (is_keyword_token(token, "CASE")) {
      ++case_depth;
    } else if (is_keyword_token(token, "END") && case_depth > 0) {
      --case_depth;
    }
    out.push_back(token);
    advance();
  }
  if (out.empty()) return set_error("Expected expression but none was found.");
  return true;
}

/// Reads one table source including its joins.
/// MUST not stop at a boundary while a JOIN still lacks its ON at depth 0.
bool Parser::read_table(std::vector<Token>& out, const std::vector<ClauseStart>& terminators) {
  size_t depth = 0;
  size_t join_count = 0;
  size_t on_count = 0;
  while (!at_end()) {
    const Token& token = current();
    if (depth == 0 && on_count >= join_count) {
      if (token.text == "," || token.text == ")" || token.text == ";") break;
      if (is_clause_start(tokens_, pos_, terminators)) break;
    }
    if (token.text == "(") {
      ++depth;
    } else if (token.text == ")") {
      if (depth > 0) --depth;
    } else if (depth == 0 && is_keyword_token(token, "JOIN")) {
      // CROSS JOIN has no join condition.
      if (out.empty() || !is_keyword_token(out.back(), "CROSS")) ++join_count;
    } else if (depth == 0 && is_keyword_token(token, "ON")) {
      ++on_count;
    }
    out.push_back(token);
    advance();
  }
  if (out.empty()) return set_error("Expected table but none was found.");
  if (on_count < join_count) {
    return set_error("Missing ON clause for one or more JOIN operations.");
  }
  return true;
}

/// Detects `expr AS alias` and the implicit `expr alias` form.
/// MUST keep the tokens untouched; only the alias metadata is filled in.
bool Parser::split_alias(const std::vector<Token>& tokens, LoweredItem& item) {
  const Token& last = tokens.back();
  if (is_keyword_token(last, "AS")) {
    return set_error("Expected identifier after AS but found " + describe_current() + ".");
  }
  if (tokens.size() < 2) return true;
  const Token& before = tokens[tokens.size() - 2];
  if (is_keyword_token(before, "AS")) {
    if (!last.is_identifier) {
      return set_error_at("Expected identifier after AS but found '" + last.text + "'.", last.pos);
    }
    if (tokens.size() == 2) {
      return set_error_at("Expression cannot be reduced to an alias only.", before.pos);
    }
    item.alias = last.text;
    item.alias_part_count = 2;
    return true;
  }
  // A member or cast separator makes the identifier part of the expression.
  bool separated = before.text == "." || before.text == "::";
  if (last.is_identifier && !last.is_keyword && !separated) {
    item.alias = last.text;
    item.alias_part_count = 1;
  }
  return true;
}

/// Collects a clause span up to a terminator, an unmatched ')' or a top-level ';'.
std::vector<Token> Parser::read_section_tokens(const std::vector<ClauseStart>& terminators) {
  std::vector<Token> out;
  size_t depth = 0;
  while (!at_end()) {
    const Token& token = current();
    if (depth == 0) {
      if (token.text == ")" || token.text == ";") break;
      if (is_clause_start(tokens_, pos_, terminators)) break;
    }
    if (token.text == "(") {
      ++depth;
    } else if (token.text == ")") {
      --depth;
    }
    out.push_back(token);
    advance();
  }
  return out;
}

/// Lowers a token span into parts, parsing parenthesized statements recursively.
/// MUST keep every other token verbatim and in order.
/// Inputs are tokens; outputs are parts or the nested parse error.
bool Parser::build_parts(const std::vector<Token>& tokens, std::vector<SegmentPart>& out) {
  for (size_t i = 0; i < tokens.size(); ++i) {
    if (tokens[i].text == "(" && i + 1 < tokens.size() && starts_statement(tokens[i + 1])) {
      size_t close = find_matching_paren(tokens, i);
      if (close != std::string::npos) {
        std::vector<Token> inner(tokens.begin() + static_cast<std::ptrdiff_t>(i + 1),
                                 tokens.begin() + static_cast<std::ptrdiff_t>(close));
        std::unique_ptr<Statement> nested;
        if (!parse_nested(std::move(inner), tokens[close].pos, nested)) return false;
        out.emplace_back(SubqueryPart(std::move(nested)));
        i = close;
        continue;
      }
    }
    out.emplace_back(TokenPart{tokens[i].text});
  }
  return true;
}

void append_items(Segment& segment, std::vector<LoweredItem> items) {
  for (auto& item : items) {
    if (!segment.is_empty()) segment.append_separator();
    segment.append_item(std::move(item.parts), item.alias_part_count, std::move(item.alias));
  }
}

}  // namespace sqlan
