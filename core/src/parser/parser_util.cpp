#include "parser_internal.h"

#include <string>

namespace sqlan {

/// Advances to the next token in the list.
/// MUST never move past the end so at_end() stays reliable.
void Parser::advance() {
  if (pos_ < tokens_.size()) ++pos_;
}

bool Parser::match_keyword(const char* keyword) const {
  return !at_end() && current().is_keyword && current().normalized == keyword;
}

bool Parser::match_symbol(const char* symbol) const {
  return !at_end() && current().text == symbol;
}

/// Consumes a required keyword or records an error naming what was found.
bool Parser::expect_keyword(const char* keyword) {
  if (!match_keyword(keyword)) {
    return set_error(std::string("Expected keyword '") + keyword + "' but found " +
                     describe_current() + ".");
  }
  advance();
  return true;
}

bool Parser::expect_symbol(const char* symbol) {
  if (!match_symbol(symbol)) {
    return set_error(std::string("Expected '") + symbol + "' but found " + describe_current() + ".");
  }
  advance();
  return true;
}

bool Parser::expect_identifier(std::string& out) {
  if (at_end() || !current().is_identifier) {
    return set_error("Expected identifier but found " + describe_current() + ".");
  }
  out = current().text;
  advance();
  return true;
}

std::string Parser::describe_current() const {
  if (at_end()) return "end of input";
  return "'" + current().text + "'";
}

size_t Parser::current_position() const {
  return at_end() ? end_position_ : current().pos;
}

/// Records a parse error at the current token.
/// MUST return false so callers can propagate with a single return.
/// Inputs are error message; outputs are false with stored error.
bool Parser::set_error(const std::string& message) {
  error_ = ParseError{message, current_position()};
  return false;
}

bool Parser::set_error_at(const std::string& message, size_t position) {
  error_ = ParseError{message, position};
  return false;
}

size_t Parser::find_matching_paren(const std::vector<Token>& tokens, size_t open) {
  size_t depth = 0;
  for (size_t i = open; i < tokens.size(); ++i) {
    if (tokens[i].text == "(") {
      ++depth;
    } else if (tokens[i].text == ")") {
      if (--depth == 0) return i;
    }
  }
  return std::string::npos;
}

bool Parser::starts_statement(const Token& token) {
  if (!token.is_keyword) return false;
  const std::string& word = token.normalized;
  return word == "SELECT" || word == "INSERT" || word == "UPDATE" || word == "DELETE" ||
         word == "WITH";
}

}  // namespace sqlan
