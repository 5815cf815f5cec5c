#include "lexer.h"

#include <cctype>
#include <unordered_set>

#include "util/string_util.h"

namespace sqlan {

namespace {

const std::unordered_set<std::string>& keyword_set() {
  static const std::unordered_set<std::string> kKeywords = {
      "SELECT", "FROM",    "WHERE",  "GROUP",     "BY",     "HAVING",    "ORDER",  "LIMIT",
      "OFFSET", "UNION",   "ALL",    "DISTINCT",  "INSERT", "INTO",      "VALUES", "RETURNING",
      "OUTPUT", "UPDATE",  "SET",    "DELETE",    "WITH",   "RECURSIVE", "AS",     "ON",
      "JOIN",   "INNER",   "LEFT",   "RIGHT",     "FULL",   "OUTER",     "CROSS",  "USING",
      "INTERSECT", "EXCEPT", "AND",  "OR",        "NOT",    "CASE",      "WHEN",   "THEN",
      "ELSE",   "END",     "IN",     "IS",        "NULL",   "EXISTS",    "BETWEEN", "LIKE"};
  return kKeywords;
}

Token make_token(TokenType type, std::string text, size_t pos, bool is_identifier) {
  Token token;
  token.type = type;
  token.normalized = text;
  token.text = std::move(text);
  token.is_identifier = is_identifier;
  token.pos = pos;
  return token;
}

}  // namespace

Lexer::Lexer(const std::string& input, const SyntaxOptions& syntax)
    : input_(input), syntax_(syntax) {}

bool Lexer::is_keyword(const std::string& upper) {
  return keyword_set().count(upper) > 0;
}

Token Lexer::next() {
  skip_ws_and_comments();
  if (pos_ >= input_.size()) {
    return Token{TokenType::End, "", "", false, false, pos_};
  }

  char c = input_[pos_];
  if (c == '\'' || c == '"') {
    return lex_quoted();
  }
  if (c == '[') {
    return lex_bracketed();
  }
  if (is_ident_start(c)) {
    return lex_identifier_or_keyword();
  }
  if (std::isdigit(static_cast<unsigned char>(c))) {
    return lex_number();
  }
  return lex_symbol();
}

Token Lexer::lex_quoted() {
  size_t start = pos_;
  char quote = input_[pos_++];
  while (pos_ < input_.size()) {
    if (input_[pos_] == quote) {
      // WHY: a doubled quote is an escaped quote, not the terminator.
      if (pos_ + 1 < input_.size() && input_[pos_ + 1] == quote) {
        pos_ += 2;
        continue;
      }
      ++pos_;
      break;
    }
    ++pos_;
  }
  std::string text = input_.substr(start, pos_ - start);
  if (quote == '"') {
    return make_token(TokenType::Identifier, std::move(text), start, true);
  }
  return make_token(TokenType::String, std::move(text), start, false);
}

Token Lexer::lex_bracketed() {
  size_t start = pos_;
  ++pos_;
  while (pos_ < input_.size()) {
    if (input_[pos_++] == ']') break;
  }
  return make_token(TokenType::Identifier, input_.substr(start, pos_ - start), start, true);
}

Token Lexer::lex_identifier_or_keyword() {
  size_t start = pos_;
  ++pos_;
  while (pos_ < input_.size() && is_ident_char(input_[pos_])) {
    ++pos_;
  }
  std::string text = input_.substr(start, pos_ - start);
  std::string upper = util::to_upper(text);
  if (is_keyword(upper)) {
    Token token = make_token(TokenType::Keyword, std::move(text), start, false);
    token.normalized = upper;
    token.is_keyword = true;
    return token;
  }
  return make_token(TokenType::Identifier, std::move(text), start, true);
}

Token Lexer::lex_number() {
  size_t start = pos_;
  while (pos_ < input_.size() &&
         (std::isdigit(static_cast<unsigned char>(input_[pos_])) || input_[pos_] == '.')) {
    ++pos_;
  }
  return make_token(TokenType::Number, input_.substr(start, pos_ - start), start, false);
}

Token Lexer::lex_symbol() {
  size_t start = pos_;
  char c = input_[pos_];
  char next = pos_ + 1 < input_.size() ? input_[pos_ + 1] : '\0';
  bool pair = false;
  switch (c) {
    case '>': pair = next == '='; break;
    case '<': pair = next == '=' || next == '>'; break;
    case '!': pair = next == '='; break;
    case '|': pair = next == '|'; break;
    case ':': pair = next == ':'; break;
    default: break;
  }
  pos_ += pair ? 2 : 1;
  return make_token(TokenType::Symbol, input_.substr(start, pos_ - start), start, false);
}

void Lexer::skip_ws_and_comments() {
  while (pos_ < input_.size()) {
    char c = input_[pos_];
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++pos_;
      continue;
    }
    char next = pos_ + 1 < input_.size() ? input_[pos_ + 1] : '\0';
    if (c == '-' && next == '-') {
      pos_ += 2;
      while (pos_ < input_.size() && input_[pos_] != '\n') ++pos_;
      continue;
    }
    if (c == '/' && next == '*') {
      size_t close = input_.find("*/", pos_ + 2);
      pos_ = close == std::string::npos ? input_.size() : close + 2;
      continue;
    }
    break;
  }
}

bool Lexer::is_ident_start(char c) const {
  unsigned char uc = static_cast<unsigned char>(c);
  // Bytes >= 0x80 belong to UTF-8 sequences and are treated as letters.
  return std::isalpha(uc) || uc >= 0x80 || c == '_' || c == '$' || syntax_.is_identifier_prefix(c);
}

bool Lexer::is_ident_char(char c) const {
  unsigned char uc = static_cast<unsigned char>(c);
  return std::isalnum(uc) || uc >= 0x80 || c == '_' || c == '$' || syntax_.is_identifier_prefix(c);
}

std::vector<Token> tokenize(const std::string& input, const SyntaxOptions& syntax) {
  Lexer lexer(input, syntax);
  std::vector<Token> tokens;
  for (Token token = lexer.next(); token.type != TokenType::End; token = lexer.next()) {
    tokens.push_back(std::move(token));
  }
  return tokens;
}

}  // namespace sqlan
