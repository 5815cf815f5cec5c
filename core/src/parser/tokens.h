#pragma once

#include <cstddef>
#include <string>

namespace sqlan {

/// Enumerates lexical token classes produced by the SQL lexer.
/// MUST stay coarse: the parser works on normalized text, not on a keyword enum.
/// Inputs are characters; outputs are token kinds with no side effects.
enum class TokenType {
  Identifier,
  Keyword,
  String,
  Number,
  Symbol,
  End
};

/// Represents a single token with source text and position metadata.
/// MUST keep text verbatim (quotes and brackets included) so SQL can be regenerated.
/// Inputs are lexer output; outputs are consumed by the parser and the printer.
struct Token {
  TokenType type = TokenType::End;
  std::string text;
  // Uppercase for keywords, original text otherwise.
  std::string normalized;
  bool is_identifier = false;
  bool is_keyword = false;
  size_t pos = 0;
};

}  // namespace sqlan
