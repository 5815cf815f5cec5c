#pragma once

#include <string>
#include <vector>

#include "sqlan/syntax_options.h"
#include "tokens.h"

namespace sqlan {

/// Tokenizes SQL text into a stream for the parser.
/// MUST be deterministic and MUST not skip meaningful characters.
/// Inputs are SQL strings; outputs are tokens with position metadata.
class Lexer {
 public:
  /// Constructs a lexer over a stable input string reference.
  /// MUST NOT outlive the referenced input buffer.
  /// Inputs are the SQL string and dialect prefixes; side effects are none.
  Lexer(const std::string& input, const SyntaxOptions& syntax);
  /// Produces the next token from the input stream.
  /// MUST advance the cursor and MUST return End at input exhaustion.
  /// Inputs are internal state; outputs are tokens with positions.
  Token next();

  /// Tests whether an uppercase word belongs to the reserved keyword set.
  static bool is_keyword(const std::string& upper);

 private:
  /// Lexes a quoted literal, keeping delimiters and doubled-quote escapes verbatim.
  /// MUST run to end of input when the closing quote is missing.
  /// Inputs are internal state; outputs are string or delimited identifier tokens.
  Token lex_quoted();
  /// Lexes a [bracketed] identifier.
  /// MUST run to end of input when the closing bracket is missing.
  Token lex_bracketed();
  /// Lexes identifiers and recognizes keyword forms.
  /// MUST map keywords case-insensitively and preserve original text.
  /// Inputs are internal state; outputs are identifier/keyword tokens.
  Token lex_identifier_or_keyword();
  /// Lexes a numeric literal made of digits and dots.
  Token lex_number();
  /// Lexes comparison and concatenation operators, else one character.
  Token lex_symbol();
  /// Skips whitespace, line comments and block comments between tokens.
  /// MUST treat an unterminated block comment as running to end of input.
  /// Inputs are internal state; outputs are updated cursor positions.
  void skip_ws_and_comments();
  bool is_ident_start(char c) const;
  bool is_ident_char(char c) const;

  const std::string& input_;
  const SyntaxOptions& syntax_;
  size_t pos_ = 0;
};

/// Tokenizes a whole SQL string.
/// MUST return tokens in source order without the End marker.
/// Inputs are SQL text and dialect options; outputs are token vectors.
std::vector<Token> tokenize(const std::string& input, const SyntaxOptions& syntax);

}  // namespace sqlan
