#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "sqlan/sqlan.h"

namespace sqlan {

/// A named parameter collected while building a command.
struct SqlParameter {
  std::string name;
  std::string value;
};

/// Builds SQL text from literal pieces and parameter values.
/// MUST never splice values into the text: each value becomes a generated
/// `<auto-prefix>p<N>` placeholder surrounded by single spaces.
/// Inputs are literals and values; outputs are SQL text plus the parameter list.
class SqlCommandBuilder {
 public:
  explicit SqlCommandBuilder(SyntaxOptions syntax = SyntaxOptions::defaults());

  /// Appends literal SQL verbatim.
  SqlCommandBuilder& append_literal(const std::string& sql);
  /// Appends a placeholder for a value identified by key.
  /// MUST reuse the placeholder of a key seen before and MUST skip names already taken.
  /// Inputs are a caller key and the value text; outputs are the placeholder name.
  std::string append_value(const std::string& key, const std::string& value);
  /// Registers an explicitly named parameter without touching the text.
  /// MUST throw std::invalid_argument when the name is blank or already used.
  void add_parameter(const std::string& name, const std::string& value);

  const std::string& text() const { return text_; }
  const std::vector<SqlParameter>& parameters() const { return parameters_; }
  const SyntaxOptions& syntax() const { return syntax_; }

  /// Parses the accumulated text with the builder's dialect.
  ParseResult compile() const;

 private:
  bool has_parameter(const std::string& name) const;

  SyntaxOptions syntax_;
  std::string text_;
  std::vector<SqlParameter> parameters_;
  std::unordered_map<std::string, std::string> names_by_key_;
  size_t next_index_ = 0;
};

}  // namespace sqlan
