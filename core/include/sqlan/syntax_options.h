#pragma once

#include <optional>
#include <string>

namespace sqlan {

/// Describes the identifier-prefix conventions of a SQL dialect.
/// MUST hold a non-empty prefix set and MUST include the auto-parameter prefix in it.
/// Inputs are prefix characters; outputs are immutable lookups shared by lexer and builders.
class SyntaxOptions {
 public:
  /// Builds options from a prefix set and the prefix used for generated parameters.
  /// MUST throw std::invalid_argument when identifier_prefixes is empty.
  /// Inputs are prefix characters; side effects are none.
  SyntaxOptions(const std::string& identifier_prefixes, char auto_parameter_prefix);

  static SyntaxOptions sql_server();
  static SyntaxOptions oracle();
  static SyntaxOptions mysql();
  static SyntaxOptions sqlite();
  static SyntaxOptions postgresql();
  /// Default dialect (SQL Server).
  static SyntaxOptions defaults();

  bool is_identifier_prefix(char c) const;
  const std::string& identifier_prefixes() const { return prefixes_; }
  char auto_parameter_prefix() const { return auto_prefix_; }

 private:
  std::string prefixes_;
  char auto_prefix_;
};

/// Resolves a dialect preset by case-insensitive name.
/// Accepts sqlserver, mssql, oracle, mysql, sqlite, postgresql and postgres.
/// Inputs are names; outputs are presets or nullopt for unknown names.
std::optional<SyntaxOptions> dialect_from_name(const std::string& name);

}  // namespace sqlan
