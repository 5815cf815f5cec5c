#include "sqlan/syntax_options.h"

#include <stdexcept>

#include "util/string_util.h"

namespace sqlan {

SyntaxOptions::SyntaxOptions(const std::string& identifier_prefixes, char auto_parameter_prefix)
    : auto_prefix_(auto_parameter_prefix) {
  if (identifier_prefixes.empty()) {
    throw std::invalid_argument("At least one identifier prefix must be provided.");
  }
  for (char c : identifier_prefixes) {
    if (prefixes_.find(c) == std::string::npos) prefixes_.push_back(c);
  }
  // WHY: generated parameter names must lex back as identifiers.
  if (prefixes_.find(auto_parameter_prefix) == std::string::npos) {
    prefixes_.push_back(auto_parameter_prefix);
  }
}

SyntaxOptions SyntaxOptions::sql_server() { return SyntaxOptions("@#$", '@'); }

SyntaxOptions SyntaxOptions::oracle() { return SyntaxOptions(":", ':'); }

SyntaxOptions SyntaxOptions::mysql() { return SyntaxOptions("@", '@'); }

SyntaxOptions SyntaxOptions::sqlite() { return SyntaxOptions("@:$?", '@'); }

SyntaxOptions SyntaxOptions::postgresql() { return SyntaxOptions("$", '$'); }

SyntaxOptions SyntaxOptions::defaults() { return sql_server(); }

bool SyntaxOptions::is_identifier_prefix(char c) const {
  return prefixes_.find(c) != std::string::npos;
}

std::optional<SyntaxOptions> dialect_from_name(const std::string& name) {
  std::string lower = util::to_lower(util::trim_ws(name));
  if (lower == "sqlserver" || lower == "mssql") return SyntaxOptions::sql_server();
  if (lower == "oracle") return SyntaxOptions::oracle();
  if (lower == "mysql") return SyntaxOptions::mysql();
  if (lower == "sqlite") return SyntaxOptions::sqlite();
  if (lower == "postgresql" || lower == "postgres") return SyntaxOptions::postgresql();
  return std::nullopt;
}

}  // namespace sqlan
