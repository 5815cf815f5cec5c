#include "sqlan/command_builder.h"

#include <stdexcept>

#include "util/string_util.h"

namespace sqlan {

SqlCommandBuilder::SqlCommandBuilder(SyntaxOptions syntax) : syntax_(std::move(syntax)) {}

SqlCommandBuilder& SqlCommandBuilder::append_literal(const std::string& sql) {
  text_ += sql;
  return *this;
}

std::string SqlCommandBuilder::append_value(const std::string& key, const std::string& value) {
  auto it = names_by_key_.find(key);
  std::string name;
  if (it != names_by_key_.end()) {
    name = it->second;
  } else {
    do {
      name = std::string(1, syntax_.auto_parameter_prefix()) + "p" + std::to_string(next_index_++);
    } while (has_parameter(name));
    parameters_.push_back(SqlParameter{name, value});
    names_by_key_.emplace(key, name);
  }
  text_ += ' ';
  text_ += name;
  text_ += ' ';
  return name;
}

void SqlCommandBuilder::add_parameter(const std::string& name, const std::string& value) {
  if (util::is_blank(name)) {
    throw std::invalid_argument("Parameter name must not be empty.");
  }
  if (has_parameter(name)) {
    throw std::invalid_argument("Parameter '" + name + "' is already defined.");
  }
  parameters_.push_back(SqlParameter{name, value});
}

ParseResult SqlCommandBuilder::compile() const {
  return parse_sql(text_, syntax_);
}

bool SqlCommandBuilder::has_parameter(const std::string& name) const {
  for (const auto& parameter : parameters_) {
    if (parameter.name == name) return true;
  }
  return false;
}

}  // namespace sqlan
