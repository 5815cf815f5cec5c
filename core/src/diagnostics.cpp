#include "sqlan/diagnostics.h"

#include <algorithm>
#include <sstream>

namespace sqlan {

SourceLocation locate_position(const std::string& sql, size_t position) {
  SourceLocation location;
  size_t limit = std::min(position, sql.size());
  for (size_t i = 0; i < limit; ++i) {
    if (sql[i] == '\n') {
      ++location.line;
      location.column = 1;
    } else {
      ++location.column;
    }
  }
  return location;
}

std::string render_code_frame(const std::string& sql, size_t position) {
  if (sql.empty()) return "";
  SourceLocation location = locate_position(sql, position);
  size_t line_start = std::min(position, sql.size()) - (location.column - 1);
  size_t line_end = sql.find('\n', line_start);
  if (line_end == std::string::npos) line_end = sql.size();
  std::string line_text = sql.substr(line_start, line_end - line_start);
  if (!line_text.empty() && line_text.back() == '\r') line_text.pop_back();

  const std::string gutter(std::to_string(location.line).size(), ' ');
  std::ostringstream out;
  out << location.line << " | " << line_text << "\n";
  out << gutter << " | " << std::string(location.column - 1, ' ') << "^";
  return out.str();
}

std::string render_parse_error(const std::string& sql, const ParseError& error) {
  SourceLocation location = locate_position(sql, error.position);
  std::ostringstream out;
  out << "error: " << error.message << "\n";
  out << " --> line " << location.line << ", col " << location.column;
  std::string frame = render_code_frame(sql, error.position);
  if (!frame.empty()) out << "\n" << frame;
  return out.str();
}

}  // namespace sqlan
