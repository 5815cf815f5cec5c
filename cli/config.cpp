#include "config.h"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "sqlan/syntax_options.h"

namespace sqlan::cli {

namespace {

std::string get_env(const char* name) {
  if (const char* value = std::getenv(name)) {
    if (*value) return value;
  }
  return {};
}

std::string trim_copy(const std::string& value) {
  size_t start = 0;
  while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
    ++start;
  }
  size_t end = value.size();
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }
  return value.substr(start, end - start);
}

bool parse_bool(const std::string& raw, bool& out) {
  std::string lower;
  lower.reserve(raw.size());
  for (unsigned char c : raw) {
    lower.push_back(static_cast<char>(std::tolower(c)));
  }
  if (lower == "true") {
    out = true;
    return true;
  }
  if (lower == "false") {
    out = false;
    return true;
  }
  return false;
}

/// Parses a decimal count; zero is accepted only when allow_zero is set.
bool parse_size(const std::string& raw, bool allow_zero, size_t& out) {
  if (raw.empty() || raw[0] == '-' || raw[0] == '+') return false;
  try {
    size_t pos = 0;
    unsigned long long value = std::stoull(raw, &pos);
    if (pos != raw.size()) return false;
    if (value == 0 && !allow_zero) return false;
    out = static_cast<size_t>(value);
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

std::string parse_string_value(const std::string& raw, bool& ok) {
  std::string trimmed = trim_copy(raw);
  if (trimmed.empty()) {
    ok = false;
    return {};
  }
  if ((trimmed.front() == '"' && trimmed.back() == '"') ||
      (trimmed.front() == '\'' && trimmed.back() == '\'')) {
    if (trimmed.size() < 2) {
      ok = false;
      return {};
    }
    ok = true;
    return trimmed.substr(1, trimmed.size() - 2);
  }
  ok = true;
  return trimmed;
}

/// Strips a trailing `# comment` that is outside quotes.
std::string strip_comment(const std::string& value) {
  char quote = 0;
  for (size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (quote != 0) {
      if (c == quote) quote = 0;
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '#') {
      return trim_copy(value.substr(0, i));
    }
  }
  return value;
}

std::string invalid_at(const std::string& key, size_t line_no) {
  return "Invalid " + key + " at line " + std::to_string(line_no);
}

}  // namespace

std::string resolve_config_path() {
  std::string override = get_env("SQLAN_CONFIG");
  if (!override.empty()) {
    return override;
  }
  std::string xdg_config = get_env("XDG_CONFIG_HOME");
  if (!xdg_config.empty()) {
    return (std::filesystem::path(xdg_config) / "sqlan" / "config.toml").string();
  }
  std::string home = get_env("HOME");
  if (!home.empty()) {
    return (std::filesystem::path(home) / ".config" / "sqlan" / "config.toml").string();
  }
  return "sqlan.config.toml";
}

bool load_config(const std::string& path, CliSettings& out, std::string& error) {
  out = CliSettings{};
  if (path.empty()) return false;
  if (!std::filesystem::exists(path)) {
    return false;
  }
  std::ifstream in(path);
  if (!in) {
    error = "Failed to open config: " + path;
    return false;
  }
  std::string section;
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string trimmed = trim_copy(line);
    if (trimmed.empty()) continue;
    if (trimmed[0] == '#') continue;
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      section = trim_copy(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }
    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) continue;
    std::string key = trim_copy(trimmed.substr(0, eq));
    std::string value = strip_comment(trim_copy(trimmed.substr(eq + 1)));
    if (key.empty()) continue;
    std::string full_key = section.empty() ? key : section + "." + key;
    bool ok = false;
    if (full_key == "format.mode") {
      std::string parsed = parse_string_value(value, ok);
      auto mode = ok ? formatting_mode_from_name(parsed) : std::nullopt;
      if (!mode.has_value()) {
        error = invalid_at(full_key, line_no);
        return false;
      }
      out.format_mode = *mode;
    } else if (full_key == "format.indent") {
      size_t parsed = 0;
      if (!parse_size(value, true, parsed)) {
        error = invalid_at(full_key, line_no);
        return false;
      }
      out.indent = parsed;
    } else if (full_key == "parser.dialect") {
      std::string parsed = parse_string_value(value, ok);
      if (!ok || !dialect_from_name(parsed).has_value()) {
        error = invalid_at(full_key, line_no);
        return false;
      }
      out.dialect = parsed;
    } else if (full_key == "parser.max_depth") {
      size_t parsed = 0;
      if (!parse_size(value, false, parsed)) {
        error = invalid_at(full_key, line_no);
        return false;
      }
      out.max_depth = parsed;
    } else if (full_key == "output.color") {
      bool parsed = false;
      if (!parse_bool(value, parsed)) {
        error = invalid_at(full_key, line_no);
        return false;
      }
      out.color = parsed;
    }
  }
  return true;
}

bool apply_cli_settings(const CliSettings& settings,
                        const CliOptions& options,
                        RunSettings& run,
                        std::string& error) {
  if (settings.format_mode.has_value()) {
    run.formatting.mode = *settings.format_mode;
  }
  if (options.format.has_value()) {
    auto mode = formatting_mode_from_name(*options.format);
    if (!mode.has_value()) {
      error = "Invalid format mode: " + *options.format;
      return false;
    }
    run.formatting.mode = *mode;
  }
  run.formatting.indent_size = options.indent.value_or(
      settings.indent.value_or(run.formatting.indent_size));

  std::optional<std::string> dialect = options.dialect.has_value() ? options.dialect : settings.dialect;
  if (dialect.has_value()) {
    auto syntax = dialect_from_name(*dialect);
    if (!syntax.has_value()) {
      error = "Unknown dialect: " + *dialect;
      return false;
    }
    run.parse.syntax = *syntax;
  }
  run.parse.max_depth = options.max_depth.value_or(
      settings.max_depth.value_or(run.parse.max_depth));

  run.output_mode = options.output_mode;
  run.check_only = options.check_only;
  // WHY: --color=disabled always wins; the config can only turn color off.
  run.color = options.color && settings.color.value_or(true);
  return true;
}

}  // namespace sqlan::cli
