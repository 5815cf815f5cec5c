#include "cli_args.h"

#include <string>

#include "sqlan/formatting.h"
#include "sqlan/syntax_options.h"

namespace sqlan::cli {

namespace {

bool parse_count(const std::string& raw, size_t& out) {
  if (raw.empty()) return false;
  for (char c : raw) {
    if (c < '0' || c > '9') return false;
  }
  try {
    out = static_cast<size_t>(std::stoull(raw));
  } catch (const std::out_of_range&) {
    return false;
  }
  return true;
}

}  // namespace

/// Prints the startup help so users see baseline usage without flags.
/// MUST keep examples aligned with current CLI and MUST not throw on stream errors.
/// Inputs are the output stream; side effects are writing text to stdout/stderr.
void print_startup_help(std::ostream& os) {
  os << "sqlan - SQL statement analyzer and formatter\n\n";
  os << "Usage:\n";
  os << "  sqlan --query <sql>\n";
  os << "  sqlan --query-file <file>\n";
  os << "  sqlan --format inline|prefixed|suffixed [--indent <n>]\n";
  os << "  sqlan --output sql|tree|json\n";
  os << "  sqlan --check\n\n";
  os << "Notes:\n";
  os << "  - If neither --query nor --query-file is given, SQL is read from stdin.\n";
  os << "  - Defaults come from ~/.config/sqlan/config.toml (or $SQLAN_CONFIG).\n\n";
  os << "Examples:\n";
  os << "  sqlan --query \"select a, b from t where a = 1\" --format prefixed\n";
  os << "  sqlan --query-file ./report.sql --output tree\n";
}

/// Prints the explicit help requested by --help.
/// MUST stay synchronized with supported flags and MUST not throw on stream errors.
/// Inputs are the output stream; side effects are writing text to stdout/stderr.
void print_help(std::ostream& os) {
  os << "Usage: sqlan [--query <sql> | --query-file <file>]\n";
  os << "       [--format inline|prefixed|suffixed] [--indent <n>]\n";
  os << "       [--dialect sqlserver|oracle|mysql|sqlite|postgresql] [--max-depth <n>]\n";
  os << "       [--output sql|tree|json] [--check] [--config <path>] [--color=disabled]\n";
  os << "If neither --query nor --query-file is given, SQL is read from stdin.\n";
  os << "Exit codes: 0 success, 1 usage or I/O error, 2 parse error.\n";
}

/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false for invalid flags and MUST name the offending flag.
/// Inputs are argc/argv; outputs are options/error and no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto take_value = [&](std::string& out) {
      if (i + 1 >= argc) {
        error = "Missing value for " + arg;
        return false;
      }
      out = argv[++i];
      return true;
    };
    std::string value;
    if (arg == "--query") {
      if (!take_value(options.query)) return false;
    } else if (arg == "--query-file") {
      if (!take_value(options.query_file)) return false;
    } else if (arg == "--config") {
      if (!take_value(options.config_path)) return false;
    } else if (arg == "--format") {
      if (!take_value(value)) return false;
      if (!formatting_mode_from_name(value).has_value()) {
        // WHY: invalid modes must fail fast instead of silently printing inline SQL.
        error = "Invalid --format value (use inline|prefixed|suffixed)";
        return false;
      }
      options.format = value;
    } else if (arg == "--indent") {
      if (!take_value(value)) return false;
      size_t parsed = 0;
      if (!parse_count(value, parsed)) {
        error = "Invalid --indent value (use a non-negative integer)";
        return false;
      }
      options.indent = parsed;
    } else if (arg == "--dialect") {
      if (!take_value(value)) return false;
      if (!dialect_from_name(value).has_value()) {
        error = "Invalid --dialect value (use sqlserver|oracle|mysql|sqlite|postgresql)";
        return false;
      }
      options.dialect = value;
    } else if (arg == "--max-depth") {
      if (!take_value(value)) return false;
      size_t parsed = 0;
      if (!parse_count(value, parsed) || parsed == 0) {
        error = "Invalid --max-depth value (use a positive integer)";
        return false;
      }
      options.max_depth = parsed;
    } else if (arg == "--output") {
      if (!take_value(value)) return false;
      if (value != "sql" && value != "tree" && value != "json") {
        error = "Invalid --output value (use sql|tree|json)";
        return false;
      }
      options.output_mode = value;
    } else if (arg == "--check") {
      options.check_only = true;
    } else if (arg == "--color=disabled") {
      options.color = false;
    } else if (arg == "--help" || arg == "-h") {
      options.show_help = true;
    } else {
      error = "Unknown option: " + arg;
      return false;
    }
  }
  if (!options.query.empty() && !options.query_file.empty()) {
    error = "Use either --query or --query-file, not both";
    return false;
  }
  return true;
}

}  // namespace sqlan::cli
