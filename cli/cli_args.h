#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace sqlan::cli {

/// Captures CLI arguments so main can dispatch without re-parsing raw argv.
/// MUST keep unset optionals for values the config file may supply.
/// Inputs are argv; outputs are populated fields with no side effects by itself.
struct CliOptions {
  std::string query;
  std::string query_file;
  std::string config_path;
  std::optional<std::string> format;
  std::optional<size_t> indent;
  std::optional<std::string> dialect;
  std::optional<size_t> max_depth;
  std::string output_mode = "sql";
  bool check_only = false;
  bool color = true;
  bool show_help = false;
};

/// Prints the brief startup help shown when no arguments are provided.
/// MUST remain user-facing and MUST not throw on stream failures.
/// Inputs are the output stream; side effects are writing help text.
void print_startup_help(std::ostream& os);
/// Prints the full help text for explicit --help.
/// MUST remain accurate to supported flags and MUST not throw on stream failures.
/// Inputs are the output stream; side effects are writing help text.
void print_help(std::ostream& os);
/// Parses CLI flags into options and reports a user-facing error string.
/// MUST return false on unknown flags, missing values and invalid enumerations.
/// Inputs are argc/argv; outputs are options/error with no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace sqlan::cli
