#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "cli_args.h"
#include "sqlan/formatting.h"
#include "sqlan/sqlan.h"

namespace sqlan::cli {

/// Values read from the config file; unset fields keep built-in defaults.
struct CliSettings {
  std::optional<FormattingMode> format_mode;
  std::optional<size_t> indent;
  std::optional<std::string> dialect;
  std::optional<size_t> max_depth;
  std::optional<bool> color;
};

/// Effective settings for one run after merging config file and flags.
struct RunSettings {
  FormattingOptions formatting;
  ParseOptions parse;
  std::string output_mode = "sql";
  bool check_only = false;
  bool color = true;
};

/// Resolves the config path from SQLAN_CONFIG, XDG_CONFIG_HOME or HOME.
std::string resolve_config_path();
/// Loads a TOML-style config file into settings.
/// MUST return false without error when the file does not exist, and MUST set
/// error to "Invalid <key> at line N" for malformed values.
/// Inputs are a path; outputs are settings/error; side effects are file reads.
bool load_config(const std::string& path, CliSettings& out, std::string& error);
/// Merges config settings and CLI flags (flags win) into run settings.
/// MUST reject unknown dialect names coming from either source.
/// Inputs are settings and options; outputs are run/error with no side effects.
bool apply_cli_settings(const CliSettings& settings,
                        const CliOptions& options,
                        RunSettings& run,
                        std::string& error);

}  // namespace sqlan::cli
