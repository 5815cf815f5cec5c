#include <cstdio>
#include <exception>
#include <iostream>
#include <string>
#include <unistd.h>

#include "cli_args.h"
#include "cli_utils.h"
#include "config.h"
#include "render/tree_json.h"
#include "render/tree_renderer.h"
#include "sqlan/diagnostics.h"
#include "sqlan/sqlan.h"
#include "ui/color.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitParse = 2;

}  // namespace

int main(int argc, char** argv) {
  using namespace sqlan::cli;

  if (argc == 1 && isatty(fileno(stdin))) {
    print_startup_help(std::cout);
    return kExitOk;
  }

  CliOptions options;
  std::string error;
  if (!parse_cli_args(argc, argv, options, error)) {
    print_error(error, options.color && isatty(fileno(stderr)));
    print_help(std::cerr);
    return kExitUsage;
  }
  if (options.show_help) {
    print_help(std::cout);
    return kExitOk;
  }

  CliSettings settings;
  std::string config_path = options.config_path.empty() ? resolve_config_path() : options.config_path;
  if (!load_config(config_path, settings, error) && !error.empty()) {
    print_error(error, options.color && isatty(fileno(stderr)));
    return kExitUsage;
  }
  RunSettings run;
  if (!apply_cli_settings(settings, options, run, error)) {
    print_error(error, run.color && isatty(fileno(stderr)));
    return kExitUsage;
  }
  const bool err_color = run.color && isatty(fileno(stderr));
  const bool out_color = run.color && isatty(fileno(stdout));

  std::string sql;
  try {
    if (!options.query.empty()) {
      sql = options.query;
    } else if (!options.query_file.empty()) {
      sql = read_file(options.query_file);
    } else {
      sql = read_stdin();
    }
  } catch (const std::exception& ex) {
    print_error(ex.what(), err_color);
    return kExitUsage;
  }

  sqlan::ParseResult result = sqlan::parse_sql(sql, run.parse);
  if (result.error.has_value()) {
    if (err_color) std::cerr << kColor.red;
    std::cerr << sqlan::render_parse_error(sql, *result.error);
    if (err_color) std::cerr << kColor.reset;
    std::cerr << std::endl;
    return kExitParse;
  }
  const sqlan::SqlQuery& query = *result.query;

  if (run.check_only) {
    size_t count = query.all_statements().size();
    if (out_color) std::cout << kColor.green;
    std::cout << "OK (" << count << (count == 1 ? " statement" : " statements") << ")";
    if (out_color) std::cout << kColor.reset;
    std::cout << std::endl;
    return kExitOk;
  }

  try {
    if (run.output_mode == "tree") {
      std::cout << render_query_tree(query);
    } else if (run.output_mode == "json") {
      std::cout << colorize_json(render_query_json(query, run.formatting), out_color) << std::endl;
    } else {
      std::cout << query.to_sql(run.formatting) << std::endl;
    }
  } catch (const std::exception& ex) {
    print_error(ex.what(), err_color);
    return kExitUsage;
  }
  return kExitOk;
}
