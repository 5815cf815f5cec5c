#pragma once

#include <cstddef>
#include <string>
#include <vector>

struct TestCase {
  const char* name;
  void (*fn)();
};

void expect_true(bool condition, const std::string& message);
void expect_eq(size_t actual, size_t expected, const std::string& message);
/// Compares strings and prints both sides on mismatch.
void expect_str(const std::string& actual, const std::string& expected, const std::string& message);

/// Runs one test and returns its failure count.
/// MUST report an escaping exception as a failure of that test.
int run_test(const TestCase& test);

void register_lexer_tests(std::vector<TestCase>& tests);
void register_syntax_options_tests(std::vector<TestCase>& tests);
void register_clause_registry_tests(std::vector<TestCase>& tests);
void register_select_parsing_tests(std::vector<TestCase>& tests);
void register_cte_parsing_tests(std::vector<TestCase>& tests);
void register_dml_parsing_tests(std::vector<TestCase>& tests);
void register_parse_error_tests(std::vector<TestCase>& tests);
void register_segment_mutation_tests(std::vector<TestCase>& tests);
void register_reconstruction_tests(std::vector<TestCase>& tests);
void register_pretty_printer_tests(std::vector<TestCase>& tests);
void register_diagnostics_tests(std::vector<TestCase>& tests);
void register_command_builder_tests(std::vector<TestCase>& tests);
void register_cli_tests(std::vector<TestCase>& tests);
