#pragma once

#include <string>

namespace sqlan::cli {

/// Reads a file into memory for --query-file.
/// MUST throw on missing/unreadable files.
/// Inputs are a path; outputs are contents; side effects are file reads/errors.
std::string read_file(const std::string& path);
/// Reads all stdin content for piped usage.
/// MUST block until EOF and MUST not interpret the stream contents.
/// Inputs are stdin; outputs are captured content; side effects are stream reads.
std::string read_stdin();
/// Prints "Error: <message>" to stderr, red when color is enabled.
void print_error(const std::string& message, bool color);

}  // namespace sqlan::cli
