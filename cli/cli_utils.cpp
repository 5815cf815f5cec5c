#include "cli_utils.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "ui/color.h"

namespace sqlan::cli {

std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

std::string read_stdin() {
  std::ostringstream buffer;
  buffer << std::cin.rdbuf();
  return buffer.str();
}

void print_error(const std::string& message, bool color) {
  if (color) std::cerr << kColor.red;
  std::cerr << "Error: " << message;
  if (color) std::cerr << kColor.reset;
  std::cerr << std::endl;
}

}  // namespace sqlan::cli
