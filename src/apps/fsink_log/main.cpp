// File: src/apps/fsink_log/main.cpp
#include <iostream>
#include <string>
#include <vector>

#include "fsink_log_app.hpp"

int main(int argc, char** argv) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  return fsink::app::run_fsink_log(args, std::cin, std::cout, std::cerr);
}
