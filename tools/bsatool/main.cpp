#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

#include "commands.hpp"
#include "options.hpp"

int main(int argc, char *argv[]) {
  std::vector<std::string_view> args(argv + 1, argv + argc);

  std::string error;
  auto options = bsatool::parseOptions(args, &error);
  if (!options) {
    std::cerr << "Error: " << error << "\n\n";
    bsatool::printUsage(std::cerr, argv[0]);
    return bsatool::kExitUsage;
  }

  if (options->command == bsatool::Command::Help) {
    bsatool::printUsage(std::cout, argv[0]);
    return bsatool::kExitOk;
  }

  if (!bsatool::setupLogging(*options, std::cerr)) {
    return bsatool::kExitError;
  }
  options->interactive = ::isatty(STDOUT_FILENO) != 0;

  return bsatool::run(*options, std::cout);
}
