#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bsatool {

enum class Command { List, Extract, ExtractAll, Create, Help };

struct Options {
  Command command = Command::Help;
  std::filesystem::path archive;
  std::filesystem::path outputDir = ".";
  std::vector<std::string> files; // extract: entry names, create: source paths
  bool longFormat = false;
  bool fullPath = false;
  bool verbose = false;
  std::filesystem::path logFile; // Empty: no log file
  bool interactive = false; // stdout is a terminal, set by main
};

// Parse arguments (without the program name).
// Returns std::nullopt on a usage error, with the reason in outError if provided
std::optional<Options> parseOptions(std::span<const std::string_view> args,
                                    std::string *outError = nullptr);

void printUsage(std::ostream &out, std::string_view prog);

} // namespace bsatool
