#include <format>
#include <ostream>
#include <utility>

#include "options.hpp"

namespace bsatool {

namespace {

void setUsageError(std::string *outError, std::string message) {
  if (outError) {
    *outError = std::move(message);
  }
}

std::optional<Command> parseCommand(std::string_view name) {
  if (name == "list") {
    return Command::List;
  }
  if (name == "extract") {
    return Command::Extract;
  }
  if (name == "extract-all" || name == "extractall") {
    return Command::ExtractAll;
  }
  if (name == "create") {
    return Command::Create;
  }
  return std::nullopt;
}

// Subcommand arguments after ARCHIVE COMMAND
bool parseCommandArgs(Options &options, std::span<const std::string_view> args,
                      std::string *outError) {
  for (size_t i = 0; i < args.size(); ++i) {
    std::string_view arg = args[i];

    if (arg == "--verbose" || arg == "-v") {
      options.verbose = true;
    } else if (arg == "--log-file") {
      if (i + 1 >= args.size()) {
        setUsageError(outError, "--log-file requires a path");
        return false;
      }
      options.logFile = std::string(args[++i]);
    } else if (options.command == Command::List && (arg == "--long" || arg == "-l")) {
      options.longFormat = true;
    } else if (options.command == Command::Extract && (arg == "--full-path" || arg == "-f")) {
      options.fullPath = true;
    } else if ((options.command == Command::Extract || options.command == Command::ExtractAll) &&
               (arg == "--output" || arg == "-o")) {
      if (i + 1 >= args.size()) {
        setUsageError(outError, std::format("{} requires a directory", arg));
        return false;
      }
      options.outputDir = std::string(args[++i]);
    } else if (options.command == Command::Create && arg == "--files") {
      // Everything after --files is a source path
      for (++i; i < args.size(); ++i) {
        options.files.emplace_back(args[i]);
      }
    } else if (options.command == Command::Extract && !arg.starts_with("-")) {
      options.files.emplace_back(arg);
    } else {
      setUsageError(outError, std::format("Unknown option: {}", arg));
      return false;
    }
  }

  if (options.command == Command::Extract && options.files.empty()) {
    setUsageError(outError, "extract needs at least one file name");
    return false;
  }
  if (options.command == Command::Create && options.files.empty()) {
    setUsageError(outError, "create needs --files followed by at least one file");
    return false;
  }
  return true;
}

} // namespace

std::optional<Options> parseOptions(std::span<const std::string_view> args,
                                    std::string *outError) {
  Options options;

  size_t i = 0;
  for (; i < args.size(); ++i) {
    if (args[i] == "--help" || args[i] == "-h") {
      options.command = Command::Help;
      return options;
    }
    if (args[i] == "--verbose" || args[i] == "-v") {
      options.verbose = true;
      continue;
    }
    if (args[i] == "--log-file") {
      if (i + 1 >= args.size()) {
        setUsageError(outError, "--log-file requires a path");
        return std::nullopt;
      }
      options.logFile = std::string(args[++i]);
      continue;
    }
    break;
  }

  if (i + 2 > args.size()) {
    setUsageError(outError, "Missing archive or command");
    return std::nullopt;
  }

  options.archive = std::string(args[i]);
  auto command = parseCommand(args[i + 1]);
  if (!command) {
    setUsageError(outError, std::format("Unknown command: {}", args[i + 1]));
    return std::nullopt;
  }
  options.command = *command;

  if (!parseCommandArgs(options, args.subspan(i + 2), outError)) {
    return std::nullopt;
  }
  return options;
}

void printUsage(std::ostream &out, std::string_view prog) {
  out << "Usage: " << prog << " [--verbose] [--log-file PATH] <archive> <command> [options]\n"
      << "\n"
      << "Inspect, extract and create BSA archives.\n"
      << "\nCommands:\n"
      << "  list [--long]                              list the files in the archive\n"
      << "  extract --output DIR [--full-path] FILES   extract the named files\n"
      << "  extract-all --output DIR                   extract every file\n"
      << "  create --files FILES                       create the archive from FILES\n"
      << "\nOptions:\n"
      << "  -l, --long        include size and offset in the listing\n"
      << "  -f, --full-path   recreate the archive directory hierarchy on extract\n"
      << "  -o, --output DIR  output directory (default: .)\n"
      << "  -v, --verbose     enable debug logging\n"
      << "  --log-file PATH   also append log lines to PATH\n"
      << "  -h, --help        show this help\n"
      << "\nExamples:\n"
      << "  " << prog << " Morrowind.bsa list --long\n"
      << "  " << prog << " Morrowind.bsa extract --output out meshes/a/a_amulet.nif\n"
      << "  " << prog << " mod.bsa create --files meshes/x.nif textures/x.dds\n";
}

} // namespace bsatool
