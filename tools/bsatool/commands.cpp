#include <algorithm>
#include <format>
#include <ostream>
#include <string>
#include <vector>

#include <bsa/log.hpp>

#include "commands.hpp"
#include "progress.hpp"

namespace bsatool {

namespace {

// Create the directory hierarchy for target; extraction writes never create directories
bool prepareTarget(const std::filesystem::path &target, bsa::Error *outError) {
  std::filesystem::path parent = target.parent_path();
  if (parent.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec || !std::filesystem::is_directory(parent)) {
    bsa::detail::setError(outError, bsa::ErrorCode::Io,
                          std::format("{} is not a directory{}", parent.string(),
                                      ec ? ": " + ec.message() : std::string()));
    return false;
  }
  return true;
}

void rejectTarget(std::string_view entryName, std::string_view reason, bsa::Error *outError) {
  bsa::detail::setError(outError, bsa::ErrorCode::Io,
                        std::format("Refusing to extract '{}': {}", entryName, reason));
  if (outError) {
    outError->name = std::string(entryName);
  }
}

} // namespace

std::optional<std::filesystem::path> extractTarget(const std::filesystem::path &outputDir,
                                                   std::string_view entryName, bool fullPath,
                                                   bsa::Error *outError) {
  std::string relative(entryName);
  std::replace(relative.begin(), relative.end(), bsa::kSeparator, '/');

  std::filesystem::path relativePath(relative);
  for (const auto &part : relativePath) {
    if (part == "..") {
      rejectTarget(entryName, "path escapes output directory", outError);
      return std::nullopt;
    }
  }

  std::filesystem::path name = fullPath ? relativePath.relative_path() : relativePath.filename();
  if (name.empty() || name.filename().empty() || name.filename() == ".") {
    rejectTarget(entryName, "entry has no file name", outError);
    return std::nullopt;
  }

  // The normalized target must still sit strictly below outputDir
  std::filesystem::path target = outputDir / name;
  std::filesystem::path inside =
      target.lexically_normal().lexically_relative(outputDir.lexically_normal());
  if (inside.empty() || inside == "." || *inside.begin() == "..") {
    rejectTarget(entryName, "path escapes output directory", outError);
    return std::nullopt;
  }
  return target;
}

bool listFiles(const bsa::Archive &archive, const Options &options, std::ostream &out,
               bsa::Error *outError) {
  auto files = archive.files(outError);
  if (!files) {
    return false;
  }

  for (const auto &file : *files) {
    if (options.longFormat) {
      out << std::format("{:<50}{:>8}@ 0x{:x}\n", file.name, file.size, file.offset);
    } else {
      out << file.name << "\n";
    }
  }
  return true;
}

bool extractFiles(const bsa::Archive &archive, const Options &options, std::ostream &out,
                  bsa::Error *outError) {
  for (const auto &name : options.files) {
    auto present = archive.exists(name, outError);
    if (!present) {
      return false;
    }
    if (!*present) {
      bsa::detail::setError(outError, bsa::ErrorCode::FileNotFound,
                            std::format("File not found in archive: {}", name));
      if (outError) {
        outError->name = name;
      }
      return false;
    }

    const bsa::FileEntry *entry = archive.findFile(name);
    auto target = extractTarget(options.outputDir, entry->name, options.fullPath, outError);
    if (!target || !prepareTarget(*target, outError)) {
      return false;
    }

    out << "Extracting " << name << " to " << target->string() << "\n";
    if (!archive.extract(entry->name, *target, outError)) {
      return false;
    }
  }
  return true;
}

bool extractAll(const bsa::Archive &archive, const Options &options, std::ostream &out,
                bsa::Error *outError) {
  auto files = archive.files(outError);
  if (!files) {
    return false;
  }

  ProgressBar progress(out, files->size(), options.interactive);
  for (const auto &file : *files) {
    auto target = extractTarget(options.outputDir, file.name, true, outError);
    if (!target || !prepareTarget(*target, outError)) {
      return false;
    }

    if (!archive.extract(file.name, *target, outError)) {
      return false;
    }
    BSA_LOG_DEBUG(std::format("Extracted {} ({} bytes)", target->string(), file.size));
    progress.tick();
  }
  progress.finish("done");
  return true;
}

bool createArchive(bsa::Archive &archive, const Options &options, std::ostream &out,
                   bsa::Error *outError) {
  std::vector<std::filesystem::path> sources(options.files.begin(), options.files.end());
  if (!archive.create(options.archive, sources, outError)) {
    return false;
  }

  out << std::format("Created {} with {} files\n", options.archive.string(),
                     archive.fileCount());
  return true;
}

namespace {

bool runOnArchive(const bsa::Archive &archive, const Options &options, std::ostream &out,
                  bsa::Error *outError) {
  switch (options.command) {
  case Command::List:
    return listFiles(archive, options, out, outError);
  case Command::Extract:
    return extractFiles(archive, options, out, outError);
  case Command::ExtractAll:
    return extractAll(archive, options, out, outError);
  case Command::Create:
  case Command::Help:
    break;
  }
  return true;
}

} // namespace

bool setupLogging(const Options &options, std::ostream &err) {
  auto &logger = bsa::Logger::get();
  logger.setLevel(options.verbose ? bsa::LogLevel::Debug : bsa::LogLevel::Info);
  if (!options.logFile.empty() && !logger.setLogFile(options.logFile)) {
    err << "Error: cannot open log file " << options.logFile.string() << "\n";
    return false;
  }
  return true;
}

int run(const Options &options, std::ostream &out) {
  if (options.command == Command::Help) {
    return kExitOk;
  }

  bsa::Archive archive;
  bsa::Error error;

  bool ok = false;
  if (options.command == Command::Create) {
    ok = createArchive(archive, options, out, &error);
  } else {
    ok = archive.open(options.archive, &error) && runOnArchive(archive, options, out, &error);
  }

  if (!ok) {
    BSA_LOG_ERROR(std::format("{}: {} (archive: {})", bsa::errorCodeName(error.code),
                              error.message, options.archive.string()));
    return kExitError;
  }
  return kExitOk;
}

} // namespace bsatool
