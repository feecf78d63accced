#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string_view>

#include <bsa/archive.hpp>

#include "options.hpp"

namespace bsatool {

// Exit codes
inline constexpr int kExitOk = 0;
inline constexpr int kExitUsage = 1;
inline constexpr int kExitError = 2;

bool listFiles(const bsa::Archive &archive, const Options &options, std::ostream &out,
               bsa::Error *outError = nullptr);

bool extractFiles(const bsa::Archive &archive, const Options &options, std::ostream &out,
                  bsa::Error *outError = nullptr);

bool extractAll(const bsa::Archive &archive, const Options &options, std::ostream &out,
                bsa::Error *outError = nullptr);

bool createArchive(bsa::Archive &archive, const Options &options, std::ostream &out,
                   bsa::Error *outError = nullptr);

// Where an entry lands under outputDir. Without fullPath only the file name is kept.
// Names with a '..' component, or without a file name, are rejected with Io
// so that nothing is written outside outputDir.
std::optional<std::filesystem::path> extractTarget(const std::filesystem::path &outputDir,
                                                   std::string_view entryName, bool fullPath,
                                                   bsa::Error *outError = nullptr);

// Info level, or Debug with --verbose, plus the --log-file sink if one was given.
// Reports an unusable log file on err.
bool setupLogging(const Options &options, std::ostream &err);

// Open or create the archive and run the command. Returns the process exit code.
int run(const Options &options, std::ostream &out);

} // namespace bsatool
