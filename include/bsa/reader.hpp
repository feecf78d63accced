#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace bsa {

class Reader {
public:
  Reader() = default;
  ~Reader() = default;

  // Delete copy, enable move
  Reader(const Reader &) = delete;
  Reader &operator=(const Reader &) = delete;
  Reader(Reader &&) noexcept = default;
  Reader &operator=(Reader &&) noexcept = default;

  // Parse the header and directory of an archive.
  // The file is mapped only while parsing; entry data is read on demand.
  static std::optional<Reader> open(const std::filesystem::path &path, Error *outError = nullptr);

  // Reader over an archive whose directory is already known (just written).
  // Entry offsets must be absolute.
  static Reader fromEntries(const std::filesystem::path &path, std::vector<FileEntry> entries);

  const std::vector<FileEntry> &files() const { return files_; }

  size_t fileCount() const { return files_.size(); }

  // Exact, case-sensitive lookup after converting '/' to '\'.
  // Returns nullptr if no entry has that name
  const FileEntry *findFile(std::string_view name) const;

  // Read an entry's data. Each call opens its own stream on the archive.
  std::optional<std::vector<uint8_t>> extractToMemory(const FileEntry &entry,
                                                      Error *outError = nullptr) const;

  // Write an entry's data to destPath. Parent directories must already exist.
  bool extract(const FileEntry &entry, const std::filesystem::path &destPath,
               Error *outError = nullptr) const;

  const std::filesystem::path &path() const { return path_; }

  // Convert forward slashes to the archive separator, preserving case
  static std::string normalizeName(std::string_view name);

private:
  bool parse(std::span<const uint8_t> data, Error *outError);
  void buildLookup();

  std::filesystem::path path_;
  std::vector<FileEntry> files_;
  std::unordered_map<std::string, size_t> lookup_; // name -> index, last duplicate wins
};

} // namespace bsa
