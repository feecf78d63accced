#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace bsa {

class Writer {
public:
  Writer() = default;
  ~Writer() = default;

  // Delete copy, enable move
  Writer(const Writer &) = delete;
  Writer &operator=(const Writer &) = delete;
  Writer(Writer &&) noexcept = default;
  Writer &operator=(Writer &&) noexcept = default;

  // Queue a file from disk. Its archive name is derived from sourcePath.
  // The file is sized now and must keep that size until write().
  bool addFile(const std::filesystem::path &sourcePath, Error *outError = nullptr);

  // Queue a file from disk under an explicit archive name
  bool addFile(const std::filesystem::path &sourcePath, std::string_view archiveName,
               Error *outError = nullptr);

  // Lay out and write the archive. Nothing is removed on failure.
  bool write(const std::filesystem::path &destPath, Error *outError = nullptr);

  void clear();

  // Entries with absolute offsets, filled in by a successful write()
  const std::vector<FileEntry> &files() const { return entries_; }

  size_t fileCount() const { return pendingFiles_.size(); }

  // Lowercase (ASCII only) and convert forward slashes to the archive separator
  static std::string toArchiveName(std::string_view path);

private:
  struct PendingFile {
    std::string archiveName;          // Normalized, as written to the filename block
    std::filesystem::path sourcePath;
    uint32_t size = 0;                // Size when queued
    uint32_t offset = 0;              // Offset within the data section
  };

  std::vector<PendingFile> pendingFiles_;
  std::vector<FileEntry> entries_;
  uint64_t dataSize_ = 0;
};

} // namespace bsa
