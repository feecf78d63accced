#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace bsa {

// Forward declarations
class Reader;

// Source file for Archive::create stored under an explicit archive name
struct SourceFile {
  std::filesystem::path path;
  std::string archiveName;
};

// High-level archive interface.
//
// An Archive starts empty and becomes queryable after exactly one successful
// open() or create(). A failed call leaves it empty; any call after success
// fails with AlreadyOpen and leaves the loaded directory untouched.
class Archive {
public:
  enum class State { Empty, Loaded, Written };

  Archive();
  ~Archive();

  // Delete copy, enable move
  Archive(const Archive &) = delete;
  Archive &operator=(const Archive &) = delete;
  Archive(Archive &&) noexcept;
  Archive &operator=(Archive &&) noexcept;

  // Parse an existing archive
  bool open(const std::filesystem::path &path, Error *outError = nullptr);

  // Write a new archive, one entry per source in the given order. Entry names
  // are the source paths, lowercased with '/' turned into '\'.
  bool create(const std::filesystem::path &destPath,
              std::span<const std::filesystem::path> sources, Error *outError = nullptr);

  bool create(const std::filesystem::path &destPath, std::span<const SourceFile> sources,
              Error *outError = nullptr);

  // Whether an entry with this name exists ('/' is accepted for '\').
  // std::nullopt with NotOpen if nothing is loaded
  std::optional<bool> exists(std::string_view name, Error *outError = nullptr) const;

  // All entries in directory order
  std::optional<std::span<const FileEntry>> files(Error *outError = nullptr) const;

  // nullptr if not loaded or not found
  const FileEntry *findFile(std::string_view name) const;

  // Read one entry's data by name
  std::optional<std::vector<uint8_t>> extractToMemory(std::string_view name,
                                                      Error *outError = nullptr) const;

  // Write one entry's data to destPath; the parent directory must exist
  bool extract(std::string_view name, const std::filesystem::path &destPath,
               Error *outError = nullptr) const;

  size_t fileCount() const;

  State state() const;

  bool isOpen() const { return reader_ != nullptr; }

  // Path of the backing archive file, empty while not open
  std::filesystem::path path() const;

private:
  bool checkOpen(Error *outError) const;
  bool checkNotOpen(Error *outError) const;
  const FileEntry *lookup(std::string_view name, Error *outError) const;

  template <typename Source>
  bool createFrom(const std::filesystem::path &destPath, std::span<const Source> sources,
                  Error *outError);

  std::unique_ptr<Reader> reader_; // Set once open() or create() succeeds
  bool written_ = false;
};

} // namespace bsa
