#pragma once

#include <cstdint>
#include <filesystem>
#include <span>

#include "error.hpp"

namespace bsa {

// RAII wrapper for memory-mapped files (POSIX)
// Supports both read-only and read-write modes
class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile();

  // Delete copy, enable move
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  // Open file for reading. An empty file opens with an empty view.
  bool openRead(const std::filesystem::path &path, Error *outError = nullptr);

  // Create (or truncate) a file of exactly `size` bytes for writing
  bool openWrite(const std::filesystem::path &path, size_t size, Error *outError = nullptr);

  std::span<const uint8_t> data() const {
    return std::span<const uint8_t>(static_cast<const uint8_t *>(data_), size_);
  }

  std::span<uint8_t> data() { return std::span<uint8_t>(static_cast<uint8_t *>(data_), size_); }

  // Flush changes to disk (write mode only)
  bool flush(Error *outError = nullptr);

  void close() noexcept;

  bool isOpen() const { return fd_ >= 0; }

  size_t size() const { return size_; }

private:
  bool map(int prot, int flags, const std::filesystem::path &path, Error *outError);

  int fd_ = -1;
  void *data_ = nullptr;
  size_t size_ = 0;
  bool writable_ = false;
};

} // namespace bsa
