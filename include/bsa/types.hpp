#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "error.hpp"

namespace bsa {

// File entry in the archive directory
struct FileEntry {
  std::string name;    // As stored, backslash-separated
  uint32_t size = 0;   // Declared data size in bytes
  uint64_t offset = 0; // Absolute offset of the data from the start of the archive
};

// Archive header (12 bytes), followed by the directory, filename block and hash table
struct ArchiveHeader {
  static constexpr uint8_t magic[4] = {0x00, 0x01, 0x00, 0x00};
  static constexpr size_t headerSize = 12;

  // Per entry: size/offset pair (8) + filename offset (4)
  static constexpr size_t directoryEntrySize = 12;
  static constexpr size_t hashEntrySize = 8;

  // Conservative lower bound of the bytes one entry occupies, used to reject
  // corrupt file counts before anything is allocated
  static constexpr uint64_t minimumEntrySize = 21;

  uint32_t dirSize = 0;   // Directory + filename block, excluding header and hash table
  uint32_t fileCount = 0;

  // Absolute offset of the first data byte
  uint64_t dataOffset() const {
    return headerSize + static_cast<uint64_t>(dirSize) +
           hashEntrySize * static_cast<uint64_t>(fileCount);
  }
};

// Archive names use backslash separators
inline constexpr char kSeparator = '\\';

} // namespace bsa
