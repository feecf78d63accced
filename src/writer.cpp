#include <cstring>
#include <format>
#include <fstream>
#include <limits>

#include <bsa/endian.hpp>
#include <bsa/hash.hpp>
#include <bsa/log.hpp>
#include <bsa/mmap.hpp>
#include <bsa/writer.hpp>

namespace bsa {

namespace {

constexpr uint64_t kMaxField = std::numeric_limits<uint32_t>::max();

bool checkBytesWritten(uint64_t expected, uint64_t actual, std::string_view what,
                       Error *outError) {
  if (expected != actual) {
    detail::setSizeError(outError, ErrorCode::BytesWrittenMismatch,
                         std::format("Expected to write {} bytes but was {} ({})", expected,
                                     actual, what),
                         expected, actual);
    return false;
  }
  return true;
}

} // namespace

bool Writer::addFile(const std::filesystem::path &sourcePath, Error *outError) {
  return addFile(sourcePath, sourcePath.string(), outError);
}

bool Writer::addFile(const std::filesystem::path &sourcePath, std::string_view archiveName,
                     Error *outError) {
  std::error_code ec;
  uint64_t fileSize = std::filesystem::file_size(sourcePath, ec);
  if (ec) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Failed to get file size: {}: {}", sourcePath.string(),
                                 ec.message()));
    return false;
  }

  if (fileSize > kMaxField || dataSize_ + fileSize > kMaxField) {
    detail::setError(outError, ErrorCode::ArchiveTooLarge,
                     std::format("Adding {} ({} bytes) exceeds the 4 GiB archive data limit",
                                 sourcePath.string(), fileSize));
    return false;
  }

  PendingFile pending;
  pending.archiveName = toArchiveName(archiveName);
  pending.sourcePath = sourcePath;
  pending.size = static_cast<uint32_t>(fileSize);
  pending.offset = static_cast<uint32_t>(dataSize_);
  dataSize_ += fileSize;
  pendingFiles_.push_back(std::move(pending));

  return true;
}

bool Writer::write(const std::filesystem::path &destPath, Error *outError) {
  const uint64_t fileCount = pendingFiles_.size();

  // Step 1: Compute the layout
  uint64_t nameBlockSize = 0;
  for (const auto &pending : pendingFiles_) {
    nameBlockSize += pending.archiveName.size() + 1;
  }

  const uint64_t dirSize = ArchiveHeader::directoryEntrySize * fileCount + nameBlockSize;
  if (dirSize > kMaxField || fileCount > kMaxField) {
    detail::setError(outError, ErrorCode::ArchiveTooLarge,
                     std::format("Directory of {} entries ({} bytes) does not fit the format",
                                 fileCount, dirSize));
    return false;
  }

  ArchiveHeader header;
  header.dirSize = static_cast<uint32_t>(dirSize);
  header.fileCount = static_cast<uint32_t>(fileCount);
  const uint64_t dataOffset = header.dataOffset();
  const uint64_t totalSize = dataOffset + dataSize_;

  // Step 2: Create the output file at its final size
  MappedFile outputFile;
  if (!outputFile.openWrite(destPath, totalSize, outError)) {
    return false;
  }

  uint8_t *out = outputFile.data().data();
  size_t pos = 0;

  // Step 3: Header
  std::memcpy(out + pos, ArchiveHeader::magic, sizeof(ArchiveHeader::magic));
  pos += sizeof(ArchiveHeader::magic);
  storeLe32(out + pos, header.dirSize);
  pos += 4;
  storeLe32(out + pos, header.fileCount);
  pos += 4;
  if (!checkBytesWritten(ArchiveHeader::headerSize, pos, "header", outError)) {
    return false;
  }

  // Step 4: Size/offset pairs, offsets relative to the data section
  for (const auto &pending : pendingFiles_) {
    storeLe32(out + pos, pending.size);
    storeLe32(out + pos + 4, pending.offset);
    pos += 8;
  }

  // Step 5: Position of each name within the filename block
  uint32_t nameOffset = 0;
  for (const auto &pending : pendingFiles_) {
    storeLe32(out + pos, nameOffset);
    pos += 4;
    nameOffset += static_cast<uint32_t>(pending.archiveName.size() + 1);
  }
  if (!checkBytesWritten(ArchiveHeader::headerSize + ArchiveHeader::directoryEntrySize * fileCount,
                         pos, "directory", outError)) {
    return false;
  }

  // Step 6: Null-terminated names
  for (const auto &pending : pendingFiles_) {
    std::memcpy(out + pos, pending.archiveName.data(), pending.archiveName.size());
    pos += pending.archiveName.size();
    out[pos++] = '\0';
  }
  if (!checkBytesWritten(ArchiveHeader::headerSize + dirSize, pos, "filename block", outError)) {
    return false;
  }

  // Step 7: Hash table, one hash per null-terminated name
  for (const auto &pending : pendingFiles_) {
    std::string terminated = pending.archiveName;
    terminated.push_back('\0');
    storeLe64(out + pos, nameHash(terminated));
    pos += ArchiveHeader::hashEntrySize;
  }
  if (!checkBytesWritten(dataOffset, pos, "hash table", outError)) {
    return false;
  }

  // Step 8: File data, streamed straight into the mapping
  for (const auto &pending : pendingFiles_) {
    std::ifstream inFile(pending.sourcePath, std::ios::binary | std::ios::ate);
    if (!inFile) {
      detail::setError(outError, ErrorCode::Io,
                       std::format("Failed to open source file: {}", pending.sourcePath.string()));
      return false;
    }

    auto currentSize = static_cast<uint64_t>(inFile.tellg());
    if (!checkBytesWritten(pending.size, currentSize, pending.sourcePath.string(), outError)) {
      return false;
    }

    inFile.seekg(0, std::ios::beg);
    inFile.read(reinterpret_cast<char *>(out + pos), pending.size);
    if (!checkBytesWritten(pending.size, static_cast<uint64_t>(inFile.gcount()),
                           pending.sourcePath.string(), outError)) {
      return false;
    }
    pos += pending.size;
  }
  if (!checkBytesWritten(totalSize, pos, "archive", outError)) {
    return false;
  }

  // Step 9: Flush to disk
  if (!outputFile.flush(outError)) {
    return false;
  }

  entries_.clear();
  entries_.reserve(pendingFiles_.size());
  for (const auto &pending : pendingFiles_) {
    FileEntry entry;
    entry.name = pending.archiveName;
    entry.size = pending.size;
    entry.offset = dataOffset + pending.offset;
    entries_.push_back(std::move(entry));
  }

  BSA_LOG_DEBUG(std::format("Wrote archive {} ({} entries, {} bytes)", destPath.string(),
                            fileCount, totalSize));
  return true;
}

void Writer::clear() {
  pendingFiles_.clear();
  entries_.clear();
  dataSize_ = 0;
}

std::string Writer::toArchiveName(std::string_view path) {
  std::string result;
  result.reserve(path.size());

  for (char c : path) {
    if (c == '/') {
      result += kSeparator;
    } else if (c >= 'A' && c <= 'Z') {
      result += static_cast<char>(c - 'A' + 'a');
    } else {
      result += c;
    }
  }

  return result;
}

} // namespace bsa
