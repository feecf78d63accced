#include <algorithm>
#include <cstring>
#include <format>
#include <fstream>

#include <bsa/endian.hpp>
#include <bsa/log.hpp>
#include <bsa/mmap.hpp>
#include <bsa/reader.hpp>

namespace bsa {

std::optional<Reader> Reader::open(const std::filesystem::path &path, Error *outError) {
  MappedFile mappedFile;
  if (!mappedFile.openRead(path, outError)) {
    return std::nullopt;
  }

  Reader reader;
  reader.path_ = path;
  if (!reader.parse(mappedFile.data(), outError)) {
    return std::nullopt;
  }

  BSA_LOG_DEBUG(std::format("Opened archive {} ({} entries, {} bytes)", path.string(),
                            reader.files_.size(), mappedFile.size()));
  return reader;
}

Reader Reader::fromEntries(const std::filesystem::path &path, std::vector<FileEntry> entries) {
  Reader reader;
  reader.path_ = path;
  reader.files_ = std::move(entries);
  reader.buildLookup();
  return reader;
}

bool Reader::parse(std::span<const uint8_t> data, Error *outError) {
  const uint64_t fileSize = data.size();

  if (fileSize < ArchiveHeader::headerSize) {
    detail::setSizeError(outError, ErrorCode::FileTooSmall,
                         std::format("File too small to be a valid archive: {} bytes", fileSize),
                         ArchiveHeader::headerSize, fileSize);
    return false;
  }

  if (std::memcmp(data.data(), ArchiveHeader::magic, sizeof(ArchiveHeader::magic)) != 0) {
    detail::setError(outError, ErrorCode::BadHeader,
                     std::format("Unrecognized archive header ({:02x} {:02x} {:02x} {:02x})",
                                 data[0], data[1], data[2], data[3]));
    return false;
  }

  ArchiveHeader header;
  header.dirSize = loadLe32(data.data() + 4);
  header.fileCount = loadLe32(data.data() + 8);
  size_t pos = ArchiveHeader::headerSize;

  const uint64_t fileCount = header.fileCount;
  const uint64_t dirSize = header.dirSize;
  const uint64_t available = fileSize - ArchiveHeader::headerSize;

  // Every entry takes at least 21 bytes, so a larger count cannot be genuine.
  // Checked before anything is sized from the header.
  if (fileCount * ArchiveHeader::minimumEntrySize > available ||
      dirSize + ArchiveHeader::hashEntrySize * fileCount > available) {
    detail::setError(outError, ErrorCode::DirectorySizeInvalid,
                     std::format("Directory information larger than entire archive "
                                 "(files={}, dirsize={}, archive={} bytes)",
                                 fileCount, dirSize, fileSize));
    return false;
  }

  // Size/offset pairs, then the filename offsets which the name split below makes redundant
  const size_t tableSize = ArchiveHeader::directoryEntrySize * fileCount;
  std::vector<uint32_t> sizesAndOffsets(2 * fileCount);
  for (size_t i = 0; i < sizesAndOffsets.size(); ++i) {
    sizesAndOffsets[i] = loadLe32(data.data() + pos + 4 * i);
  }
  pos += tableSize;

  // A dirsize smaller than the table leaves no filename block; the position
  // check below reports it
  const size_t nameBlockSize = dirSize > tableSize ? dirSize - tableSize : 0;
  std::string_view nameBlock(reinterpret_cast<const char *>(data.data() + pos), nameBlockSize);
  pos += nameBlockSize;

  std::vector<std::string_view> names;
  names.reserve(fileCount);
  size_t start = 0;
  while (names.size() < fileCount && start <= nameBlock.size()) {
    size_t end = nameBlock.find('\0', start);
    if (end == std::string_view::npos) {
      end = nameBlock.size();
    }
    names.push_back(nameBlock.substr(start, end - start));
    start = end + 1;
  }

  const uint64_t expectedPos = ArchiveHeader::headerSize + dirSize;
  if (pos != expectedPos) {
    detail::setSizeError(outError, ErrorCode::PositionMismatch,
                         std::format("Read file position should be {} but was {}", expectedPos,
                                     pos),
                         expectedPos, pos);
    return false;
  }

  if (names.size() < fileCount) {
    detail::setError(outError, ErrorCode::DirectorySizeInvalid,
                     std::format("Filename block holds {} names, expected {}", names.size(),
                                 fileCount));
    return false;
  }

  const uint64_t dataOffset = header.dataOffset();
  files_.reserve(fileCount);

  for (size_t i = 0; i < fileCount; ++i) {
    FileEntry entry;
    entry.size = sizesAndOffsets[2 * i];
    entry.offset = sizesAndOffsets[2 * i + 1] + dataOffset;
    entry.name = std::string(names[i]);

    if (entry.offset + entry.size > fileSize) {
      detail::setError(outError, ErrorCode::OffsetOutsideArchive,
                       std::format("Archive contains offsets outside itself: entry {} '{}' "
                                   "(offset={}, size={}, archive={} bytes)",
                                   i, entry.name, entry.offset, entry.size, fileSize));
      files_.clear();
      return false;
    }

    files_.push_back(std::move(entry));
  }

  buildLookup();
  return true;
}

void Reader::buildLookup() {
  lookup_.clear();
  lookup_.reserve(files_.size());
  for (size_t i = 0; i < files_.size(); ++i) {
    if (!lookup_.insert_or_assign(files_[i].name, i).second) {
      BSA_LOG_WARN(std::format("Duplicate entry name '{}' in {}, using entry {}", files_[i].name,
                               path_.string(), i));
    }
  }
}

const FileEntry *Reader::findFile(std::string_view name) const {
  auto it = lookup_.find(normalizeName(name));
  if (it == lookup_.end()) {
    return nullptr;
  }
  return &files_[it->second];
}

std::optional<std::vector<uint8_t>> Reader::extractToMemory(const FileEntry &entry,
                                                            Error *outError) const {
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Failed to open archive: {}", path_.string()));
    return std::nullopt;
  }

  if (!in.seekg(static_cast<std::streamoff>(entry.offset), std::ios::beg)) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Failed to seek to offset {} in {}", entry.offset,
                                 path_.string()));
    return std::nullopt;
  }

  std::vector<uint8_t> result(entry.size);
  in.read(reinterpret_cast<char *>(result.data()), static_cast<std::streamsize>(result.size()));
  if (static_cast<size_t>(in.gcount()) != result.size()) {
    detail::setSizeError(outError, ErrorCode::Io,
                         std::format("Short read of '{}': expected {} bytes, got {}", entry.name,
                                     result.size(), in.gcount()),
                         result.size(), static_cast<uint64_t>(in.gcount()));
    return std::nullopt;
  }

  return result;
}

bool Reader::extract(const FileEntry &entry, const std::filesystem::path &destPath,
                     Error *outError) const {
  auto data = extractToMemory(entry, outError);
  if (!data) {
    return false;
  }

  std::ofstream out(destPath, std::ios::binary | std::ios::trunc);
  if (!out) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Failed to create output file: {}", destPath.string()));
    return false;
  }

  out.write(reinterpret_cast<const char *>(data->data()),
            static_cast<std::streamsize>(data->size()));
  out.flush();
  if (!out) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Failed to write to output file: {}", destPath.string()));
    return false;
  }

  return true;
}

std::string Reader::normalizeName(std::string_view name) {
  std::string result(name);
  std::replace(result.begin(), result.end(), '/', kSeparator);
  return result;
}

} // namespace bsa
