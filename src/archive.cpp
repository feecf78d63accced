#include <format>

#include <bsa/archive.hpp>
#include <bsa/reader.hpp>
#include <bsa/writer.hpp>

namespace bsa {

namespace {

bool addSource(Writer &writer, const std::filesystem::path &source, Error *outError) {
  return writer.addFile(source, outError);
}

bool addSource(Writer &writer, const SourceFile &source, Error *outError) {
  return writer.addFile(source.path, source.archiveName, outError);
}

} // namespace

Archive::Archive() = default;
Archive::~Archive() = default;
Archive::Archive(Archive &&) noexcept = default;
Archive &Archive::operator=(Archive &&) noexcept = default;

bool Archive::open(const std::filesystem::path &path, Error *outError) {
  if (!checkNotOpen(outError)) {
    return false;
  }

  auto reader = Reader::open(path, outError);
  if (!reader) {
    return false;
  }

  reader_ = std::make_unique<Reader>(std::move(*reader));
  return true;
}

bool Archive::create(const std::filesystem::path &destPath,
                     std::span<const std::filesystem::path> sources, Error *outError) {
  return createFrom(destPath, sources, outError);
}

bool Archive::create(const std::filesystem::path &destPath, std::span<const SourceFile> sources,
                     Error *outError) {
  return createFrom(destPath, sources, outError);
}

template <typename Source>
bool Archive::createFrom(const std::filesystem::path &destPath, std::span<const Source> sources,
                         Error *outError) {
  if (!checkNotOpen(outError)) {
    return false;
  }

  Writer writer;
  for (const auto &source : sources) {
    if (!addSource(writer, source, outError)) {
      return false;
    }
  }

  if (!writer.write(destPath, outError)) {
    return false;
  }

  reader_ = std::make_unique<Reader>(Reader::fromEntries(destPath, writer.files()));
  written_ = true;
  return true;
}

std::optional<bool> Archive::exists(std::string_view name, Error *outError) const {
  if (!checkOpen(outError)) {
    return std::nullopt;
  }
  return reader_->findFile(name) != nullptr;
}

std::optional<std::span<const FileEntry>> Archive::files(Error *outError) const {
  if (!checkOpen(outError)) {
    return std::nullopt;
  }
  return std::span<const FileEntry>(reader_->files());
}

const FileEntry *Archive::findFile(std::string_view name) const {
  if (!reader_) {
    return nullptr;
  }
  return reader_->findFile(name);
}

std::optional<std::vector<uint8_t>> Archive::extractToMemory(std::string_view name,
                                                             Error *outError) const {
  const FileEntry *entry = lookup(name, outError);
  if (!entry) {
    return std::nullopt;
  }
  return reader_->extractToMemory(*entry, outError);
}

bool Archive::extract(std::string_view name, const std::filesystem::path &destPath,
                      Error *outError) const {
  const FileEntry *entry = lookup(name, outError);
  if (!entry) {
    return false;
  }
  return reader_->extract(*entry, destPath, outError);
}

Archive::State Archive::state() const {
  if (!reader_) {
    return State::Empty;
  }
  return written_ ? State::Written : State::Loaded;
}

size_t Archive::fileCount() const {
  return reader_ ? reader_->fileCount() : 0;
}

std::filesystem::path Archive::path() const {
  return reader_ ? reader_->path() : std::filesystem::path();
}

bool Archive::checkOpen(Error *outError) const {
  if (!reader_) {
    detail::setError(outError, ErrorCode::NotOpen, "Archive must be open before reading");
    return false;
  }
  return true;
}

bool Archive::checkNotOpen(Error *outError) const {
  if (reader_) {
    detail::setError(outError, ErrorCode::AlreadyOpen,
                     std::format("Archive is already open: {}", reader_->path().string()));
    return false;
  }
  return true;
}

const FileEntry *Archive::lookup(std::string_view name, Error *outError) const {
  if (!checkOpen(outError)) {
    return nullptr;
  }

  const FileEntry *entry = reader_->findFile(name);
  if (!entry) {
    detail::setError(outError, ErrorCode::FileNotFound,
                     std::format("File not found in archive: {}", name));
    if (outError) {
      outError->name = std::string(name);
    }
  }
  return entry;
}

} // namespace bsa
