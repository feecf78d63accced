#include <cerrno>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <bsa/mmap.hpp>

namespace bsa {

namespace {

std::string errnoText() {
  return std::format("{} (errno: {})", std::strerror(errno), errno);
}

} // namespace

MappedFile::~MappedFile() {
  close();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    : fd_(other.fd_), data_(other.data_), size_(other.size_), writable_(other.writable_) {
  other.fd_ = -1;
  other.data_ = nullptr;
  other.size_ = 0;
  other.writable_ = false;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    close();

    fd_ = other.fd_;
    data_ = other.data_;
    size_ = other.size_;
    writable_ = other.writable_;
    other.fd_ = -1;
    other.data_ = nullptr;
    other.size_ = 0;
    other.writable_ = false;
  }
  return *this;
}

bool MappedFile::openRead(const std::filesystem::path &path, Error *outError) {
  close();

  fd_ = ::open(path.c_str(), O_RDONLY);
  if (fd_ < 0) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Failed to open file for reading: {}: {}", path.string(),
                                 errnoText()));
    return false;
  }

  struct stat st;
  if (::fstat(fd_, &st) < 0) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Failed to get file size: {}: {}", path.string(), errnoText()));
    close();
    return false;
  }

  size_ = static_cast<size_t>(st.st_size);
  writable_ = false;

  // mmap rejects zero-length mappings; the caller still sees a valid, empty view
  if (size_ == 0) {
    return true;
  }

  return map(PROT_READ, MAP_PRIVATE, path, outError);
}

bool MappedFile::openWrite(const std::filesystem::path &path, size_t size, Error *outError) {
  close();

  if (size == 0) {
    detail::setError(outError, ErrorCode::Io, "Cannot create file mapping with zero size");
    return false;
  }

  fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
  if (fd_ < 0) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Failed to create file for writing: {}: {}", path.string(),
                                 errnoText()));
    return false;
  }

  if (::ftruncate(fd_, static_cast<off_t>(size)) < 0) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Failed to set file size: {}: {}", path.string(), errnoText()));
    close();
    return false;
  }

  size_ = size;
  writable_ = true;
  return map(PROT_READ | PROT_WRITE, MAP_SHARED, path, outError);
}

bool MappedFile::map(int prot, int flags, const std::filesystem::path &path, Error *outError) {
  void *mapped = ::mmap(nullptr, size_, prot, flags, fd_, 0);
  if (mapped == MAP_FAILED) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Failed to map file: {}: {}", path.string(), errnoText()));
    close();
    return false;
  }
  data_ = mapped;
  return true;
}

bool MappedFile::flush(Error *outError) {
  if (!data_ || !writable_) {
    detail::setError(outError, ErrorCode::Io, "Cannot flush: file not open or not writable");
    return false;
  }

  if (::msync(data_, size_, MS_SYNC) < 0) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Failed to sync mapped file: {}", errnoText()));
    return false;
  }

  return true;
}

void MappedFile::close() noexcept {
  if (data_) {
    ::munmap(data_, size_);
    data_ = nullptr;
  }

  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }

  size_ = 0;
  writable_ = false;
}

} // namespace bsa
