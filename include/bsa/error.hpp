#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace bsa {

enum class ErrorCode {
  None,
  NotOpen,              // Query on an archive that was never opened or created
  AlreadyOpen,          // Second open/create on the same archive instance
  FileTooSmall,         // Archive shorter than the 12-byte header
  BadHeader,            // Magic does not match
  DirectorySizeInvalid, // Directory claims more bytes than the archive holds
  PositionMismatch,     // Directory did not end where the header said it would
  OffsetOutsideArchive, // Entry data runs past the end of the archive
  FileNotFound,         // No entry with the requested name
  BytesWrittenMismatch, // Section or source file size differs from the layout
  ArchiveTooLarge,      // Sizes or offsets do not fit the 32-bit format fields
  Io,                   // Underlying open/read/write/seek/stat/mmap failure
};

// Error reported through the optional outError parameter of fallible calls
struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;
  std::string name;      // FileNotFound: requested entry name
  uint64_t expected = 0; // PositionMismatch, BytesWrittenMismatch
  uint64_t actual = 0;   // PositionMismatch, BytesWrittenMismatch, FileTooSmall (archive size)

  explicit operator bool() const { return code != ErrorCode::None; }
};

std::string_view errorCodeName(ErrorCode code);

namespace detail {

inline void setError(Error *outError, ErrorCode code, std::string message) {
  if (outError) {
    outError->code = code;
    outError->message = std::move(message);
    outError->name.clear();
    outError->expected = 0;
    outError->actual = 0;
  }
}

inline void setSizeError(Error *outError, ErrorCode code, std::string message, uint64_t expected,
                         uint64_t actual) {
  setError(outError, code, std::move(message));
  if (outError) {
    outError->expected = expected;
    outError->actual = actual;
  }
}

} // namespace detail

} // namespace bsa
