#include <bsa/error.hpp>

namespace bsa {

std::string_view errorCodeName(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "None";
  case ErrorCode::NotOpen:
    return "NotOpen";
  case ErrorCode::AlreadyOpen:
    return "AlreadyOpen";
  case ErrorCode::FileTooSmall:
    return "FileTooSmall";
  case ErrorCode::BadHeader:
    return "BadHeader";
  case ErrorCode::DirectorySizeInvalid:
    return "DirectorySizeInvalid";
  case ErrorCode::PositionMismatch:
    return "PositionMismatch";
  case ErrorCode::OffsetOutsideArchive:
    return "OffsetOutsideArchive";
  case ErrorCode::FileNotFound:
    return "FileNotFound";
  case ErrorCode::BytesWrittenMismatch:
    return "BytesWrittenMismatch";
  case ErrorCode::ArchiveTooLarge:
    return "ArchiveTooLarge";
  case ErrorCode::Io:
    return "Io";
  }
  return "Unknown";
}

} // namespace bsa
