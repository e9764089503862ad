#include "segwal/error.hpp"

namespace segwal {

const char* error_kind_name(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::Io:                   return "io";
    case ErrorKind::MalformedSegmentName: return "malformed-segment-name";
    case ErrorKind::SegmentNotFound:      return "segment-not-found";
    case ErrorKind::CorruptedChunk:       return "corrupted-chunk";
    case ErrorKind::OutOfRange:           return "out-of-range";
    case ErrorKind::InvariantViolation:   return "invariant-violation";
    case ErrorKind::InvalidArgument:      return "invalid-argument";
  }
  return "unknown";
}

IoError::IoError(const std::string& op, const std::string& path, int err)
  : IoError(op, path, std::error_code(err, std::generic_category())) {}

IoError::IoError(const std::string& op, const std::string& path, std::error_code ec)
  : WalError(ErrorKind::Io, op + " " + path + ": " + ec.message()),
    code_(ec), path_(path) {}

} // namespace segwal
