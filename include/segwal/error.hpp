#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>

namespace segwal {

enum class ErrorKind : uint8_t {
  Io,
  MalformedSegmentName,
  SegmentNotFound,
  CorruptedChunk,
  OutOfRange,
  InvariantViolation, // фатально: сегмент больше не принимает записи
  InvalidArgument
};

const char* error_kind_name(ErrorKind k) noexcept;

class WalError : public std::runtime_error {
public:
  WalError(ErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

// Ошибка файловой системы; code(): errno исходного вызова
class IoError : public WalError {
public:
  IoError(const std::string& op, const std::string& path, int err);
  IoError(const std::string& op, const std::string& path, std::error_code ec);

  const std::error_code& code() const noexcept { return code_; }
  const std::string& path() const noexcept { return path_; }

private:
  std::error_code code_;
  std::string path_;
};

class SegmentNameError : public WalError {
public:
  explicit SegmentNameError(const std::string& name)
    : WalError(ErrorKind::MalformedSegmentName, "malformed segment file name: " + name) {}
};

class SegmentNotFoundError : public WalError {
public:
  explicit SegmentNotFoundError(uint32_t id)
    : WalError(ErrorKind::SegmentNotFound,
               "segment file not found: id=" + std::to_string(id)) {}
};

class CorruptedChunkError : public WalError {
public:
  explicit CorruptedChunkError(const std::string& what)
    : WalError(ErrorKind::CorruptedChunk, what) {}
};

class OutOfRangeError : public WalError {
public:
  explicit OutOfRangeError(const std::string& what)
    : WalError(ErrorKind::OutOfRange, what) {}
};

class InvariantViolationError : public WalError {
public:
  explicit InvariantViolationError(const std::string& what)
    : WalError(ErrorKind::InvariantViolation, what) {}
};

class InvalidArgumentError : public WalError {
public:
  explicit InvalidArgumentError(const std::string& what)
    : WalError(ErrorKind::InvalidArgument, what) {}
};

} // namespace segwal
