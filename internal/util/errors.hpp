#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace redis_ipc::util {

/*
  Central error types.

  Every failure of a store primitive reaches the immediate caller as one of
  these. Absence of data is never an error: it is reported as an empty
  std::optional or an exhausted range.
*/

enum class ErrorKind {
  kTimeout,
  kPoolExhausted,
  kStore,
  kSerialization,
  kDecode,
  kCursorExpired,
  kInvalidArgument,
};

std::string_view ErrorKindName(ErrorKind kind);

class IpcError : public std::runtime_error {
 public:
  IpcError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

// Blocking operation reached its deadline with no data.
class Timeout : public IpcError {
 public:
  explicit Timeout(const std::string& msg) : IpcError(ErrorKind::kTimeout, msg) {
  }
};

// No pooled connection became available within the pool's wait bound.
class PoolExhausted : public IpcError {
 public:
  explicit PoolExhausted(const std::string& msg) : IpcError(ErrorKind::kPoolExhausted, msg) {
  }
};

// Transport failure or remote command failure.
class StoreError : public IpcError {
 public:
  explicit StoreError(const std::string& msg) : IpcError(ErrorKind::kStore, msg) {
  }
};

class SerializationError : public IpcError {
 public:
  explicit SerializationError(const std::string& msg) : IpcError(ErrorKind::kSerialization, msg) {
  }
};

class DecodeError : public IpcError {
 public:
  explicit DecodeError(const std::string& msg) : IpcError(ErrorKind::kDecode, msg) {
  }
};

// Stream cursor points before the retention window; entries were skipped.
class CursorExpired : public IpcError {
 public:
  explicit CursorExpired(const std::string& msg) : IpcError(ErrorKind::kCursorExpired, msg) {
  }
};

class InvalidArgument : public IpcError {
 public:
  explicit InvalidArgument(const std::string& msg) : IpcError(ErrorKind::kInvalidArgument, msg) {
  }
};

} // namespace redis_ipc::util
