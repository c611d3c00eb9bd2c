#include "errors.hpp"

namespace redis_ipc::util {

std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kTimeout:
      return "timeout";
    case ErrorKind::kPoolExhausted:
      return "pool_exhausted";
    case ErrorKind::kStore:
      return "store_error";
    case ErrorKind::kSerialization:
      return "serialization_error";
    case ErrorKind::kDecode:
      return "decode_error";
    case ErrorKind::kCursorExpired:
      return "cursor_expired";
    case ErrorKind::kInvalidArgument:
      return "invalid_argument";
  }
  return "unknown";
}

} // namespace redis_ipc::util
