#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace redis_ipc::store {

/*
  Position of an entry inside a stream, "<unix_ms>-<sequence>".

  Ids are strictly increasing in append order. {0, 0} is never assigned to an
  entry and stands for "before the first entry".
*/
struct StreamId {
  uint64_t ms  = 0;
  uint64_t seq = 0;

  static StreamId Zero() {
    return {};
  }

  // Throws util::InvalidArgument on malformed input.
  static StreamId Parse(const std::string& text);

  std::string ToString() const;

  bool IsZero() const {
    return ms == 0 && seq == 0;
  }

  auto operator<=>(const StreamId&) const = default;
};

} // namespace redis_ipc::store
