#pragma once

#include <compare>
#include <string>

#include "internal/store/api/stream_id.hpp"

namespace redis_ipc::stream {

/*
  Position inside an event stream: the id of the last entry seen.

  Reads return entries strictly after the cursor. Beginning() sits before
  the first entry ever appended and never expires. Cursors are plain values;
  persist ToString() and Parse() it back to resume after a restart.
*/
class StreamCursor {
 public:
  StreamCursor() = default;
  explicit StreamCursor(store::StreamId id) : id_(id) {
  }

  static StreamCursor Beginning() {
    return StreamCursor();
  }

  // Accepts "beginning" or an entry id "<ms>-<seq>".
  static StreamCursor Parse(const std::string& text) {
    if (text.empty() || text == "beginning") {
      return Beginning();
    }
    return StreamCursor(store::StreamId::Parse(text));
  }

  bool IsBeginning() const {
    return id_.IsZero();
  }

  const store::StreamId& Id() const {
    return id_;
  }

  std::string ToString() const {
    return IsBeginning() ? std::string("beginning") : id_.ToString();
  }

  auto operator<=>(const StreamCursor&) const = default;

 private:
  store::StreamId id_;
};

} // namespace redis_ipc::stream
