#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/poll/blocking_poller.hpp"
#include "internal/pool/connection_pool.hpp"
#include "internal/stream/stream_cursor.hpp"

namespace redis_ipc::stream {

enum class StartPosition {
  kBeginning,
  kLatest,
};

struct StreamOptions {
  std::string name;
  // Producer tag written on appended entries; generated when empty.
  std::string identity;
  // Bound applied by Append() without an explicit max_size; 0 = unbounded.
  uint64_t max_size = 0;
  // Default timeout of blocking reads.
  std::chrono::milliseconds timeout = std::chrono::milliseconds(0);
  // Where a StreamReader starts when it has no cursor yet.
  StartPosition start = StartPosition::kBeginning;
  // Entries fetched per round trip while iterating a range.
  std::size_t page_size = 128;
};

struct RawStreamEvent {
  // Resume point: reading after it yields the entries that follow this one.
  StreamCursor cursor;
  std::string  producer;
  uint64_t     appended_at_ms = 0;
  std::string  content;
};

/*
  RawEventStream

  Byte-level bounded append-only log over one store stream.

  Trimming
  --------
  Append() trims the oldest entries so that at most max_size remain. The
  bound passed to an append applies to that append only; when producers
  disagree, the last writer's bound wins.

  Expired cursors
  ---------------
  A cursor older than the oldest retained entry has lost entries to
  trimming. Reads from such a cursor throw util::CursorExpired instead of
  silently skipping ahead. Beginning() is never expired.
*/
class RawEventStream {
 public:
  RawEventStream(std::shared_ptr<pool::ConnectionPool> pool, std::shared_ptr<poll::BlockingPoller> poller, StreamOptions options);

  StreamCursor Append(const std::string& content);
  StreamCursor Append(const std::string& content, uint64_t max_size);

  // Up to `count` entries strictly after `after`, oldest first.
  std::vector<RawStreamEvent> ReadPage(const StreamCursor& after, std::size_t count);

  RawStreamEvent ReadNextBlocking(const StreamCursor& after, std::chrono::milliseconds timeout);

  std::optional<RawStreamEvent> ReadLast();
  uint64_t                      Length();

  // Cursor of the newest entry, Beginning() for an empty stream.
  StreamCursor Tail();

  // Where a new reader starts according to StreamOptions::start.
  StreamCursor StartCursor();

  const StreamOptions& Options() const {
    return options_;
  }

 private:
  RawStreamEvent Decode(const store::StreamRecord& record) const;
  void           CheckNotExpired(store::Connection& conn, const StreamCursor& after) const;

  std::shared_ptr<pool::ConnectionPool> pool_;
  std::shared_ptr<poll::BlockingPoller> poller_;
  StreamOptions                         options_;
};

} // namespace redis_ipc::stream
