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

namespace redis_ipc::queue {

struct QueueOptions {
  std::string name;
  // Tag written on pushed items; generated when empty.
  std::string identity;
  // Default timeout of PopBlocking().
  std::chrono::milliseconds timeout = std::chrono::milliseconds(0);
  // Never hand this identity an item it pushed itself.
  bool exclude_own = true;
  // Own items held aside per pop attempt before reporting the queue empty.
  std::size_t max_skip = 64;
};

struct RawQueueMessage {
  std::string message_id;
  std::string producer;
  uint64_t    enqueued_at_ms = 0;
  std::string content;
};

/*
  RawQueue

  Byte-level FIFO work queue over one store list named after the queue.
  Push appends to the tail, pops remove from the head; each item is handed
  to exactly one popper by the store's atomic pop.

  Self-produced-item exclusion
  ----------------------------
  Every item carries its producer identity. With exclude_own set, a pop
  holds own items aside until it finds a foreign one, the list runs dry or
  max_skip items are held, then pushes the held items back to the head in
  their original order (one atomic LPUSH).

  Known limitations:
  - held items are invisible to other consumers for the duration of a pop;
  - a consumer dying mid-pop loses the items it holds;
  - with more than max_skip own items at the head, foreign items behind
    them stay unreachable for this identity until the head drains.

  Delivery is at most once: a popped item is gone from the store. That
  includes an item that fails to decode: the pop throws DecodeError and the
  item is consumed, while own items held by the same pop are still restored.
  Values the typed layer cannot decode are likewise gone once popped.
*/
class RawQueue {
 public:
  RawQueue(std::shared_ptr<pool::ConnectionPool> pool, std::shared_ptr<poll::BlockingPoller> poller, QueueOptions options);

  // Returns the message id.
  std::string Push(const std::string& content);

  std::optional<RawQueueMessage> Pop();
  RawQueueMessage                PopBlocking(std::chrono::milliseconds timeout);

  uint64_t Length();

  const QueueOptions& Options() const {
    return options_;
  }

  const std::string& Identity() const {
    return options_.identity;
  }

 private:
  std::optional<RawQueueMessage> PopExcludingOwn();
  void                           Restore(pool::ScopedConnection& conn, const std::vector<std::string>& held);
  RawQueueMessage                Decode(const std::string& data) const;

  std::shared_ptr<pool::ConnectionPool> pool_;
  std::shared_ptr<poll::BlockingPoller> poller_;
  QueueOptions                          options_;
};

} // namespace redis_ipc::queue
