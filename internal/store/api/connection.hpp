#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/store/api/stream_id.hpp"

namespace redis_ipc::store {

struct StreamRecord {
  StreamId    id;
  std::string payload;
};

/*
  Connection to the remote store.

  This is the complete set of remote capabilities the primitives consume.
  Every call is one round trip (or one atomic command) and throws
  util::StoreError on transport or command failure. Absence is reported with
  std::optional / empty vectors, never with an exception.

  A Connection is used by one thread at a time; the pool hands it out
  exclusively.

  Backends:
    memory → in-process shared state (tests, single process)
    redis  → Boost.Redis client (RESP3 over TCP)
*/
class Connection {
 public:
  virtual ~Connection() = default;

  // False once the connection can no longer be used (broken transport).
  virtual bool IsHealthy() const = 0;

  virtual void Ping() = 0;

  // ---------------------------------------------------------------------
  // Keys
  // ---------------------------------------------------------------------

  virtual std::optional<std::string> Get(const std::string& key) = 0;

  // Absent ttl means the key does not expire.
  virtual void Set(const std::string& key, const std::string& value, std::optional<std::chrono::milliseconds> ttl) = 0;

  // Returns true if a key was removed.
  virtual bool Delete(const std::string& key) = 0;

  virtual bool Exists(const std::string& key) = 0;

  // ---------------------------------------------------------------------
  // Lists
  // ---------------------------------------------------------------------

  virtual void PushTail(const std::string& key, const std::string& value) = 0;

  // Atomically places `values` in front of the list; values.front() becomes
  // the new head.
  virtual void PushHead(const std::string& key, const std::vector<std::string>& values) = 0;

  virtual std::optional<std::string> PopHead(const std::string& key) = 0;

  // Waits at most `timeout` (> 0) for an element.
  virtual std::optional<std::string> PopHeadBlocking(const std::string& key, std::chrono::milliseconds timeout) = 0;

  virtual uint64_t ListLength(const std::string& key) = 0;

  // ---------------------------------------------------------------------
  // Streams
  // ---------------------------------------------------------------------

  // Appends and, when max_len > 0, trims the oldest entries down to max_len.
  virtual StreamId StreamAppend(const std::string& key, const std::string& payload, uint64_t max_len) = 0;

  // Entries with id strictly greater than `after`, oldest first.
  virtual std::vector<StreamRecord> StreamRangeAfter(const std::string& key, const StreamId& after, std::size_t count) = 0;

  // Waits at most `timeout` (> 0) for the first entry after `after`.
  virtual std::optional<StreamRecord> StreamReadBlocking(const std::string& key, const StreamId& after,
                                                         std::chrono::milliseconds timeout) = 0;

  virtual std::optional<StreamRecord> StreamFirst(const std::string& key) = 0;
  virtual std::optional<StreamRecord> StreamLast(const std::string& key)  = 0;
  virtual uint64_t                    StreamLength(const std::string& key) = 0;
};

/*
  Creates new connections for the pool. Throws util::StoreError when the
  store cannot be reached.
*/
class ConnectionFactory {
 public:
  virtual ~ConnectionFactory() = default;

  virtual std::unique_ptr<Connection> Connect() = 0;

  // Human readable target for logs, e.g. "redis://host:6379/0".
  virtual std::string Describe() const = 0;
};

} // namespace redis_ipc::store
