#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/store/api/connection.hpp"
#include "internal/util/time.hpp"

namespace redis_ipc::store::memory {

class MemoryConnection;

/*
  MemoryStore

  In-process store with the semantics the primitives rely on from Redis:

  - one keyspace shared by values, lists and streams (WRONGTYPE on mismatch)
  - key expiry evaluated against the injected clock, on access and by a
    sweep on every write once a deadline has passed
  - atomic pop / atomic append+trim (single mutex over all state)
  - blocking list pops and stream reads woken by writers

  Every Connect() returns a new connection sharing the same state, so
  several pools, threads or simulated processes can talk to one store.
*/
class MemoryStore final : public ConnectionFactory, public std::enable_shared_from_this<MemoryStore> {
 public:
  explicit MemoryStore(std::shared_ptr<util::Clock> clock = util::DefaultClock());

  std::unique_ptr<Connection> Connect() override;
  std::string                 Describe() const override;

  // ---------------------------------------------------------------------
  // Fault injection
  // ---------------------------------------------------------------------

  // The next `count` commands on any connection fail with StoreError.
  void FailNextCommands(std::size_t count);

  // Connect() fails with StoreError while refusing.
  void RefuseConnections(bool refuse);

  // Marks every connection opened so far as unhealthy.
  void BreakOpenConnections();

  std::size_t ConnectionsOpened() const;
  std::size_t CommandsExecuted() const;

  // Values, lists and streams currently held, expired values included until
  // they are purged.
  std::size_t KeyCount() const;

 private:
  friend class MemoryConnection;

  struct Value {
    std::string                    data;
    std::optional<util::TimePoint> expires_at;
  };

  struct Stream {
    std::deque<StreamRecord> entries;
    StreamId                 last_id;
  };

  enum class Kind { kValue, kList, kStream };

  // All helpers below expect mutex_ to be held.
  void BeginCommand();
  void PurgeIfExpired(const std::string& key);
  // Drops every expired value once the earliest deadline has passed.
  void SweepExpired();
  void CheckType(const std::string& key, Kind expected) const;
  bool HasKey(const std::string& key) const;
  StreamId NextStreamId(const Stream& stream) const;

  std::shared_ptr<util::Clock> clock_;

  mutable std::mutex      mutex_;
  std::condition_variable changed_;

  std::unordered_map<std::string, Value>                   values_;
  std::unordered_map<std::string, std::deque<std::string>> lists_;
  std::unordered_map<std::string, Stream>                  streams_;
  std::optional<util::TimePoint>                           earliest_expiry_;

  std::size_t fail_next_commands_ = 0;
  bool        refuse_connections_ = false;
  uint64_t    generation_         = 0;
  std::size_t connections_opened_ = 0;
  std::size_t commands_executed_  = 0;
};

class MemoryConnection final : public Connection {
 public:
  MemoryConnection(std::shared_ptr<MemoryStore> store, uint64_t generation);

  bool IsHealthy() const override;
  void Ping() override;

  std::optional<std::string> Get(const std::string& key) override;
  void Set(const std::string& key, const std::string& value, std::optional<std::chrono::milliseconds> ttl) override;
  bool Delete(const std::string& key) override;
  bool Exists(const std::string& key) override;

  void                       PushTail(const std::string& key, const std::string& value) override;
  void                       PushHead(const std::string& key, const std::vector<std::string>& values) override;
  std::optional<std::string> PopHead(const std::string& key) override;
  std::optional<std::string> PopHeadBlocking(const std::string& key, std::chrono::milliseconds timeout) override;
  uint64_t                   ListLength(const std::string& key) override;

  StreamId                    StreamAppend(const std::string& key, const std::string& payload, uint64_t max_len) override;
  std::vector<StreamRecord>   StreamRangeAfter(const std::string& key, const StreamId& after, std::size_t count) override;
  std::optional<StreamRecord> StreamReadBlocking(const std::string& key, const StreamId& after,
                                                 std::chrono::milliseconds timeout) override;
  std::optional<StreamRecord> StreamFirst(const std::string& key) override;
  std::optional<StreamRecord> StreamLast(const std::string& key) override;
  uint64_t                    StreamLength(const std::string& key) override;

 private:
  void                        BeginCommand();
  std::optional<std::string>  PopHeadLocked(const std::string& key);
  std::optional<StreamRecord> FirstAfterLocked(const std::string& key, const StreamId& after);

  std::shared_ptr<MemoryStore> store_;
  uint64_t                     generation_;
};

} // namespace redis_ipc::store::memory
