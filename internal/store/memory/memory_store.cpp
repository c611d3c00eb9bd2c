#include "internal/store/memory/memory_store.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace redis_ipc::store::memory {

// ------------------------------------------------------------
// MemoryStore
// ------------------------------------------------------------

MemoryStore::MemoryStore(std::shared_ptr<util::Clock> clock) : clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = util::DefaultClock();
  }
}

std::unique_ptr<Connection> MemoryStore::Connect() {
  std::lock_guard lock(mutex_);
  if (refuse_connections_) {
    throw util::StoreError("memory store: connection refused");
  }
  ++connections_opened_;
  return std::make_unique<MemoryConnection>(shared_from_this(), generation_);
}

std::string MemoryStore::Describe() const {
  return "memory://local";
}

void MemoryStore::FailNextCommands(std::size_t count) {
  std::lock_guard lock(mutex_);
  fail_next_commands_ = count;
}

void MemoryStore::RefuseConnections(bool refuse) {
  std::lock_guard lock(mutex_);
  refuse_connections_ = refuse;
}

void MemoryStore::BreakOpenConnections() {
  std::lock_guard lock(mutex_);
  ++generation_;
}

std::size_t MemoryStore::ConnectionsOpened() const {
  std::lock_guard lock(mutex_);
  return connections_opened_;
}

std::size_t MemoryStore::CommandsExecuted() const {
  std::lock_guard lock(mutex_);
  return commands_executed_;
}

void MemoryStore::BeginCommand() {
  ++commands_executed_;
  if (fail_next_commands_ > 0) {
    --fail_next_commands_;
    throw util::StoreError("memory store: injected command failure");
  }
}

void MemoryStore::PurgeIfExpired(const std::string& key) {
  auto it = values_.find(key);
  if (it != values_.end() && it->second.expires_at && *it->second.expires_at <= clock_->Now()) {
    values_.erase(it);
  }
}

void MemoryStore::SweepExpired() {
  const auto now = clock_->Now();
  if (!earliest_expiry_ || *earliest_expiry_ > now) {
    return;
  }

  earliest_expiry_.reset();
  for (auto it = values_.begin(); it != values_.end();) {
    if (it->second.expires_at && *it->second.expires_at <= now) {
      it = values_.erase(it);
      continue;
    }
    if (it->second.expires_at && (!earliest_expiry_ || *it->second.expires_at < *earliest_expiry_)) {
      earliest_expiry_ = it->second.expires_at;
    }
    ++it;
  }
}

std::size_t MemoryStore::KeyCount() const {
  std::lock_guard lock(mutex_);
  return values_.size() + lists_.size() + streams_.size();
}

bool MemoryStore::HasKey(const std::string& key) const {
  return values_.count(key) > 0 || lists_.count(key) > 0 || streams_.count(key) > 0;
}

void MemoryStore::CheckType(const std::string& key, Kind expected) const {
  const bool conflict = (expected != Kind::kValue && values_.count(key) > 0) ||
                        (expected != Kind::kList && lists_.count(key) > 0) ||
                        (expected != Kind::kStream && streams_.count(key) > 0);
  if (conflict) {
    throw util::StoreError("WRONGTYPE Operation against a key holding the wrong kind of value: " + key);
  }
}

StreamId MemoryStore::NextStreamId(const Stream& stream) const {
  const uint64_t now_ms = clock_->UnixMillis();
  if (now_ms > stream.last_id.ms) {
    return StreamId{now_ms, 0};
  }
  return StreamId{stream.last_id.ms, stream.last_id.seq + 1};
}

// ------------------------------------------------------------
// MemoryConnection
// ------------------------------------------------------------

MemoryConnection::MemoryConnection(std::shared_ptr<MemoryStore> store, uint64_t generation)
    : store_(std::move(store)),
      generation_(generation) {
}

bool MemoryConnection::IsHealthy() const {
  std::lock_guard lock(store_->mutex_);
  return generation_ == store_->generation_;
}

// Caller holds store_->mutex_.
void MemoryConnection::BeginCommand() {
  if (generation_ != store_->generation_) {
    throw util::StoreError("memory store: connection is broken");
  }
  store_->BeginCommand();
}

void MemoryConnection::Ping() {
  std::lock_guard lock(store_->mutex_);
  BeginCommand();
}

std::optional<std::string> MemoryConnection::Get(const std::string& key) {
  std::lock_guard lock(store_->mutex_);
  BeginCommand();
  store_->PurgeIfExpired(key);
  store_->CheckType(key, MemoryStore::Kind::kValue);

  auto it = store_->values_.find(key);
  if (it == store_->values_.end()) {
    return std::nullopt;
  }
  return it->second.data;
}

void MemoryConnection::Set(const std::string& key, const std::string& value, std::optional<std::chrono::milliseconds> ttl) {
  std::lock_guard lock(store_->mutex_);
  BeginCommand();
  if (ttl && ttl->count() <= 0) {
    throw util::StoreError("ERR invalid expire time in 'set' command");
  }
  store_->SweepExpired();

  // SET overwrites keys of any kind
  store_->lists_.erase(key);
  store_->streams_.erase(key);

  MemoryStore::Value stored;
  stored.data = value;
  if (ttl) {
    stored.expires_at = store_->clock_->Now() + *ttl;
    if (!store_->earliest_expiry_ || *stored.expires_at < *store_->earliest_expiry_) {
      store_->earliest_expiry_ = stored.expires_at;
    }
  }
  store_->values_[key] = std::move(stored);
}

bool MemoryConnection::Delete(const std::string& key) {
  std::lock_guard lock(store_->mutex_);
  BeginCommand();
  store_->PurgeIfExpired(key);
  const auto removed = store_->values_.erase(key) + store_->lists_.erase(key) + store_->streams_.erase(key);
  return removed > 0;
}

bool MemoryConnection::Exists(const std::string& key) {
  std::lock_guard lock(store_->mutex_);
  BeginCommand();
  store_->PurgeIfExpired(key);
  return store_->HasKey(key);
}

void MemoryConnection::PushTail(const std::string& key, const std::string& value) {
  {
    std::lock_guard lock(store_->mutex_);
    BeginCommand();
    store_->PurgeIfExpired(key);
    store_->CheckType(key, MemoryStore::Kind::kList);
    store_->lists_[key].push_back(value);
  }
  store_->changed_.notify_all();
}

void MemoryConnection::PushHead(const std::string& key, const std::vector<std::string>& values) {
  if (values.empty()) {
    return;
  }
  {
    std::lock_guard lock(store_->mutex_);
    BeginCommand();
    store_->PurgeIfExpired(key);
    store_->CheckType(key, MemoryStore::Kind::kList);
    auto& list = store_->lists_[key];
    list.insert(list.begin(), values.begin(), values.end());
  }
  store_->changed_.notify_all();
}

std::optional<std::string> MemoryConnection::PopHeadLocked(const std::string& key) {
  auto it = store_->lists_.find(key);
  if (it == store_->lists_.end() || it->second.empty()) {
    return std::nullopt;
  }
  std::string value = std::move(it->second.front());
  it->second.pop_front();
  if (it->second.empty()) {
    store_->lists_.erase(it);
  }
  return value;
}

std::optional<std::string> MemoryConnection::PopHead(const std::string& key) {
  std::lock_guard lock(store_->mutex_);
  BeginCommand();
  store_->PurgeIfExpired(key);
  store_->CheckType(key, MemoryStore::Kind::kList);
  return PopHeadLocked(key);
}

std::optional<std::string> MemoryConnection::PopHeadBlocking(const std::string& key, std::chrono::milliseconds timeout) {
  std::unique_lock lock(store_->mutex_);
  BeginCommand();
  store_->PurgeIfExpired(key);
  store_->CheckType(key, MemoryStore::Kind::kList);

  std::optional<std::string> popped;
  store_->clock_->WaitFor(store_->changed_, lock, timeout, [&] {
    popped = PopHeadLocked(key);
    return popped.has_value();
  });
  return popped;
}

uint64_t MemoryConnection::ListLength(const std::string& key) {
  std::lock_guard lock(store_->mutex_);
  BeginCommand();
  store_->PurgeIfExpired(key);
  store_->CheckType(key, MemoryStore::Kind::kList);
  auto it = store_->lists_.find(key);
  return it == store_->lists_.end() ? 0 : it->second.size();
}

StreamId MemoryConnection::StreamAppend(const std::string& key, const std::string& payload, uint64_t max_len) {
  StreamId id;
  {
    std::lock_guard lock(store_->mutex_);
    BeginCommand();
    store_->PurgeIfExpired(key);
    store_->CheckType(key, MemoryStore::Kind::kStream);

    auto& stream = store_->streams_[key];
    id           = store_->NextStreamId(stream);
    stream.entries.push_back(StreamRecord{id, payload});
    stream.last_id = id;

    if (max_len > 0) {
      while (stream.entries.size() > max_len) {
        stream.entries.pop_front();
      }
    }
  }
  store_->changed_.notify_all();
  return id;
}

std::optional<StreamRecord> MemoryConnection::FirstAfterLocked(const std::string& key, const StreamId& after) {
  auto it = store_->streams_.find(key);
  if (it == store_->streams_.end()) {
    return std::nullopt;
  }
  const auto& entries = it->second.entries;
  auto        pos     = std::upper_bound(entries.begin(), entries.end(), after,
                                         [](const StreamId& id, const StreamRecord& record) { return id < record.id; });
  if (pos == entries.end()) {
    return std::nullopt;
  }
  return *pos;
}

std::vector<StreamRecord> MemoryConnection::StreamRangeAfter(const std::string& key, const StreamId& after, std::size_t count) {
  std::lock_guard lock(store_->mutex_);
  BeginCommand();
  store_->PurgeIfExpired(key);
  store_->CheckType(key, MemoryStore::Kind::kStream);

  std::vector<StreamRecord> result;
  auto                      it = store_->streams_.find(key);
  if (it == store_->streams_.end()) {
    return result;
  }

  const auto& entries = it->second.entries;
  auto        pos     = std::upper_bound(entries.begin(), entries.end(), after,
                                         [](const StreamId& id, const StreamRecord& record) { return id < record.id; });
  for (; pos != entries.end() && result.size() < count; ++pos) {
    result.push_back(*pos);
  }
  return result;
}

std::optional<StreamRecord> MemoryConnection::StreamReadBlocking(const std::string& key, const StreamId& after,
                                                                 std::chrono::milliseconds timeout) {
  std::unique_lock lock(store_->mutex_);
  BeginCommand();
  store_->PurgeIfExpired(key);
  store_->CheckType(key, MemoryStore::Kind::kStream);

  std::optional<StreamRecord> record;
  store_->clock_->WaitFor(store_->changed_, lock, timeout, [&] {
    record = FirstAfterLocked(key, after);
    return record.has_value();
  });
  return record;
}

std::optional<StreamRecord> MemoryConnection::StreamFirst(const std::string& key) {
  std::lock_guard lock(store_->mutex_);
  BeginCommand();
  store_->PurgeIfExpired(key);
  store_->CheckType(key, MemoryStore::Kind::kStream);
  auto it = store_->streams_.find(key);
  if (it == store_->streams_.end() || it->second.entries.empty()) {
    return std::nullopt;
  }
  return it->second.entries.front();
}

std::optional<StreamRecord> MemoryConnection::StreamLast(const std::string& key) {
  std::lock_guard lock(store_->mutex_);
  BeginCommand();
  store_->PurgeIfExpired(key);
  store_->CheckType(key, MemoryStore::Kind::kStream);
  auto it = store_->streams_.find(key);
  if (it == store_->streams_.end() || it->second.entries.empty()) {
    return std::nullopt;
  }
  return it->second.entries.back();
}

uint64_t MemoryConnection::StreamLength(const std::string& key) {
  std::lock_guard lock(store_->mutex_);
  BeginCommand();
  store_->PurgeIfExpired(key);
  store_->CheckType(key, MemoryStore::Kind::kStream);
  auto it = store_->streams_.find(key);
  return it == store_->streams_.end() ? 0 : it->second.entries.size();
}

} // namespace redis_ipc::store::memory
