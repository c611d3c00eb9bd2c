#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/poll/blocking_poller.hpp"
#include "internal/pool/connection_pool.hpp"

namespace redis_ipc::cache {

struct CacheOptions {
  std::string name;
  // Applied when Set() gets no ttl; absent means entries never expire.
  std::optional<std::chrono::milliseconds> ttl;
  // Default timeout of GetBlocking().
  std::chrono::milliseconds timeout = std::chrono::milliseconds(0);
};

struct RawCacheElement {
  std::string content;
  uint64_t    written_at_ms = 0;
};

/*
  RawCache

  Byte-level named cache. Entries live under "<name>:<key>" wrapped in a
  CacheEnvelope; expiry is left to the store. Every call is one round trip
  on a pooled connection.
*/
class RawCache {
 public:
  RawCache(std::shared_ptr<pool::ConnectionPool> pool, std::shared_ptr<poll::BlockingPoller> poller, CacheOptions options);

  // ttl must be positive when given.
  void Set(const std::string& key, const std::string& content, std::optional<std::chrono::milliseconds> ttl = std::nullopt);

  std::optional<RawCacheElement> Get(const std::string& key);
  RawCacheElement                GetBlocking(const std::string& key, std::chrono::milliseconds timeout);

  bool Exists(const std::string& key);
  bool Delete(const std::string& key);

  const CacheOptions& Options() const {
    return options_;
  }

  std::string KeyFor(const std::string& key) const;

 private:
  std::shared_ptr<pool::ConnectionPool>  pool_;
  std::shared_ptr<poll::BlockingPoller>  poller_;
  CacheOptions                           options_;
};

} // namespace redis_ipc::cache
