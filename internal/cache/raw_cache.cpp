#include "raw_cache.hpp"

#include "internal/util/errors.hpp"
#include "redis_ipc/v1/envelope.pb.h"

namespace redis_ipc::cache {

RawCache::RawCache(std::shared_ptr<pool::ConnectionPool> pool, std::shared_ptr<poll::BlockingPoller> poller, CacheOptions options)
    : pool_(std::move(pool)),
      poller_(std::move(poller)),
      options_(std::move(options)) {
  if (!pool_ || !poller_) {
    throw util::InvalidArgument("cache requires a connection pool and a poller");
  }
  if (options_.name.empty()) {
    throw util::InvalidArgument("cache name must not be empty");
  }
  if (options_.ttl && options_.ttl->count() <= 0) {
    options_.ttl.reset();
  }
}

std::string RawCache::KeyFor(const std::string& key) const {
  return options_.name + ":" + key;
}

void RawCache::Set(const std::string& key, const std::string& content, std::optional<std::chrono::milliseconds> ttl) {
  if (ttl && ttl->count() <= 0) {
    throw util::InvalidArgument("cache ttl must be positive, got " + std::to_string(ttl->count()) + "ms");
  }

  v1::CacheEnvelope envelope;
  envelope.set_written_at_ms(poller_->clock()->UnixMillis());
  envelope.set_content(content);

  std::string data;
  if (!envelope.SerializeToString(&data)) {
    throw util::SerializationError("failed to serialize cache envelope for " + KeyFor(key));
  }

  auto conn = pool_->Acquire();
  conn->Set(KeyFor(key), data, ttl ? ttl : options_.ttl);
}

std::optional<RawCacheElement> RawCache::Get(const std::string& key) {
  std::optional<std::string> data;
  {
    auto conn = pool_->Acquire();
    data      = conn->Get(KeyFor(key));
  }
  if (!data) {
    return std::nullopt;
  }

  v1::CacheEnvelope envelope;
  if (!envelope.ParseFromString(*data)) {
    throw util::DecodeError("malformed cache entry " + KeyFor(key));
  }
  return RawCacheElement{std::move(*envelope.mutable_content()), envelope.written_at_ms()};
}

RawCacheElement RawCache::GetBlocking(const std::string& key, std::chrono::milliseconds timeout) {
  return poller_->PollUntil(timeout, [&] { return Get(key); });
}

bool RawCache::Exists(const std::string& key) {
  auto conn = pool_->Acquire();
  return conn->Exists(KeyFor(key));
}

bool RawCache::Delete(const std::string& key) {
  auto conn = pool_->Acquire();
  return conn->Delete(KeyFor(key));
}

} // namespace redis_ipc::cache
