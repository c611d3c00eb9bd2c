#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "internal/cache/raw_cache.hpp"
#include "internal/codec/codec.hpp"

namespace redis_ipc::cache {

template <typename T>
struct CacheElement {
  T        value;
  uint64_t written_at_ms = 0;
};

/*
  Cache<T>

  Named key-value namespace shared by every process using the same name.
  Values are encoded with the supplied codec; no local copy is kept.

  Get() is non-blocking and returns nullopt for absent or expired keys.
  GetBlocking() polls until the key appears or the timeout elapses
  (util::Timeout).
*/
template <typename T>
class Cache {
 public:
  Cache(std::shared_ptr<pool::ConnectionPool> pool, std::shared_ptr<poll::BlockingPoller> poller, CacheOptions options,
        codec::CodecPtr<T> codec)
      : raw_(std::move(pool), std::move(poller), std::move(options)),
        codec_(std::move(codec)) {
    if (!codec_) {
      throw util::InvalidArgument("cache '" + raw_.Options().name + "' requires a codec");
    }
  }

  void Set(const std::string& key, const T& value) {
    raw_.Set(key, codec_->Encode(value));
  }

  void Set(const std::string& key, const T& value, std::chrono::milliseconds ttl) {
    raw_.Set(key, codec_->Encode(value), ttl);
  }

  std::optional<T> Get(const std::string& key) {
    auto element = raw_.Get(key);
    if (!element) {
      return std::nullopt;
    }
    return codec_->Decode(element->content);
  }

  std::optional<CacheElement<T>> GetElement(const std::string& key) {
    auto element = raw_.Get(key);
    if (!element) {
      return std::nullopt;
    }
    return CacheElement<T>{codec_->Decode(element->content), element->written_at_ms};
  }

  T GetBlocking(const std::string& key) {
    return GetBlocking(key, raw_.Options().timeout);
  }

  T GetBlocking(const std::string& key, std::chrono::milliseconds timeout) {
    return codec_->Decode(raw_.GetBlocking(key, timeout).content);
  }

  bool Exists(const std::string& key) {
    return raw_.Exists(key);
  }

  bool Delete(const std::string& key) {
    return raw_.Delete(key);
  }

  const CacheOptions& Options() const {
    return raw_.Options();
  }

 private:
  RawCache           raw_;
  codec::CodecPtr<T> codec_;
};

} // namespace redis_ipc::cache
