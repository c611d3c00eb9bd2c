#pragma once

#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"

#include "internal/cache/cache.hpp"
#include "internal/codec/codec.hpp"
#include "internal/poll/blocking_poller.hpp"
#include "internal/pool/connection_pool.hpp"
#include "internal/queue/queue.hpp"
#include "internal/store/api/connection.hpp"
#include "internal/stream/event_stream.hpp"
#include "internal/util/time.hpp"

namespace redis_ipc::factory {

/*
  Runtime

  Long-lived objects shared by every structure of a process. Structures
  built from it keep the pool and poller alive on their own, so the Runtime
  itself may go out of scope first.

  `identity` tags the queue items and stream events of this process when the
  configuration names none, so a reader built here never receives what a
  writer built here pushed.
*/
struct Runtime {
  runtime::config::RuntimeConfig            config;
  std::string                               identity;
  std::shared_ptr<util::Clock>              clock;
  std::shared_ptr<store::ConnectionFactory> store;
  std::shared_ptr<pool::ConnectionPool>     pool;
  std::shared_ptr<poll::BlockingPoller>     poller;
};

/*
  Build

  Composition root. The only place that knows the concrete store backends;
  everything else sees store::ConnectionFactory / store::Connection.
*/
Runtime Build(const runtime::config::RuntimeConfig& config);

// Same as above with an externally supplied store and clock (tests, embedding).
Runtime Build(const runtime::config::RuntimeConfig& config, std::shared_ptr<store::ConnectionFactory> store,
              std::shared_ptr<util::Clock> clock);

std::shared_ptr<store::ConnectionFactory> BuildStore(const runtime::config::StoreConfig& config, std::shared_ptr<util::Clock> clock);

pool::PoolOptions   PoolOptionsFor(const runtime::config::RuntimeConfig& config);
poll::PollerOptions PollerOptionsFor(const runtime::config::RuntimeConfig& config);

// Options of a structure declared in the configuration. An undeclared name
// gets defaults; the name itself is always taken from the argument.
// `default_identity` applies when the entry configures no identity.
cache::CacheOptions   CacheOptionsFor(const runtime::config::RuntimeConfig& config, const std::string& name);
queue::QueueOptions   QueueOptionsFor(const runtime::config::RuntimeConfig& config, const std::string& name,
                                      const std::string& default_identity = std::string());
stream::StreamOptions StreamOptionsFor(const runtime::config::RuntimeConfig& config, const std::string& name,
                                       const std::string& default_identity = std::string());

template <typename T>
cache::Cache<T> MakeCache(const Runtime& runtime, const std::string& name, codec::CodecPtr<T> codec) {
  return cache::Cache<T>(runtime.pool, runtime.poller, CacheOptionsFor(runtime.config, name), std::move(codec));
}

template <typename T>
queue::WriteQueue<T> MakeWriteQueue(const Runtime& runtime, const std::string& name, codec::CodecPtr<T> codec) {
  return queue::WriteQueue<T>(runtime.pool, runtime.poller, QueueOptionsFor(runtime.config, name, runtime.identity), std::move(codec));
}

template <typename T>
queue::ReadQueue<T> MakeReadQueue(const Runtime& runtime, const std::string& name, codec::CodecPtr<T> codec) {
  return queue::ReadQueue<T>(runtime.pool, runtime.poller, QueueOptionsFor(runtime.config, name, runtime.identity), std::move(codec));
}

template <typename T>
stream::EventStream<T> MakeEventStream(const Runtime& runtime, const std::string& name, codec::CodecPtr<T> codec) {
  return stream::EventStream<T>(runtime.pool, runtime.poller, StreamOptionsFor(runtime.config, name, runtime.identity), std::move(codec));
}

} // namespace redis_ipc::factory
