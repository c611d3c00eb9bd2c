#include "factory.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/store/memory/memory_store.hpp"
#include "internal/store/redis/redis_connection.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace redis_ipc::factory {

using observability::IntField;
using observability::StringField;
using runtime::config::RuntimeConfig;

namespace {

template <typename Entry>
const Entry* FindByName(const google::protobuf::RepeatedPtrField<Entry>& entries, const std::string& name) {
  for (const auto& entry : entries) {
    if (entry.name() == name) {
      return &entry;
    }
  }
  return nullptr;
}

std::chrono::milliseconds DurationOr(bool present, const google::protobuf::Duration& duration, std::chrono::milliseconds fallback) {
  return present ? util::ToMillis(duration) : fallback;
}

} // namespace

std::shared_ptr<store::ConnectionFactory> BuildStore(const runtime::config::StoreConfig& config, std::shared_ptr<util::Clock> clock) {
  if (config.backend() == "memory") {
    return std::make_shared<store::memory::MemoryStore>(std::move(clock));
  }

  if (!config.backend().empty() && config.backend() != "redis") {
    throw std::runtime_error("Unknown store backend: " + config.backend());
  }

  store::redis::RedisOptions options;
  if (!config.host().empty()) {
    options.host = config.host();
  }
  if (config.port() != 0) {
    options.port = static_cast<uint16_t>(config.port());
  }
  options.password        = config.password();
  options.database        = config.database();
  options.connect_timeout = DurationOr(config.has_connect_timeout(), config.connect_timeout(), options.connect_timeout);
  options.io_timeout      = DurationOr(config.has_io_timeout(), config.io_timeout(), options.io_timeout);
  return std::make_shared<store::redis::RedisConnectionFactory>(std::move(options));
}

pool::PoolOptions PoolOptionsFor(const RuntimeConfig& config) {
  pool::PoolOptions options;
  if (config.pool().max_connections() != 0) {
    options.max_connections = config.pool().max_connections();
  }
  options.acquire_timeout = DurationOr(config.pool().has_acquire_timeout(), config.pool().acquire_timeout(), options.acquire_timeout);
  return options;
}

poll::PollerOptions PollerOptionsFor(const RuntimeConfig& config) {
  poll::PollerOptions options;
  options.interval = DurationOr(config.polling().has_interval(), config.polling().interval(), options.interval);
  options.native_block_slice =
      DurationOr(config.polling().has_native_block_slice(), config.polling().native_block_slice(), options.native_block_slice);
  return options;
}

cache::CacheOptions CacheOptionsFor(const RuntimeConfig& config, const std::string& name) {
  cache::CacheOptions options;
  options.name = name;
  if (const auto* entry = FindByName(config.caches(), name)) {
    if (entry->has_ttl() && util::ToMillis(entry->ttl()).count() > 0) {
      options.ttl = util::ToMillis(entry->ttl());
    }
    options.timeout = DurationOr(entry->has_timeout(), entry->timeout(), options.timeout);
  }
  return options;
}

queue::QueueOptions QueueOptionsFor(const RuntimeConfig& config, const std::string& name, const std::string& default_identity) {
  queue::QueueOptions options;
  options.name     = name;
  options.identity = default_identity;
  if (const auto* entry = FindByName(config.queues(), name)) {
    if (!entry->identity().empty()) {
      options.identity = entry->identity();
    }
    options.timeout  = DurationOr(entry->has_timeout(), entry->timeout(), options.timeout);
    if (entry->has_exclude_own()) {
      options.exclude_own = entry->exclude_own();
    }
    if (entry->max_skip() != 0) {
      options.max_skip = entry->max_skip();
    }
  }
  return options;
}

stream::StreamOptions StreamOptionsFor(const RuntimeConfig& config, const std::string& name, const std::string& default_identity) {
  stream::StreamOptions options;
  options.name     = name;
  options.identity = default_identity;
  if (const auto* entry = FindByName(config.streams(), name)) {
    if (!entry->identity().empty()) {
      options.identity = entry->identity();
    }
    options.max_size = entry->max_size();
    options.timeout  = DurationOr(entry->has_timeout(), entry->timeout(), options.timeout);
    options.start    = entry->start() == "latest" ? stream::StartPosition::kLatest : stream::StartPosition::kBeginning;
    if (entry->page_size() != 0) {
      options.page_size = entry->page_size();
    }
  }
  return options;
}

/*
    Build the shared runtime from configuration
*/
Runtime Build(const RuntimeConfig& config) {
  auto clock = util::DefaultClock();
  auto store = BuildStore(config.store(), clock);
  return Build(config, std::move(store), std::move(clock));
}

Runtime Build(const RuntimeConfig& config, std::shared_ptr<store::ConnectionFactory> store, std::shared_ptr<util::Clock> clock) {
  if (!store) {
    throw util::InvalidArgument("runtime requires a store");
  }

  Runtime runtime;
  runtime.config   = config;
  runtime.identity = util::GenerateUUIDString();
  runtime.clock    = clock ? std::move(clock) : util::DefaultClock();
  runtime.store    = std::move(store);

  const auto pool_options = PoolOptionsFor(config);
  runtime.pool            = std::make_shared<pool::ConnectionPool>(runtime.store, pool_options, runtime.clock);
  runtime.poller          = std::make_shared<poll::BlockingPoller>(PollerOptionsFor(config), runtime.clock);

  REDIS_IPC_LOG_INFO("Runtime ready", {StringField("store", runtime.store->Describe()), StringField("identity", runtime.identity),
                                       IntField("max_connections", static_cast<int64_t>(pool_options.max_connections)),
                                       IntField("caches", config.caches_size()), IntField("queues", config.queues_size()),
                                       IntField("streams", config.streams_size())});
  return runtime;
}

} // namespace redis_ipc::factory
