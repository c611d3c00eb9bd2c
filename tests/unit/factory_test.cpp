#include "internal/factory.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/store/memory/memory_store.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;

using redis_ipc::codec::StringCodec;
using redis_ipc::config::ConfigLoader;
using redis_ipc::stream::StartPosition;
using redis_ipc::stream::StreamCursor;

constexpr const char* kConfig = R"(store:
  backend: memory
pool:
  max_connections: 3
  acquire_timeout: "0.2s"
polling:
  interval: "0.005s"
  native_block_slice: "0.1s"
caches:
  - name: sessions
    ttl: "2s"
    timeout: "5s"
queues:
  - name: jobs
    identity: worker-1
    timeout: "1s"
    exclude_own: false
    max_skip: 4
streams:
  - name: logs
    identity: shipper
    max_size: 2
    timeout: "3s"
    start: latest
    page_size: 10
)";

void TestOptionsFromConfig() {
  const auto config = ConfigLoader::LoadFromYamlString(kConfig);

  const auto pool = redis_ipc::factory::PoolOptionsFor(config);
  assert(pool.max_connections == 3);
  assert(pool.acquire_timeout == 200ms);

  const auto polling = redis_ipc::factory::PollerOptionsFor(config);
  assert(polling.interval == 5ms);
  assert(polling.native_block_slice == 100ms);

  const auto cache = redis_ipc::factory::CacheOptionsFor(config, "sessions");
  assert(cache.name == "sessions");
  assert(cache.ttl == std::optional<std::chrono::milliseconds>(2000ms));
  assert(cache.timeout == 5000ms);

  const auto queue = redis_ipc::factory::QueueOptionsFor(config, "jobs");
  assert(queue.identity == "worker-1");
  assert(queue.timeout == 1000ms);
  assert(!queue.exclude_own);
  assert(queue.max_skip == 4);

  const auto stream = redis_ipc::factory::StreamOptionsFor(config, "logs");
  assert(stream.identity == "shipper");
  assert(stream.max_size == 2);
  assert(stream.timeout == 3000ms);
  assert(stream.start == StartPosition::kLatest);
  assert(stream.page_size == 10);
}

void TestUndeclaredNamesGetDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString(kConfig);

  const auto cache = redis_ipc::factory::CacheOptionsFor(config, "other");
  assert(cache.name == "other");
  assert(!cache.ttl);

  const auto queue = redis_ipc::factory::QueueOptionsFor(config, "other");
  assert(queue.exclude_own);
  assert(queue.max_skip == 64);

  // a configured identity wins over the process default
  assert(redis_ipc::factory::QueueOptionsFor(config, "other", "proc-1").identity == "proc-1");
  assert(redis_ipc::factory::QueueOptionsFor(config, "jobs", "proc-1").identity == "worker-1");
  assert(redis_ipc::factory::StreamOptionsFor(config, "other", "proc-1").identity == "proc-1");
  assert(redis_ipc::factory::StreamOptionsFor(config, "logs", "proc-1").identity == "shipper");

  const auto stream = redis_ipc::factory::StreamOptionsFor(config, "other");
  assert(stream.max_size == 0);
  assert(stream.start == StartPosition::kBeginning);
}

void TestBuildMemoryRuntimeEndToEnd() {
  const auto config  = ConfigLoader::LoadFromYamlString(kConfig);
  auto       runtime = redis_ipc::factory::Build(config);
  auto       strings = std::make_shared<const StringCodec>();

  assert(runtime.store->Describe() == "memory://local");
  assert(runtime.pool->Options().max_connections == 3);

  auto sessions = redis_ipc::factory::MakeCache<std::string>(runtime, "sessions", strings);
  sessions.Set("u1", "tok");
  assert(sessions.Get("u1") == std::optional<std::string>("tok"));

  auto writer = redis_ipc::factory::MakeWriteQueue<std::string>(runtime, "jobs", strings);
  auto reader = redis_ipc::factory::MakeReadQueue<std::string>(runtime, "jobs", strings);
  writer.Push("A");
  // exclude_own is off for "jobs", so the shared identity still sees its item
  assert(reader.Pop() == std::optional<std::string>("A"));

  auto logs = redis_ipc::factory::MakeEventStream<std::string>(runtime, "logs", strings);
  logs.Append("e1");
  logs.Append("e2");
  logs.Append("e3");
  assert(logs.Length() == 2);
  assert(logs.ReadLast()->producer == "shipper");
}

void TestInjectedStoreAndClock() {
  const auto config = ConfigLoader::LoadFromYamlString(kConfig);
  auto       clock  = std::make_shared<redis_ipc::util::ManualClock>();
  auto       store  = std::make_shared<redis_ipc::store::memory::MemoryStore>(clock);

  auto runtime  = redis_ipc::factory::Build(config, store, clock);
  auto sessions = redis_ipc::factory::MakeCache<std::string>(runtime, "sessions", std::make_shared<const StringCodec>());

  sessions.Set("u1", "tok");
  clock->Advance(2001ms);
  assert(!sessions.Get("u1"));
  assert(store->ConnectionsOpened() == 1);
}

void TestRuntimeSharesOneIdentity() {
  const auto config  = ConfigLoader::LoadFromYamlString("store:\n  backend: memory\n");
  auto       clock   = std::make_shared<redis_ipc::util::ManualClock>();
  auto       store   = std::make_shared<redis_ipc::store::memory::MemoryStore>(clock);
  auto       strings = std::make_shared<const StringCodec>();

  auto local = redis_ipc::factory::Build(config, store, clock);
  assert(!local.identity.empty());

  auto writer = redis_ipc::factory::MakeWriteQueue<std::string>(local, "jobs", strings);
  auto reader = redis_ipc::factory::MakeReadQueue<std::string>(local, "jobs", strings);
  assert(writer.Identity() == local.identity);
  assert(reader.Identity() == local.identity);

  writer.Push("mine");
  assert(!reader.Pop());
  assert(writer.Length() == 1);

  // a second runtime on the same store stands for another process
  auto remote = redis_ipc::factory::Build(config, store, clock);
  assert(remote.identity != local.identity);

  auto other = redis_ipc::factory::MakeReadQueue<std::string>(remote, "jobs", strings);
  assert(other.Pop() == std::optional<std::string>("mine"));

  auto logs = redis_ipc::factory::MakeEventStream<std::string>(local, "logs", strings);
  logs.Append("e1");
  assert(logs.ReadLast()->producer == local.identity);
}

void TestRedisStoreIsDescribedWithoutConnecting() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(store:
  host: cache.internal
  port: 6380
  database: 2
)");

  auto store = redis_ipc::factory::BuildStore(config.store(), redis_ipc::util::DefaultClock());
  assert(store->Describe() == "redis://cache.internal:6380/2");

  auto defaults = redis_ipc::factory::BuildStore(redis_ipc::runtime::config::StoreConfig{}, redis_ipc::util::DefaultClock());
  assert(defaults->Describe() == "redis://127.0.0.1:6379/0");
}

} // namespace

int main() {
  TestOptionsFromConfig();
  TestUndeclaredNamesGetDefaults();
  TestBuildMemoryRuntimeEndToEnd();
  TestInjectedStoreAndClock();
  TestRuntimeSharesOneIdentity();
  TestRedisStoreIsDescribedWithoutConnecting();

  std::cout << "redis_ipc_unit_factory: pass\n";
  return 0;
}
