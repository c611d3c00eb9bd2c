#include "internal/pool/connection_pool.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "internal/store/memory/memory_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;

using redis_ipc::pool::ConnectionPool;
using redis_ipc::pool::PoolOptions;
using redis_ipc::store::memory::MemoryStore;
using redis_ipc::util::ManualClock;

std::shared_ptr<ConnectionPool> MakePool(const std::shared_ptr<MemoryStore>& store, std::size_t max_connections,
                                         std::chrono::milliseconds acquire_timeout, std::shared_ptr<ManualClock> clock) {
  PoolOptions options;
  options.max_connections = max_connections;
  options.acquire_timeout = acquire_timeout;
  return std::make_shared<ConnectionPool>(store, options, std::move(clock));
}

void TestConnectionsAreReused() {
  auto clock = std::make_shared<ManualClock>();
  auto store = std::make_shared<MemoryStore>(clock);
  auto pool  = MakePool(store, 2, 100ms, clock);

  {
    auto conn = pool->Acquire();
    conn->Ping();
    assert(pool->Stats().in_use == 1);
  }
  {
    auto conn = pool->Acquire();
    conn->Ping();
  }

  assert(store->ConnectionsOpened() == 1);
  assert(pool->Stats().idle == 1);
  assert(pool->Stats().in_use == 0);
}

void TestExhaustedPoolThrowsAfterAcquireTimeout() {
  auto clock = std::make_shared<ManualClock>();
  auto store = std::make_shared<MemoryStore>(clock);
  auto pool  = MakePool(store, 1, 250ms, clock);

  auto held   = pool->Acquire();
  auto before = clock->Now();

  bool threw = false;
  try {
    (void)pool->Acquire();
  } catch (const redis_ipc::util::PoolExhausted&) {
    threw = true;
  }
  assert(threw);
  assert(clock->Now() - before >= 250ms);

  held.reset();
  auto again = pool->Acquire();
  assert(again);
}

void TestReleasedOnException() {
  auto clock = std::make_shared<ManualClock>();
  auto store = std::make_shared<MemoryStore>(clock);
  auto pool  = MakePool(store, 1, 0ms, clock);

  try {
    auto conn = pool->Acquire();
    throw std::runtime_error("caller failure");
  } catch (const std::runtime_error&) {
  }

  auto conn = pool->Acquire();
  assert(conn);
  assert(store->ConnectionsOpened() == 1);
}

void TestBrokenConnectionsAreReplaced() {
  auto clock = std::make_shared<ManualClock>();
  auto store = std::make_shared<MemoryStore>(clock);
  auto pool  = MakePool(store, 1, 0ms, clock);

  {
    auto conn = pool->Acquire();
    conn->Ping();
  }
  // idle connection goes bad: dropped on acquire
  store->BreakOpenConnections();
  {
    auto conn = pool->Acquire();
    assert(conn->IsHealthy());
    conn->Ping();
  }
  assert(store->ConnectionsOpened() == 2);

  // in-use connection goes bad: dropped on release
  {
    auto conn = pool->Acquire();
    store->BreakOpenConnections();
  }
  assert(pool->Stats().live == 0);

  auto conn = pool->Acquire();
  conn->Ping();
  assert(store->ConnectionsOpened() == 3);
}

void TestConnectFailureFreesTheSlot() {
  auto clock = std::make_shared<ManualClock>();
  auto store = std::make_shared<MemoryStore>(clock);
  auto pool  = MakePool(store, 1, 0ms, clock);

  store->RefuseConnections(true);
  bool threw = false;
  try {
    (void)pool->Acquire();
  } catch (const redis_ipc::util::StoreError&) {
    threw = true;
  }
  assert(threw);
  assert(pool->Stats().live == 0);

  store->RefuseConnections(false);
  auto conn = pool->Acquire();
  conn->Ping();
}

void TestWaiterGetsReleasedConnection() {
  auto store = std::make_shared<MemoryStore>();
  PoolOptions options;
  options.max_connections = 1;
  options.acquire_timeout = 5000ms;
  auto pool               = std::make_shared<ConnectionPool>(store, options);

  auto        held = pool->Acquire();
  std::thread releaser([&] {
    std::this_thread::sleep_for(20ms);
    held.reset();
  });

  auto conn = pool->Acquire();
  releaser.join();
  conn->Ping();
  assert(store->ConnectionsOpened() == 1);
}

void TestHandleOutlivingPool() {
  auto clock = std::make_shared<ManualClock>();
  auto store = std::make_shared<MemoryStore>(clock);
  auto pool  = MakePool(store, 1, 0ms, clock);

  auto conn = pool->Acquire();
  pool.reset();
  conn->Ping();
  conn.reset();
}

} // namespace

int main() {
  TestConnectionsAreReused();
  TestExhaustedPoolThrowsAfterAcquireTimeout();
  TestReleasedOnException();
  TestBrokenConnectionsAreReplaced();
  TestConnectFailureFreesTheSlot();
  TestWaiterGetsReleasedConnection();
  TestHandleOutlivingPool();

  std::cout << "redis_ipc_unit_connection_pool: pass\n";
  return 0;
}
