#include "internal/queue/queue.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/codec/codec.hpp"
#include "internal/poll/blocking_poller.hpp"
#include "internal/pool/connection_pool.hpp"
#include "internal/store/memory/memory_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;

using redis_ipc::codec::StringCodec;
using redis_ipc::poll::BlockingPoller;
using redis_ipc::poll::PollerOptions;
using redis_ipc::pool::ConnectionPool;
using redis_ipc::pool::PoolOptions;
using redis_ipc::queue::QueueOptions;
using redis_ipc::queue::ReadQueue;
using redis_ipc::queue::WriteQueue;
using redis_ipc::store::memory::MemoryStore;
using redis_ipc::util::Clock;
using redis_ipc::util::ManualClock;

struct Harness {
  explicit Harness(std::shared_ptr<Clock> c = std::make_shared<ManualClock>())
      : clock(std::move(c)),
        store(std::make_shared<MemoryStore>(clock)),
        pool(std::make_shared<ConnectionPool>(store, PoolOptions{}, clock)),
        poller(std::make_shared<BlockingPoller>(PollerOptions{}, clock)) {
  }

  WriteQueue<std::string> Writer(const std::string& identity) {
    QueueOptions options;
    options.name     = "jobs";
    options.identity = identity;
    return WriteQueue<std::string>(pool, poller, options, std::make_shared<const StringCodec>());
  }

  ReadQueue<std::string> Reader(const std::string& identity, bool exclude_own = true, std::size_t max_skip = 64) {
    QueueOptions options;
    options.name        = "jobs";
    options.identity    = identity;
    options.exclude_own = exclude_own;
    options.max_skip    = max_skip;
    return ReadQueue<std::string>(pool, poller, options, std::make_shared<const StringCodec>());
  }

  std::shared_ptr<Clock>          clock;
  std::shared_ptr<MemoryStore>    store;
  std::shared_ptr<ConnectionPool> pool;
  std::shared_ptr<BlockingPoller> poller;
};

// Poller clock that checks, on every sleep between two attempts, that no
// pooled connection is checked out.
class PoolAuditClock final : public redis_ipc::util::Clock {
 public:
  explicit PoolAuditClock(std::shared_ptr<ManualClock> base) : base_(std::move(base)) {
  }

  void Watch(const std::shared_ptr<ConnectionPool>& pool) {
    pool_ = pool;
  }

  redis_ipc::util::TimePoint Now() const override {
    return base_->Now();
  }

  uint64_t UnixMillis() const override {
    return base_->UnixMillis();
  }

  void SleepFor(redis_ipc::util::Millis duration) override {
    auto pool = pool_.lock();
    assert(pool);
    assert(pool->Stats().in_use == 0);
    ++sleeps_;
    if (on_sleep) {
      on_sleep(sleeps_);
    }
    base_->SleepFor(duration);
  }

  bool WaitFor(std::condition_variable& cv, std::unique_lock<std::mutex>& lock, redis_ipc::util::Millis budget,
               const std::function<bool()>& ready) override {
    return base_->WaitFor(cv, lock, budget, ready);
  }

  std::size_t Sleeps() const {
    return sleeps_;
  }

  std::function<void(std::size_t)> on_sleep;

 private:
  std::shared_ptr<ManualClock>  base_;
  std::weak_ptr<ConnectionPool> pool_;
  std::size_t                   sleeps_ = 0;
};

void TestJobsScenario() {
  Harness harness;
  auto    producer = harness.Writer("P1");
  auto    consumer = harness.Reader("P2");

  producer.Push("A");
  producer.Push("B");

  assert(consumer.Pop() == std::optional<std::string>("A"));
  assert(consumer.Pop() == std::optional<std::string>("B"));
  assert(!consumer.Pop());
}

void TestOwnItemsAreSkippedAndKeptInOrder() {
  Harness harness;
  auto    self_writer  = harness.Writer("P1");
  auto    other_writer = harness.Writer("P2");
  auto    self_reader  = harness.Reader("P1");

  self_writer.Push("X");
  other_writer.Push("A");
  self_writer.Push("Y");
  other_writer.Push("B");

  assert(self_reader.Pop() == std::optional<std::string>("A"));
  assert(self_reader.Pop() == std::optional<std::string>("B"));
  assert(!self_reader.Pop());
  assert(self_reader.Length() == 2);

  // another consumer still sees the held items, in push order
  auto other_reader = harness.Reader("P3");
  assert(other_reader.Pop() == std::optional<std::string>("X"));
  assert(other_reader.Pop() == std::optional<std::string>("Y"));
}

void TestExclusionCanBeDisabled() {
  Harness harness;
  auto    writer = harness.Writer("P1");
  auto    reader = harness.Reader("P1", false);

  writer.Push("mine");
  assert(reader.Pop() == std::optional<std::string>("mine"));
}

void TestSkipIsBoundedByMaxSkip() {
  Harness harness;
  auto    self_writer  = harness.Writer("P1");
  auto    other_writer = harness.Writer("P2");
  auto    self_reader  = harness.Reader("P1", true, 2);

  self_writer.Push("X1");
  self_writer.Push("X2");
  self_writer.Push("X3");
  other_writer.Push("A");

  // foreign item sits behind more own items than one attempt may hold
  assert(!self_reader.Pop());
  assert(self_reader.Length() == 4);

  auto other_reader = harness.Reader("P3");
  assert(other_reader.Pop() == std::optional<std::string>("X1"));
  assert(other_reader.Pop() == std::optional<std::string>("X2"));
  assert(self_reader.Pop() == std::optional<std::string>("A"));
  assert(self_reader.Length() == 1);
}

void TestHeldItemsAreRestoredWhenDecodeFails() {
  Harness harness;
  auto    self_writer = harness.Writer("P1");
  auto    self_reader = harness.Reader("P1");

  self_writer.Push("X");
  harness.store->Connect()->PushTail("jobs", "\xff\xff");

  bool threw = false;
  try {
    (void)self_reader.Pop();
  } catch (const redis_ipc::util::DecodeError&) {
    threw = true;
  }
  assert(threw);
  // the malformed item is consumed, the held one is back at the head
  assert(self_reader.Length() == 1);

  auto other_reader = harness.Reader("P2");
  assert(other_reader.Pop() == std::optional<std::string>("X"));
  assert(!other_reader.Pop());
}

void TestPopMessageCarriesEnvelope() {
  Harness harness;
  auto    producer = harness.Writer("P1");
  auto    consumer = harness.Reader("P2");

  const auto id = producer.Push("A");
  auto       message = consumer.PopMessage();
  assert(message);
  assert(message->message_id == id);
  assert(message->producer == "P1");
  assert(message->value == "A");
  assert(message->enqueued_at_ms == harness.clock->UnixMillis());
}

void TestPopBlockingTimeoutBounds() {
  for (bool exclude_own : {true, false}) {
    Harness harness;
    auto    consumer = harness.Reader("P2", exclude_own);

    const auto start     = harness.clock->Now();
    bool       timed_out = false;
    try {
      (void)consumer.PopBlocking(300ms);
    } catch (const redis_ipc::util::Timeout&) {
      timed_out = true;
    }
    const auto elapsed = harness.clock->Now() - start;

    assert(timed_out);
    assert(elapsed >= 300ms);
    assert(elapsed <= 300ms + harness.poller->Options().interval);
  }
}

void TestExcludingPopHoldsNoConnectionWhileSleeping() {
  auto base   = std::make_shared<ManualClock>();
  auto audit  = std::make_shared<PoolAuditClock>(base);
  auto store  = std::make_shared<MemoryStore>(base);
  auto pool   = std::make_shared<ConnectionPool>(store, PoolOptions{}, base);
  auto poller = std::make_shared<BlockingPoller>(PollerOptions{}, audit);
  audit->Watch(pool);

  QueueOptions options;
  options.name     = "jobs";
  options.identity = "P1";
  WriteQueue<std::string> own_writer(pool, poller, options, std::make_shared<const StringCodec>());
  ReadQueue<std::string>  own_reader(pool, poller, options, std::make_shared<const StringCodec>());
  options.identity = "P2";
  WriteQueue<std::string> other_writer(pool, poller, options, std::make_shared<const StringCodec>());

  own_writer.Push("mine");

  bool timed_out = false;
  try {
    (void)own_reader.PopBlocking(100ms);
  } catch (const redis_ipc::util::Timeout&) {
    timed_out = true;
  }
  assert(timed_out);
  assert(audit->Sleeps() == 4);
  assert(own_reader.Length() == 1);

  audit->on_sleep = [&](std::size_t n) {
    if (n == 5) {
      other_writer.Push("theirs");
    }
  };
  assert(own_reader.PopBlocking(1s) == "theirs");
  assert(audit->Sleeps() == 5);
  assert(own_reader.Length() == 1);
  assert(pool->Stats().in_use == 0);
}

void TestPopBlockingReceivesLateItem() {
  for (bool exclude_own : {true, false}) {
    Harness harness(redis_ipc::util::DefaultClock());
    auto    producer = harness.Writer("P1");
    auto    consumer = harness.Reader("P2", exclude_own);

    std::thread writer([&] {
      std::this_thread::sleep_for(30ms);
      producer.Push("late");
    });

    auto item = consumer.PopBlocking(5000ms);
    writer.join();
    assert(item == "late");
  }
}

void TestTwoConsumersNeverShareAnItem() {
  Harness harness(redis_ipc::util::DefaultClock());
  auto    producer = harness.Writer("P0");

  constexpr int kItems = 500;
  for (int i = 0; i < kItems; ++i) {
    producer.Push(std::to_string(i));
  }

  std::mutex               mutex;
  std::vector<std::string> received;

  auto drain = [&](const std::string& identity) {
    auto consumer = harness.Reader(identity);
    while (auto item = consumer.Pop()) {
      std::lock_guard lock(mutex);
      received.push_back(*item);
    }
  };

  std::thread first(drain, "C1");
  std::thread second(drain, "C2");
  first.join();
  second.join();

  assert(received.size() == kItems);
  std::set<std::string> unique(received.begin(), received.end());
  assert(unique.size() == kItems);
}

void TestInvalidOptions() {
  Harness harness;

  bool threw = false;
  try {
    (void)harness.Reader("P1", true, 0);
  } catch (const redis_ipc::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  QueueOptions unnamed;
  threw = false;
  try {
    WriteQueue<std::string> queue(harness.pool, harness.poller, unnamed, std::make_shared<const StringCodec>());
  } catch (const redis_ipc::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  // identity is generated when not supplied
  QueueOptions anonymous;
  anonymous.name = "jobs";
  WriteQueue<std::string> queue(harness.pool, harness.poller, anonymous, std::make_shared<const StringCodec>());
  assert(queue.Identity().size() == 36);
}

} // namespace

int main() {
  TestJobsScenario();
  TestOwnItemsAreSkippedAndKeptInOrder();
  TestExclusionCanBeDisabled();
  TestSkipIsBoundedByMaxSkip();
  TestHeldItemsAreRestoredWhenDecodeFails();
  TestPopMessageCarriesEnvelope();
  TestPopBlockingTimeoutBounds();
  TestPopBlockingReceivesLateItem();
  TestExcludingPopHoldsNoConnectionWhileSleeping();
  TestTwoConsumersNeverShareAnItem();
  TestInvalidOptions();

  std::cout << "redis_ipc_unit_queue: pass\n";
  return 0;
}
