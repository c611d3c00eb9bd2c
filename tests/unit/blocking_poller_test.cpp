#include "internal/poll/blocking_poller.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;

using redis_ipc::poll::BlockingPoller;
using redis_ipc::poll::PollerOptions;
using redis_ipc::util::ManualClock;

BlockingPoller MakePoller(const std::shared_ptr<ManualClock>& clock, std::chrono::milliseconds interval,
                          std::chrono::milliseconds slice = 500ms) {
  PollerOptions options;
  options.interval           = interval;
  options.native_block_slice = slice;
  return BlockingPoller(options, clock);
}

void TestReturnsFirstValue() {
  auto clock  = std::make_shared<ManualClock>();
  auto poller = MakePoller(clock, 10ms);

  int  attempts = 0;
  auto value    = poller.PollUntil(1000ms, [&]() -> std::optional<int> {
    ++attempts;
    return attempts == 3 ? std::optional<int>(7) : std::nullopt;
  });

  assert(value == 7);
  assert(attempts == 3);
  assert(clock->Slept() == 20ms);
}

void TestZeroTimeoutMeansExactlyOneAttempt() {
  auto clock  = std::make_shared<ManualClock>();
  auto poller = MakePoller(clock, 10ms);

  int  attempts = 0;
  bool timed_out = false;
  try {
    (void)poller.PollUntil(0ms, [&]() -> std::optional<int> {
      ++attempts;
      return std::nullopt;
    });
  } catch (const redis_ipc::util::Timeout&) {
    timed_out = true;
  }

  assert(timed_out);
  assert(attempts == 1);
  assert(clock->Slept() == 0ms);
}

void TestTimeoutIsBoundedByOneInterval() {
  auto clock  = std::make_shared<ManualClock>();
  auto poller = MakePoller(clock, 30ms);

  const auto start     = clock->Now();
  bool       timed_out = false;
  try {
    (void)poller.PollUntil(100ms, []() -> std::optional<int> { return std::nullopt; });
  } catch (const redis_ipc::util::Timeout&) {
    timed_out = true;
  }

  const auto elapsed = clock->Now() - start;
  assert(timed_out);
  assert(elapsed >= 100ms);
  assert(elapsed <= 130ms);
  // last sleep is shortened to the remaining budget
  assert(clock->Slept() == 100ms);
}

void TestErrorsPropagateWithoutRetry() {
  auto clock  = std::make_shared<ManualClock>();
  auto poller = MakePoller(clock, 10ms);

  int  attempts = 0;
  bool threw    = false;
  try {
    (void)poller.PollUntil(1000ms, [&]() -> std::optional<int> {
      ++attempts;
      throw redis_ipc::util::StoreError("connection reset");
    });
  } catch (const redis_ipc::util::StoreError&) {
    threw = true;
  }

  assert(threw);
  assert(attempts == 1);
  assert(clock->Slept() == 0ms);
}

void TestWaitUntilSlicesTheBudget() {
  auto clock  = std::make_shared<ManualClock>();
  auto poller = MakePoller(clock, 10ms, 400ms);

  std::vector<std::chrono::milliseconds> budgets;
  bool                                   timed_out = false;
  try {
    (void)poller.WaitUntil(1000ms, [&](std::chrono::milliseconds budget) -> std::optional<int> {
      budgets.push_back(budget);
      clock->Advance(budget);
      return std::nullopt;
    });
  } catch (const redis_ipc::util::Timeout&) {
    timed_out = true;
  }

  assert(timed_out);
  assert((budgets == std::vector<std::chrono::milliseconds>{400ms, 400ms, 200ms}));
  assert(clock->Slept() == 0ms);
}

void TestWaitUntilZeroTimeoutIsNonBlocking() {
  auto clock  = std::make_shared<ManualClock>();
  auto poller = MakePoller(clock, 10ms);

  std::vector<std::chrono::milliseconds> budgets;
  auto value = poller.WaitUntil(0ms, [&](std::chrono::milliseconds budget) -> std::optional<int> {
    budgets.push_back(budget);
    return 3;
  });

  assert(value == 3);
  assert((budgets == std::vector<std::chrono::milliseconds>{0ms}));
}

} // namespace

int main() {
  TestReturnsFirstValue();
  TestZeroTimeoutMeansExactlyOneAttempt();
  TestTimeoutIsBoundedByOneInterval();
  TestErrorsPropagateWithoutRetry();
  TestWaitUntilSlicesTheBudget();
  TestWaitUntilZeroTimeoutIsNonBlocking();

  std::cout << "redis_ipc_unit_blocking_poller: pass\n";
  return 0;
}
