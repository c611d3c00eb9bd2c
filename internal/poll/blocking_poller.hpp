#pragma once

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace redis_ipc::poll {

struct PollerOptions {
  // Sleep between two non-blocking attempts.
  std::chrono::milliseconds interval = std::chrono::milliseconds(25);
  // Longest single native blocking store call.
  std::chrono::milliseconds native_block_slice = std::chrono::milliseconds(500);
};

/*
  BlockingPoller

  Turns a non-blocking "try once" into a blocking call bounded by a timeout.

  - Absence (empty optional) is retried until the timeout elapses, then
    util::Timeout is thrown.
  - Any exception thrown by the attempt propagates immediately.
  - timeout == 0 performs exactly one attempt.
  - Nothing is held between attempts; the attempt itself acquires and
    releases its pooled connection.

  Stateless apart from its options; safe to share across threads.
*/
class BlockingPoller {
 public:
  explicit BlockingPoller(PollerOptions options = {}, std::shared_ptr<util::Clock> clock = util::DefaultClock());

  const PollerOptions& Options() const {
    return options_;
  }

  const std::shared_ptr<util::Clock>& clock() const {
    return clock_;
  }

  // try_once: () -> std::optional<T>
  template <typename TryOnce>
  auto PollUntil(std::chrono::milliseconds timeout, TryOnce&& try_once) -> typename std::invoke_result_t<TryOnce&>::value_type {
    const auto start = clock_->Now();
    for (;;) {
      if (auto value = try_once()) {
        return std::move(*value);
      }

      const auto remaining = timeout - util::ElapsedMillis(start, clock_->Now());
      if (remaining.count() <= 0) {
        throw util::Timeout(TimeoutMessage(timeout));
      }
      clock_->SleepFor(std::min(options_.interval, remaining));
    }
  }

  /*
    try_for: (std::chrono::milliseconds budget) -> std::optional<T>

    For store calls that block natively. `budget` is the remaining time
    capped at native_block_slice; a budget of 0 asks for a non-blocking
    attempt (native blocking calls treat 0 as "forever"). Slices run back to
    back with no sleep in between.
  */
  template <typename TryFor>
  auto WaitUntil(std::chrono::milliseconds timeout, TryFor&& try_for)
      -> typename std::invoke_result_t<TryFor&, std::chrono::milliseconds>::value_type {
    const auto start = clock_->Now();
    for (;;) {
      const auto remaining = timeout - util::ElapsedMillis(start, clock_->Now());
      const auto budget    = std::clamp(remaining, std::chrono::milliseconds(0), options_.native_block_slice);

      if (auto value = try_for(budget)) {
        return std::move(*value);
      }

      if (budget.count() == 0 || timeout - util::ElapsedMillis(start, clock_->Now()) <= std::chrono::milliseconds(0)) {
        throw util::Timeout(TimeoutMessage(timeout));
      }
    }
  }

 private:
  static std::string TimeoutMessage(std::chrono::milliseconds timeout);

  PollerOptions                options_;
  std::shared_ptr<util::Clock> clock_;
};

} // namespace redis_ipc::poll
