#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

#include "google/protobuf/duration.pb.h"

namespace redis_ipc::util {

/*
  Time utilities: single place to control the clock source.

  Everything that measures elapsed time, sleeps, or stamps data goes through
  a Clock so tests can substitute a ManualClock and never wait on the wall
  clock.
*/

using Millis    = std::chrono::milliseconds;
using TimePoint = std::chrono::steady_clock::time_point;

class Clock {
 public:
  virtual ~Clock() = default;

  // Monotonic time used for deadlines.
  virtual TimePoint Now() const = 0;

  // Wall clock used to stamp envelopes and stream ids.
  virtual uint64_t UnixMillis() const = 0;

  virtual void SleepFor(Millis duration) = 0;

  /*
    Waits on `cv` for at most `budget` until `ready` holds.
    `lock` must be held on entry and is held on return.
    Returns the final value of `ready`.
  */
  virtual bool WaitFor(std::condition_variable& cv, std::unique_lock<std::mutex>& lock, Millis budget,
                       const std::function<bool()>& ready) = 0;
};

class RealClock final : public Clock {
 public:
  TimePoint Now() const override;
  uint64_t  UnixMillis() const override;
  void      SleepFor(Millis duration) override;
  bool      WaitFor(std::condition_variable& cv, std::unique_lock<std::mutex>& lock, Millis budget,
                    const std::function<bool()>& ready) override;
};

/*
  Deterministic clock. Time only moves through Advance(), SleepFor() and
  unsatisfied WaitFor() calls, each of which advance by the requested amount.
*/
class ManualClock final : public Clock {
 public:
  explicit ManualClock(uint64_t unix_millis = 1'700'000'000'000ULL);

  TimePoint Now() const override;
  uint64_t  UnixMillis() const override;
  void      SleepFor(Millis duration) override;
  bool      WaitFor(std::condition_variable& cv, std::unique_lock<std::mutex>& lock, Millis budget,
                    const std::function<bool()>& ready) override;

  void Advance(Millis duration);

  // Total time slept through SleepFor().
  Millis Slept() const;

 private:
  mutable std::mutex mutex_;
  Millis             offset_{0};
  Millis             slept_{0};
  uint64_t           unix_base_;
};

std::shared_ptr<Clock> DefaultClock();

Millis ToMillis(const google::protobuf::Duration& duration);
Millis ElapsedMillis(TimePoint from, TimePoint to);

} // namespace redis_ipc::util
