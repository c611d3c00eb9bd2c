#include "time.hpp"

#include <thread>

namespace redis_ipc::util {

TimePoint RealClock::Now() const {
  return std::chrono::steady_clock::now();
}

uint64_t RealClock::UnixMillis() const {
  return std::chrono::duration_cast<Millis>(std::chrono::system_clock::now().time_since_epoch()).count();
}

void RealClock::SleepFor(Millis duration) {
  std::this_thread::sleep_for(duration);
}

bool RealClock::WaitFor(std::condition_variable& cv, std::unique_lock<std::mutex>& lock, Millis budget,
                        const std::function<bool()>& ready) {
  return cv.wait_for(lock, budget, ready);
}

ManualClock::ManualClock(uint64_t unix_millis) : unix_base_(unix_millis) {
}

TimePoint ManualClock::Now() const {
  std::lock_guard lock(mutex_);
  return TimePoint{} + offset_;
}

uint64_t ManualClock::UnixMillis() const {
  std::lock_guard lock(mutex_);
  return unix_base_ + static_cast<uint64_t>(offset_.count());
}

void ManualClock::SleepFor(Millis duration) {
  std::lock_guard lock(mutex_);
  offset_ += duration;
  slept_ += duration;
}

bool ManualClock::WaitFor(std::condition_variable&, std::unique_lock<std::mutex>&, Millis budget,
                          const std::function<bool()>& ready) {
  if (ready()) {
    return true;
  }
  Advance(budget);
  return ready();
}

void ManualClock::Advance(Millis duration) {
  std::lock_guard lock(mutex_);
  offset_ += duration;
}

Millis ManualClock::Slept() const {
  std::lock_guard lock(mutex_);
  return slept_;
}

std::shared_ptr<Clock> DefaultClock() {
  static const std::shared_ptr<Clock> clock = std::make_shared<RealClock>();
  return clock;
}

Millis ToMillis(const google::protobuf::Duration& duration) {
  return std::chrono::duration_cast<Millis>(std::chrono::seconds(duration.seconds()) + std::chrono::nanoseconds(duration.nanos()));
}

Millis ElapsedMillis(TimePoint from, TimePoint to) {
  return std::chrono::duration_cast<Millis>(to - from);
}

} // namespace redis_ipc::util
