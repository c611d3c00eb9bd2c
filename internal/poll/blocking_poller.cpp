#include "blocking_poller.hpp"

namespace redis_ipc::poll {

BlockingPoller::BlockingPoller(PollerOptions options, std::shared_ptr<util::Clock> clock)
    : options_(options),
      clock_(clock ? std::move(clock) : util::DefaultClock()) {
  if (options_.interval.count() <= 0) {
    options_.interval = std::chrono::milliseconds(1);
  }
  if (options_.native_block_slice.count() <= 0) {
    options_.native_block_slice = std::chrono::milliseconds(1);
  }
}

std::string BlockingPoller::TimeoutMessage(std::chrono::milliseconds timeout) {
  return "no data within " + std::to_string(timeout.count()) + "ms";
}

} // namespace redis_ipc::poll
