#include "connection_pool.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace redis_ipc::pool {

using observability::IntField;
using observability::StringField;

ConnectionPool::ConnectionPool(std::shared_ptr<store::ConnectionFactory> factory, PoolOptions options,
                               std::shared_ptr<util::Clock> clock)
    : factory_(std::move(factory)),
      options_(options),
      clock_(clock ? std::move(clock) : util::DefaultClock()) {
  if (!factory_) {
    throw util::InvalidArgument("connection pool requires a connection factory");
  }
  if (options_.max_connections == 0) {
    options_.max_connections = 1;
  }
}

ScopedConnection ConnectionPool::Acquire() {
  const auto deadline = clock_->Now() + options_.acquire_timeout;

  std::unique_lock lock(mutex_);
  for (;;) {
    while (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      if (conn->IsHealthy()) {
        return Wrap(conn.release());
      }
      --live_connections_;
      REDIS_IPC_LOG_DEBUG("Dropped unhealthy idle connection", {StringField("target", factory_->Describe())});
    }

    if (live_connections_ < options_.max_connections) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = factory_->Connect();
        REDIS_IPC_LOG_DEBUG("Opened store connection", {StringField("target", factory_->Describe()),
                                                        IntField("max_connections", static_cast<int64_t>(options_.max_connections))});
        return Wrap(conn.release());
      } catch (...) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    const auto remaining = util::ElapsedMillis(clock_->Now(), deadline);
    if (remaining.count() <= 0) {
      throw util::PoolExhausted("no store connection available within " + std::to_string(options_.acquire_timeout.count()) +
                                "ms (max_connections=" + std::to_string(options_.max_connections) + ")");
    }

    clock_->WaitFor(cv_, lock, remaining, [this] {
      return !idle_.empty() || live_connections_ < options_.max_connections;
    });
  }
}

PoolStats ConnectionPool::Stats() const {
  std::lock_guard lock(mutex_);
  PoolStats       stats;
  stats.live   = live_connections_;
  stats.idle   = idle_.size();
  stats.in_use = live_connections_ - idle_.size();
  return stats;
}

ScopedConnection ConnectionPool::Wrap(store::Connection* conn) {
  std::weak_ptr<ConnectionPool> weak_self = shared_from_this();
  return ScopedConnection(conn, [weak_self](store::Connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void ConnectionPool::Release(store::Connection* conn) {
  std::unique_ptr<store::Connection> owned(conn);
  const bool                         healthy = owned->IsHealthy();
  {
    std::lock_guard lock(mutex_);
    if (healthy) {
      idle_.push_back(std::move(owned));
    } else {
      --live_connections_;
    }
  }
  if (!healthy) {
    REDIS_IPC_LOG_DEBUG("Discarded broken store connection", {StringField("target", factory_->Describe())});
  }
  cv_.notify_one();
}

} // namespace redis_ipc::pool
