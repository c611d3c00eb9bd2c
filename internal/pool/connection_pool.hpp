#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/store/api/connection.hpp"
#include "internal/util/time.hpp"

namespace redis_ipc::pool {

// Exclusive handle on a pooled connection; returned to the pool when the
// last copy goes out of scope.
using ScopedConnection = std::shared_ptr<store::Connection>;

struct PoolOptions {
  std::size_t               max_connections = 8;
  std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds(1000);
};

struct PoolStats {
  std::size_t live   = 0;
  std::size_t idle   = 0;
  std::size_t in_use = 0;
};

/*
  ConnectionPool

  Bounded set of store connections shared by every structure of a process.

  Design notes:
  -------------
  - A connection is handed to one caller at a time.
  - Idle connections are health-checked on Acquire(); an unhealthy one is
    dropped and replaced by a fresh connection.
  - Connections that report themselves unhealthy on release are dropped
    instead of reused.
  - Acquire() waits at most acquire_timeout for a free slot, then throws
    PoolExhausted. Connect failures surface as StoreError.

  Lifetime:
    Structures hold shared_ptr<ConnectionPool>
    Handles keep only a weak reference; a handle outliving its pool simply
    closes its connection.
*/
class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
 public:
  ConnectionPool(std::shared_ptr<store::ConnectionFactory> factory, PoolOptions options,
                 std::shared_ptr<util::Clock> clock = util::DefaultClock());

  ScopedConnection Acquire();

  PoolStats Stats() const;

  const PoolOptions& Options() const {
    return options_;
  }

  std::string Describe() const {
    return factory_->Describe();
  }

 private:
  ScopedConnection Wrap(store::Connection* conn);
  void             Release(store::Connection* conn);

  std::shared_ptr<store::ConnectionFactory> factory_;
  PoolOptions                               options_;
  std::shared_ptr<util::Clock>              clock_;

  mutable std::mutex                              mutex_;
  std::condition_variable                         cv_;
  std::vector<std::unique_ptr<store::Connection>> idle_;
  std::size_t                                     live_connections_ = 0;
};

} // namespace redis_ipc::pool
