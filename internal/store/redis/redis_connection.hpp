#pragma once

#include <boost/redis/request.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/store/api/connection.hpp"
#include "internal/store/redis/redis_reply.hpp"

namespace redis_ipc::store::redis {

struct RedisOptions {
  std::string               host = "127.0.0.1";
  uint16_t                  port = 6379;
  std::string               password;
  uint32_t                  database        = 0;
  std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(2000);
  std::chrono::milliseconds io_timeout      = std::chrono::milliseconds(2000);
};

/*
  RedisConnection

  One Boost.Redis connection (RESP3) exposed through the synchronous
  Connection interface.

  Design notes:
  -------------
  - The asio connection runs on a private io_context thread; every command
    is posted there and waited for with a deadline of io_timeout (plus the
    blocking budget for BLPOP / XREAD BLOCK).
  - HELLO, AUTH and SELECT are part of the Boost.Redis handshake; the
    constructor issues a PING and throws StoreError when the handshake did
    not complete within connect_timeout + io_timeout.
  - Server error replies throw StoreError but leave the connection usable.
  - Transport failures and missed deadlines throw StoreError and mark the
    connection broken; reconnection is disabled so the pool replaces it.
*/
class RedisConnection final : public Connection {
 public:
  explicit RedisConnection(const RedisOptions& options);
  ~RedisConnection() override;

  RedisConnection(const RedisConnection&)            = delete;
  RedisConnection& operator=(const RedisConnection&) = delete;

  bool IsHealthy() const override;
  void Ping() override;

  std::optional<std::string> Get(const std::string& key) override;
  void Set(const std::string& key, const std::string& value, std::optional<std::chrono::milliseconds> ttl) override;
  bool Delete(const std::string& key) override;
  bool Exists(const std::string& key) override;

  void                       PushTail(const std::string& key, const std::string& value) override;
  void                       PushHead(const std::string& key, const std::vector<std::string>& values) override;
  std::optional<std::string> PopHead(const std::string& key) override;
  std::optional<std::string> PopHeadBlocking(const std::string& key, std::chrono::milliseconds timeout) override;
  uint64_t                   ListLength(const std::string& key) override;

  StreamId                    StreamAppend(const std::string& key, const std::string& payload, uint64_t max_len) override;
  std::vector<StreamRecord>   StreamRangeAfter(const std::string& key, const StreamId& after, std::size_t count) override;
  std::optional<StreamRecord> StreamReadBlocking(const std::string& key, const StreamId& after,
                                                 std::chrono::milliseconds timeout) override;
  std::optional<StreamRecord> StreamFirst(const std::string& key) override;
  std::optional<StreamRecord> StreamLast(const std::string& key) override;
  uint64_t                    StreamLength(const std::string& key) override;

 private:
  class Session;

  Reply Execute(const boost::redis::request& request, const char* command,
                std::chrono::milliseconds extra_wait = std::chrono::milliseconds(0));
  [[noreturn]] void Fail(const std::string& what);

  RedisOptions             options_;
  bool                     broken_ = false;
  std::unique_ptr<Session> session_;
};

class RedisConnectionFactory final : public ConnectionFactory {
 public:
  explicit RedisConnectionFactory(RedisOptions options);

  std::unique_ptr<Connection> Connect() override;
  std::string                 Describe() const override;

 private:
  RedisOptions options_;
};

} // namespace redis_ipc::store::redis
