#include "internal/store/redis/redis_connection.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/redis/config.hpp>
#include <boost/redis/connection.hpp>
#include <boost/redis/error.hpp>
#include <boost/redis/logger.hpp>
#include <boost/redis/response.hpp>
#include <boost/system/error_code.hpp>

#include <atomic>
#include <cstdio>
#include <future>
#include <thread>

#include "internal/util/errors.hpp"

namespace redis_ipc::store::redis {

namespace {

std::string Target(const RedisOptions& options) {
  return options.host + ":" + std::to_string(options.port);
}

// BLPOP takes its timeout in (fractional) seconds; 0 would block forever.
std::string SecondsArg(std::chrono::milliseconds timeout) {
  const auto ms = timeout.count() < 1 ? 1 : timeout.count();
  char       buf[32];
  std::snprintf(buf, sizeof(buf), "%lld.%03lld", static_cast<long long>(ms / 1000), static_cast<long long>(ms % 1000));
  return buf;
}

std::string ExclusiveStart(const StreamId& after) {
  return after.IsZero() ? std::string("-") : "(" + after.ToString();
}

bool IsServerError(const boost::system::error_code& ec) {
  return ec == boost::redis::error::resp3_simple_error || ec == boost::redis::error::resp3_blob_error;
}

} // namespace

// ------------------------------------------------------------
// Session
// ------------------------------------------------------------

/*
  Owns the io_context, its worker thread and the Boost.Redis connection.
  Destroying it cancels the connection and joins the thread, which also
  closes the socket of a connection whose handshake failed.
*/
class RedisConnection::Session {
 public:
  explicit Session(const RedisOptions& options)
      : work_(boost::asio::make_work_guard(ioc_)),
        conn_(std::make_shared<boost::redis::connection>(ioc_)) {
    boost::redis::config cfg;
    cfg.addr.host       = options.host;
    cfg.addr.port       = std::to_string(options.port);
    cfg.password        = options.password;
    cfg.database_index  = static_cast<int>(options.database);
    cfg.clientname      = "redis-ipc";
    cfg.resolve_timeout = options.connect_timeout;
    cfg.connect_timeout = options.connect_timeout;
    // the pool replaces lost connections
    cfg.reconnect_wait_interval = std::chrono::seconds(0);

    boost::asio::post(ioc_, [this, cfg] {
      conn_->async_run(cfg, boost::redis::logger{}, [this](boost::system::error_code) {
        stopped_ = true;
      });
    });
    worker_ = std::thread([this] { ioc_.run(); });
  }

  ~Session() {
    boost::asio::post(ioc_, [this] { conn_->cancel(); });
    work_.reset();
    worker_.join();
  }

  Session(const Session&)            = delete;
  Session& operator=(const Session&) = delete;

  bool Running() const {
    return !stopped_;
  }

  // Returns false when no reply arrived within `wait`; the request is then
  // cancelled before returning so `request` and `response` may go away.
  bool Exec(const boost::redis::request& request, boost::redis::generic_response& response, std::chrono::milliseconds wait,
            boost::system::error_code& ec) {
    auto done   = std::make_shared<std::promise<boost::system::error_code>>();
    auto result = done->get_future();

    boost::asio::post(ioc_, [this, &request, &response, done] {
      conn_->async_exec(request, response, [done](boost::system::error_code exec_ec, std::size_t) {
        done->set_value(exec_ec);
      });
    });

    const bool replied = result.wait_for(wait) == std::future_status::ready;
    if (!replied) {
      boost::asio::post(ioc_, [this] { conn_->cancel(); });
    }
    ec = result.get();
    return replied;
  }

 private:
  boost::asio::io_context                                                  ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
  std::shared_ptr<boost::redis::connection>                                conn_;
  std::atomic<bool>                                                        stopped_{false};
  std::thread                                                              worker_;
};

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

RedisConnection::RedisConnection(const RedisOptions& options)
    : options_(options),
      session_(std::make_unique<Session>(options_)) {
  boost::redis::request request;
  request.push("PING");
  Execute(request, "PING", options_.connect_timeout);
}

RedisConnection::~RedisConnection() = default;

bool RedisConnection::IsHealthy() const {
  return !broken_ && session_->Running();
}

void RedisConnection::Fail(const std::string& what) {
  broken_ = true;
  throw util::StoreError("redis " + Target(options_) + ": " + what);
}

Reply RedisConnection::Execute(const boost::redis::request& request, const char* command, std::chrono::milliseconds extra_wait) {
  if (!IsHealthy()) {
    throw util::StoreError("redis " + Target(options_) + ": connection is broken");
  }

  boost::redis::generic_response response;
  boost::system::error_code      ec;
  if (!session_->Exec(request, response, options_.io_timeout + extra_wait, ec)) {
    Fail(std::string(command) + (session_->Running() ? " timed out" : ": connection closed"));
  }

  if (ec && !IsServerError(ec)) {
    Fail(std::string(command) + ": " + ec.message());
  }
  if (response.has_error()) {
    throw util::StoreError("redis " + std::string(command) + ": " + response.error().diagnostic);
  }
  if (ec) {
    throw util::StoreError("redis " + std::string(command) + ": " + ec.message());
  }
  return BuildReply(response.value());
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

void RedisConnection::Ping() {
  boost::redis::request request;
  request.push("PING");
  Execute(request, "PING");
}

std::optional<std::string> RedisConnection::Get(const std::string& key) {
  boost::redis::request request;
  request.push("GET", key);

  auto reply = Execute(request, "GET");
  if (reply.IsNull()) {
    return std::nullopt;
  }
  return std::move(reply.value);
}

void RedisConnection::Set(const std::string& key, const std::string& value, std::optional<std::chrono::milliseconds> ttl) {
  boost::redis::request request;
  if (ttl) {
    request.push("SET", key, value, "PX", std::to_string(ttl->count()));
  } else {
    request.push("SET", key, value);
  }
  Execute(request, "SET");
}

bool RedisConnection::Delete(const std::string& key) {
  boost::redis::request request;
  request.push("DEL", key);
  return ReplyInteger(Execute(request, "DEL"), "DEL") > 0;
}

bool RedisConnection::Exists(const std::string& key) {
  boost::redis::request request;
  request.push("EXISTS", key);
  return ReplyInteger(Execute(request, "EXISTS"), "EXISTS") > 0;
}

void RedisConnection::PushTail(const std::string& key, const std::string& value) {
  boost::redis::request request;
  request.push("RPUSH", key, value);
  Execute(request, "RPUSH");
}

void RedisConnection::PushHead(const std::string& key, const std::vector<std::string>& values) {
  if (values.empty()) {
    return;
  }
  // LPUSH inserts one by one at the head, so the last argument ends up first.
  boost::redis::request request;
  request.push_range("LPUSH", key, values.rbegin(), values.rend());
  Execute(request, "LPUSH");
}

std::optional<std::string> RedisConnection::PopHead(const std::string& key) {
  boost::redis::request request;
  request.push("LPOP", key);

  auto reply = Execute(request, "LPOP");
  if (reply.IsNull()) {
    return std::nullopt;
  }
  return std::move(reply.value);
}

std::optional<std::string> RedisConnection::PopHeadBlocking(const std::string& key, std::chrono::milliseconds timeout) {
  boost::redis::request request;
  request.push("BLPOP", key, SecondsArg(timeout));

  auto reply = Execute(request, "BLPOP", timeout);
  if (reply.IsNull()) {
    return std::nullopt;
  }
  // [key, value]
  if (!reply.IsAggregate() || reply.elements.size() != 2) {
    throw util::StoreError("redis: unexpected reply type for BLPOP");
  }
  return std::move(reply.elements[1].value);
}

uint64_t RedisConnection::ListLength(const std::string& key) {
  boost::redis::request request;
  request.push("LLEN", key);
  return ReplyInteger(Execute(request, "LLEN"), "LLEN");
}

StreamId RedisConnection::StreamAppend(const std::string& key, const std::string& payload, uint64_t max_len) {
  std::vector<std::string> args;
  if (max_len > 0) {
    args.push_back("MAXLEN");
    args.push_back(std::to_string(max_len));
  }
  args.push_back("*");
  args.push_back(kStreamPayloadField);
  args.push_back(payload);

  boost::redis::request request;
  request.push_range("XADD", key, args.begin(), args.end());

  const auto reply = Execute(request, "XADD");
  if (!reply.IsString()) {
    throw util::StoreError("redis: unexpected reply type for XADD");
  }
  return StreamId::Parse(reply.value);
}

std::vector<StreamRecord> RedisConnection::StreamRangeAfter(const std::string& key, const StreamId& after, std::size_t count) {
  boost::redis::request request;
  request.push("XRANGE", key, ExclusiveStart(after), "+", "COUNT", std::to_string(count));

  const auto reply = Execute(request, "XRANGE");
  return ParseStreamEntries(reply, "XRANGE");
}

std::optional<StreamRecord> RedisConnection::StreamReadBlocking(const std::string& key, const StreamId& after,
                                                                std::chrono::milliseconds timeout) {
  const auto block_ms = timeout.count() < 1 ? 1 : timeout.count();

  boost::redis::request request;
  request.push("XREAD", "COUNT", "1", "BLOCK", std::to_string(block_ms), "STREAMS", key, after.ToString());

  const auto reply = Execute(request, "XREAD", timeout);
  return ParseStreamRead(reply);
}

std::optional<StreamRecord> RedisConnection::StreamFirst(const std::string& key) {
  boost::redis::request request;
  request.push("XRANGE", key, "-", "+", "COUNT", "1");

  const auto reply   = Execute(request, "XRANGE");
  auto       records = ParseStreamEntries(reply, "XRANGE");
  if (records.empty()) {
    return std::nullopt;
  }
  return std::move(records.front());
}

std::optional<StreamRecord> RedisConnection::StreamLast(const std::string& key) {
  boost::redis::request request;
  request.push("XREVRANGE", key, "+", "-", "COUNT", "1");

  const auto reply   = Execute(request, "XREVRANGE");
  auto       records = ParseStreamEntries(reply, "XREVRANGE");
  if (records.empty()) {
    return std::nullopt;
  }
  return std::move(records.front());
}

uint64_t RedisConnection::StreamLength(const std::string& key) {
  boost::redis::request request;
  request.push("XLEN", key);
  return ReplyInteger(Execute(request, "XLEN"), "XLEN");
}

// ------------------------------------------------------------
// Factory
// ------------------------------------------------------------

RedisConnectionFactory::RedisConnectionFactory(RedisOptions options) : options_(std::move(options)) {
}

std::unique_ptr<Connection> RedisConnectionFactory::Connect() {
  return std::make_unique<RedisConnection>(options_);
}

std::string RedisConnectionFactory::Describe() const {
  return "redis://" + Target(options_) + "/" + std::to_string(options_.database);
}

} // namespace redis_ipc::store::redis
