#include "raw_queue.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "redis_ipc/v1/envelope.pb.h"

namespace redis_ipc::queue {

RawQueue::RawQueue(std::shared_ptr<pool::ConnectionPool> pool, std::shared_ptr<poll::BlockingPoller> poller, QueueOptions options)
    : pool_(std::move(pool)),
      poller_(std::move(poller)),
      options_(std::move(options)) {
  if (!pool_ || !poller_) {
    throw util::InvalidArgument("queue requires a connection pool and a poller");
  }
  if (options_.name.empty()) {
    throw util::InvalidArgument("queue name must not be empty");
  }
  if (options_.max_skip == 0) {
    throw util::InvalidArgument("queue '" + options_.name + "': max_skip must be at least 1");
  }
  if (options_.identity.empty()) {
    options_.identity = util::GenerateUUIDString();
  }
}

std::string RawQueue::Push(const std::string& content) {
  v1::QueueEnvelope envelope;
  envelope.set_message_id(util::GenerateUUIDString());
  envelope.set_producer(options_.identity);
  envelope.set_enqueued_at_ms(poller_->clock()->UnixMillis());
  envelope.set_content(content);

  std::string data;
  if (!envelope.SerializeToString(&data)) {
    throw util::SerializationError("failed to serialize queue envelope for " + options_.name);
  }

  auto conn = pool_->Acquire();
  conn->PushTail(options_.name, data);
  return envelope.message_id();
}

RawQueueMessage RawQueue::Decode(const std::string& data) const {
  v1::QueueEnvelope envelope;
  if (!envelope.ParseFromString(data)) {
    throw util::DecodeError("malformed item in queue " + options_.name);
  }

  RawQueueMessage message;
  message.message_id     = envelope.message_id();
  message.producer       = envelope.producer();
  message.enqueued_at_ms = envelope.enqueued_at_ms();
  message.content        = std::move(*envelope.mutable_content());
  return message;
}

std::optional<RawQueueMessage> RawQueue::Pop() {
  if (options_.exclude_own) {
    return PopExcludingOwn();
  }

  std::optional<std::string> data;
  {
    auto conn = pool_->Acquire();
    data      = conn->PopHead(options_.name);
  }
  if (!data) {
    return std::nullopt;
  }
  return Decode(*data);
}

std::optional<RawQueueMessage> RawQueue::PopExcludingOwn() {
  auto conn = pool_->Acquire();

  std::vector<std::string>       held;
  std::optional<RawQueueMessage> found;
  try {
    while (held.size() < options_.max_skip) {
      auto data = conn->PopHead(options_.name);
      if (!data) {
        break;
      }
      auto message = Decode(*data);
      if (message.producer != options_.identity) {
        found = std::move(message);
        break;
      }
      held.push_back(std::move(*data));
    }
  } catch (...) {
    Restore(conn, held);
    throw;
  }

  Restore(conn, held);
  return found;
}

void RawQueue::Restore(pool::ScopedConnection& conn, const std::vector<std::string>& held) {
  if (held.empty()) {
    return;
  }
  if (!conn->IsHealthy()) {
    conn.reset();
    conn = pool_->Acquire();
  }
  conn->PushHead(options_.name, held);
}

RawQueueMessage RawQueue::PopBlocking(std::chrono::milliseconds timeout) {
  if (options_.exclude_own) {
    return poller_->PollUntil(timeout, [this] { return Pop(); });
  }

  // A native blocking pop returns any item, which is fine without exclusion.
  return poller_->WaitUntil(timeout, [this](std::chrono::milliseconds budget) -> std::optional<RawQueueMessage> {
    std::optional<std::string> data;
    {
      auto conn = pool_->Acquire();
      data      = budget.count() == 0 ? conn->PopHead(options_.name) : conn->PopHeadBlocking(options_.name, budget);
    }
    if (!data) {
      return std::nullopt;
    }
    return Decode(*data);
  });
}

uint64_t RawQueue::Length() {
  auto conn = pool_->Acquire();
  return conn->ListLength(options_.name);
}

} // namespace redis_ipc::queue
