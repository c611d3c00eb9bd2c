#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "internal/codec/codec.hpp"
#include "internal/queue/raw_queue.hpp"

namespace redis_ipc::queue {

template <typename T>
struct QueueMessage {
  std::string message_id;
  std::string producer;
  uint64_t    enqueued_at_ms = 0;
  T           value;
};

/*
  WriteQueue<T>

  Producer side of a named work queue. Items are tagged with this queue's
  identity so that a ReadQueue sharing the identity skips them.
*/
template <typename T>
class WriteQueue {
 public:
  WriteQueue(std::shared_ptr<pool::ConnectionPool> pool, std::shared_ptr<poll::BlockingPoller> poller, QueueOptions options,
             codec::CodecPtr<T> codec)
      : raw_(std::move(pool), std::move(poller), std::move(options)),
        codec_(std::move(codec)) {
    if (!codec_) {
      throw util::InvalidArgument("queue '" + raw_.Options().name + "' requires a codec");
    }
  }

  // Returns the id assigned to the pushed message.
  std::string Push(const T& item) {
    return raw_.Push(codec_->Encode(item));
  }

  uint64_t Length() {
    return raw_.Length();
  }

  const std::string& Identity() const {
    return raw_.Identity();
  }

  const QueueOptions& Options() const {
    return raw_.Options();
  }

 private:
  RawQueue           raw_;
  codec::CodecPtr<T> codec_;
};

/*
  ReadQueue<T>

  Consumer side of a named work queue. Pop() never blocks; PopBlocking()
  waits at most the given (or configured) timeout and throws util::Timeout.
  See RawQueue for the self-exclusion rules.
*/
template <typename T>
class ReadQueue {
 public:
  ReadQueue(std::shared_ptr<pool::ConnectionPool> pool, std::shared_ptr<poll::BlockingPoller> poller, QueueOptions options,
            codec::CodecPtr<T> codec)
      : raw_(std::move(pool), std::move(poller), std::move(options)),
        codec_(std::move(codec)) {
    if (!codec_) {
      throw util::InvalidArgument("queue '" + raw_.Options().name + "' requires a codec");
    }
  }

  std::optional<T> Pop() {
    auto message = raw_.Pop();
    if (!message) {
      return std::nullopt;
    }
    return codec_->Decode(message->content);
  }

  T PopBlocking() {
    return PopBlocking(raw_.Options().timeout);
  }

  T PopBlocking(std::chrono::milliseconds timeout) {
    return codec_->Decode(raw_.PopBlocking(timeout).content);
  }

  std::optional<QueueMessage<T>> PopMessage() {
    auto message = raw_.Pop();
    if (!message) {
      return std::nullopt;
    }
    return Typed(std::move(*message));
  }

  QueueMessage<T> PopMessageBlocking(std::chrono::milliseconds timeout) {
    return Typed(raw_.PopBlocking(timeout));
  }

  uint64_t Length() {
    return raw_.Length();
  }

  const std::string& Identity() const {
    return raw_.Identity();
  }

  const QueueOptions& Options() const {
    return raw_.Options();
  }

 private:
  QueueMessage<T> Typed(RawQueueMessage message) const {
    return QueueMessage<T>{std::move(message.message_id), std::move(message.producer), message.enqueued_at_ms,
                           codec_->Decode(message.content)};
  }

  RawQueue           raw_;
  codec::CodecPtr<T> codec_;
};

} // namespace redis_ipc::queue
