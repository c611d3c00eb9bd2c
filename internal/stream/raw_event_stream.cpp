#include "raw_event_stream.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "redis_ipc/v1/envelope.pb.h"

namespace redis_ipc::stream {

RawEventStream::RawEventStream(std::shared_ptr<pool::ConnectionPool> pool, std::shared_ptr<poll::BlockingPoller> poller,
                               StreamOptions options)
    : pool_(std::move(pool)),
      poller_(std::move(poller)),
      options_(std::move(options)) {
  if (!pool_ || !poller_) {
    throw util::InvalidArgument("event stream requires a connection pool and a poller");
  }
  if (options_.name.empty()) {
    throw util::InvalidArgument("event stream name must not be empty");
  }
  if (options_.page_size == 0) {
    throw util::InvalidArgument("event stream '" + options_.name + "': page_size must be at least 1");
  }
  if (options_.identity.empty()) {
    options_.identity = util::GenerateUUIDString();
  }
}

StreamCursor RawEventStream::Append(const std::string& content) {
  return Append(content, options_.max_size);
}

StreamCursor RawEventStream::Append(const std::string& content, uint64_t max_size) {
  v1::StreamEnvelope envelope;
  envelope.set_producer(options_.identity);
  envelope.set_appended_at_ms(poller_->clock()->UnixMillis());
  envelope.set_content(content);

  std::string data;
  if (!envelope.SerializeToString(&data)) {
    throw util::SerializationError("failed to serialize stream envelope for " + options_.name);
  }

  auto conn = pool_->Acquire();
  return StreamCursor(conn->StreamAppend(options_.name, data, max_size));
}

RawStreamEvent RawEventStream::Decode(const store::StreamRecord& record) const {
  v1::StreamEnvelope envelope;
  if (!envelope.ParseFromString(record.payload)) {
    throw util::DecodeError("malformed entry " + record.id.ToString() + " in stream " + options_.name);
  }

  RawStreamEvent event;
  event.cursor         = StreamCursor(record.id);
  event.producer       = envelope.producer();
  event.appended_at_ms = envelope.appended_at_ms();
  event.content        = std::move(*envelope.mutable_content());
  return event;
}

// Runs after the data read so entries trimmed while reading are noticed too.
void RawEventStream::CheckNotExpired(store::Connection& conn, const StreamCursor& after) const {
  if (after.IsBeginning()) {
    return;
  }
  auto first = conn.StreamFirst(options_.name);
  if (!first || after.Id() < first->id) {
    throw util::CursorExpired("cursor " + after.ToString() + " of stream " + options_.name + " is older than the oldest retained entry " +
                              (first ? first->id.ToString() : std::string("(stream is empty)")));
  }
}

std::vector<RawStreamEvent> RawEventStream::ReadPage(const StreamCursor& after, std::size_t count) {
  std::vector<store::StreamRecord> records;
  {
    auto conn = pool_->Acquire();
    records   = conn->StreamRangeAfter(options_.name, after.Id(), count);
    CheckNotExpired(*conn, after);
  }

  std::vector<RawStreamEvent> events;
  events.reserve(records.size());
  for (const auto& record : records) {
    events.push_back(Decode(record));
  }
  return events;
}

RawStreamEvent RawEventStream::ReadNextBlocking(const StreamCursor& after, std::chrono::milliseconds timeout) {
  return poller_->WaitUntil(timeout, [&](std::chrono::milliseconds budget) -> std::optional<RawStreamEvent> {
    std::optional<store::StreamRecord> record;
    {
      auto conn = pool_->Acquire();
      if (budget.count() == 0) {
        auto page = conn->StreamRangeAfter(options_.name, after.Id(), 1);
        if (!page.empty()) {
          record = std::move(page.front());
        }
      } else {
        record = conn->StreamReadBlocking(options_.name, after.Id(), budget);
      }
      // Trimming only happens on append, so an expired cursor always finds data.
      if (record) {
        CheckNotExpired(*conn, after);
      }
    }
    if (!record) {
      return std::nullopt;
    }
    return Decode(*record);
  });
}

std::optional<RawStreamEvent> RawEventStream::ReadLast() {
  std::optional<store::StreamRecord> record;
  {
    auto conn = pool_->Acquire();
    record    = conn->StreamLast(options_.name);
  }
  if (!record) {
    return std::nullopt;
  }
  return Decode(*record);
}

uint64_t RawEventStream::Length() {
  auto conn = pool_->Acquire();
  return conn->StreamLength(options_.name);
}

StreamCursor RawEventStream::Tail() {
  auto conn = pool_->Acquire();
  auto last = conn->StreamLast(options_.name);
  return last ? StreamCursor(last->id) : StreamCursor::Beginning();
}

StreamCursor RawEventStream::StartCursor() {
  return options_.start == StartPosition::kLatest ? Tail() : StreamCursor::Beginning();
}

} // namespace redis_ipc::stream
