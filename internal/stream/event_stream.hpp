#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/codec/codec.hpp"
#include "internal/stream/raw_event_stream.hpp"

namespace redis_ipc::stream {

template <typename T>
struct StreamEvent {
  StreamCursor cursor;
  std::string  producer;
  uint64_t     appended_at_ms = 0;
  T            value;
};

namespace detail {

template <typename T>
StreamEvent<T> Typed(RawStreamEvent event, const codec::Codec<T>& codec) {
  return StreamEvent<T>{event.cursor, std::move(event.producer), event.appended_at_ms, codec.Decode(event.content)};
}

} // namespace detail

/*
  StreamRange<T>

  Lazy, finite sequence of the entries after a cursor. Pages of
  StreamOptions::page_size entries are fetched on demand; iteration ends at
  the first short page. Every event carries the cursor to resume from, so an
  interrupted iteration can be restarted with ReadFrom(event.cursor).

  A page fetch throws util::CursorExpired once entries the range has not
  reached yet were trimmed away.
*/
template <typename T>
class StreamRange {
 public:
  StreamRange(std::shared_ptr<RawEventStream> raw, codec::CodecPtr<T> codec, StreamCursor after)
      : raw_(std::move(raw)),
        codec_(std::move(codec)),
        cursor_(after) {
  }

  std::optional<StreamEvent<T>> Next() {
    if (buffer_.empty() && !exhausted_) {
      Fetch();
    }
    if (buffer_.empty()) {
      return std::nullopt;
    }

    auto event = std::move(buffer_.front());
    buffer_.pop_front();
    cursor_ = event.cursor;
    return detail::Typed(std::move(event), *codec_);
  }

  // Drains the remaining entries.
  std::vector<StreamEvent<T>> Collect() {
    std::vector<StreamEvent<T>> events;
    while (auto event = Next()) {
      events.push_back(std::move(*event));
    }
    return events;
  }

  // Cursor of the last entry returned by Next().
  const StreamCursor& Cursor() const {
    return cursor_;
  }

 private:
  void Fetch() {
    const auto page_size = raw_->Options().page_size;
    auto       page      = raw_->ReadPage(fetch_cursor_.value_or(cursor_), page_size);
    if (page.size() < page_size) {
      exhausted_ = true;
    }
    if (!page.empty()) {
      fetch_cursor_ = page.back().cursor;
    }
    for (auto& event : page) {
      buffer_.push_back(std::move(event));
    }
  }

  std::shared_ptr<RawEventStream> raw_;
  codec::CodecPtr<T>              codec_;
  StreamCursor                    cursor_;
  std::optional<StreamCursor>     fetch_cursor_;
  std::deque<RawStreamEvent>      buffer_;
  bool                            exhausted_ = false;
};

template <typename T>
class StreamReader;

/*
  EventStream<T>

  Size-bounded append-only log shared by every process using the same name.
  Appends are atomic with their trim; reads never consume, so any number of
  readers can follow the stream each with its own cursor.
*/
template <typename T>
class EventStream {
 public:
  EventStream(std::shared_ptr<pool::ConnectionPool> pool, std::shared_ptr<poll::BlockingPoller> poller, StreamOptions options,
              codec::CodecPtr<T> codec)
      : raw_(std::make_shared<RawEventStream>(std::move(pool), std::move(poller), std::move(options))),
        codec_(std::move(codec)) {
    if (!codec_) {
      throw util::InvalidArgument("event stream '" + raw_->Options().name + "' requires a codec");
    }
  }

  StreamCursor Append(const T& event) {
    return raw_->Append(codec_->Encode(event));
  }

  // max_size 0 leaves the stream unbounded.
  StreamCursor Append(const T& event, uint64_t max_size) {
    return raw_->Append(codec_->Encode(event), max_size);
  }

  StreamRange<T> ReadFrom(const StreamCursor& after) {
    return StreamRange<T>(raw_, codec_, after);
  }

  StreamEvent<T> ReadNextBlocking(const StreamCursor& after) {
    return ReadNextBlocking(after, raw_->Options().timeout);
  }

  StreamEvent<T> ReadNextBlocking(const StreamCursor& after, std::chrono::milliseconds timeout) {
    return detail::Typed(raw_->ReadNextBlocking(after, timeout), *codec_);
  }

  std::optional<StreamEvent<T>> ReadLast() {
    auto event = raw_->ReadLast();
    if (!event) {
      return std::nullopt;
    }
    return detail::Typed(std::move(*event), *codec_);
  }

  uint64_t Length() {
    return raw_->Length();
  }

  StreamCursor Tail() {
    return raw_->Tail();
  }

  StreamReader<T> Reader() {
    return StreamReader<T>(raw_, codec_);
  }

  const StreamOptions& Options() const {
    return raw_->Options();
  }

 private:
  std::shared_ptr<RawEventStream> raw_;
  codec::CodecPtr<T>              codec_;
};

/*
  StreamReader<T>

  Cursor-holding consumer. The start position from StreamOptions is resolved
  at the first read, not at construction. After util::CursorExpired the
  reader keeps its cursor; call Resync() to continue from the current tail,
  or Seek() to any other position.
*/
template <typename T>
class StreamReader {
 public:
  StreamReader(std::shared_ptr<RawEventStream> raw, codec::CodecPtr<T> codec)
      : raw_(std::move(raw)),
        codec_(std::move(codec)) {
  }

  std::optional<StreamEvent<T>> Next() {
    auto page = raw_->ReadPage(Cursor(), 1);
    if (page.empty()) {
      return std::nullopt;
    }
    cursor_ = page.front().cursor;
    return detail::Typed(std::move(page.front()), *codec_);
  }

  StreamEvent<T> NextBlocking() {
    return NextBlocking(raw_->Options().timeout);
  }

  StreamEvent<T> NextBlocking(std::chrono::milliseconds timeout) {
    auto event = raw_->ReadNextBlocking(Cursor(), timeout);
    cursor_    = event.cursor;
    return detail::Typed(std::move(event), *codec_);
  }

  StreamCursor Cursor() {
    if (!cursor_) {
      cursor_ = raw_->StartCursor();
    }
    return *cursor_;
  }

  void Seek(const StreamCursor& cursor) {
    cursor_ = cursor;
  }

  StreamCursor Resync() {
    cursor_ = raw_->Tail();
    return *cursor_;
  }

 private:
  std::shared_ptr<RawEventStream> raw_;
  codec::CodecPtr<T>              codec_;
  std::optional<StreamCursor>     cursor_;
};

} // namespace redis_ipc::stream
