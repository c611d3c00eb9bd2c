#include "internal/store/api/stream_id.hpp"

#include <charconv>

#include "internal/util/errors.hpp"

namespace redis_ipc::store {

namespace {

bool ParseNumber(const std::string& text, std::size_t begin, std::size_t end, uint64_t* out) {
  if (begin >= end) {
    return false;
  }
  const auto* first  = text.data() + begin;
  const auto* last   = text.data() + end;
  auto [ptr, ec]     = std::from_chars(first, last, *out);
  return ec == std::errc() && ptr == last;
}

} // namespace

StreamId StreamId::Parse(const std::string& text) {
  StreamId   id;
  const auto dash = text.find('-');

  if (dash == std::string::npos) {
    if (!ParseNumber(text, 0, text.size(), &id.ms)) {
      throw util::InvalidArgument("invalid stream id '" + text + "'");
    }
    return id;
  }

  if (!ParseNumber(text, 0, dash, &id.ms) || !ParseNumber(text, dash + 1, text.size(), &id.seq)) {
    throw util::InvalidArgument("invalid stream id '" + text + "'");
  }
  return id;
}

std::string StreamId::ToString() const {
  return std::to_string(ms) + "-" + std::to_string(seq);
}

} // namespace redis_ipc::store
