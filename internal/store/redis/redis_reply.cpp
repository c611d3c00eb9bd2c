#include "internal/store/redis/redis_reply.hpp"

#include <algorithm>
#include <charconv>

#include "internal/util/errors.hpp"

namespace redis_ipc::store::redis {

namespace resp3 = boost::redis::resp3;

namespace {

bool IsAggregateType(resp3::type t) {
  switch (t) {
    case resp3::type::array:
    case resp3::type::push:
    case resp3::type::set:
    case resp3::type::map:
    case resp3::type::attribute:
      return true;
    default:
      return false;
  }
}

// Elements per unit of aggregate_size.
std::size_t Multiplicity(resp3::type t) {
  return t == resp3::type::map || t == resp3::type::attribute ? 2 : 1;
}

Reply BuildAt(const std::vector<resp3::node>& nodes, std::size_t& pos) {
  if (pos >= nodes.size()) {
    throw util::StoreError("redis: truncated reply");
  }

  const auto& current = nodes[pos++];

  Reply reply;
  reply.type = current.data_type;

  if (!IsAggregateType(current.data_type)) {
    reply.value = current.value;
    return reply;
  }

  const auto count = current.aggregate_size * Multiplicity(current.data_type);
  reply.elements.reserve(std::min<std::size_t>(count, 1024));
  for (std::size_t i = 0; i < count; ++i) {
    reply.elements.push_back(BuildAt(nodes, pos));
  }
  return reply;
}

} // namespace

bool Reply::IsNull() const {
  return type == resp3::type::null;
}

bool Reply::IsAggregate() const {
  return IsAggregateType(type);
}

bool Reply::IsString() const {
  return type == resp3::type::simple_string || type == resp3::type::blob_string || type == resp3::type::verbatim_string;
}

Reply BuildReply(const std::vector<resp3::node>& nodes) {
  std::size_t pos   = 0;
  auto        reply = BuildAt(nodes, pos);
  if (pos != nodes.size()) {
    throw util::StoreError("redis: " + std::to_string(nodes.size() - pos) + " unexpected trailing reply nodes");
  }
  return reply;
}

uint64_t ReplyInteger(const Reply& reply, const char* command) {
  uint64_t value = 0;
  const auto* first = reply.value.data();
  const auto* last  = first + reply.value.size();
  if (reply.type != resp3::type::number || std::from_chars(first, last, value).ptr != last) {
    throw util::StoreError(std::string("redis: unexpected reply type for ") + command);
  }
  return value;
}

StreamRecord ParseStreamEntry(const Reply& entry) {
  if (!entry.IsAggregate() || entry.elements.size() != 2 || !entry.elements[0].IsString() ||
      !entry.elements[1].IsAggregate()) {
    throw util::StoreError("redis: malformed stream entry");
  }

  StreamRecord record;
  record.id = StreamId::Parse(entry.elements[0].value);

  const auto& fields = entry.elements[1].elements;
  for (std::size_t i = 0; i + 1 < fields.size(); i += 2) {
    if (fields[i].value == kStreamPayloadField) {
      record.payload = fields[i + 1].value;
      return record;
    }
  }
  throw util::StoreError("redis: stream entry " + record.id.ToString() + " has no payload field");
}

std::vector<StreamRecord> ParseStreamEntries(const Reply& reply, const char* command) {
  if (!reply.IsAggregate()) {
    throw util::StoreError(std::string("redis: unexpected reply type for ") + command);
  }

  std::vector<StreamRecord> records;
  records.reserve(reply.elements.size());
  for (const auto& entry : reply.elements) {
    records.push_back(ParseStreamEntry(entry));
  }
  return records;
}

std::optional<StreamRecord> ParseStreamRead(const Reply& reply) {
  if (reply.IsNull()) {
    return std::nullopt;
  }

  // map:   {key: entries}
  // array: [[key, entries]]
  const Reply* entries = nullptr;
  if (reply.type == resp3::type::map && reply.elements.size() == 2) {
    entries = &reply.elements[1];
  } else if (reply.type == resp3::type::array && reply.elements.size() == 1 && reply.elements[0].elements.size() == 2) {
    entries = &reply.elements[0].elements[1];
  } else {
    throw util::StoreError("redis: unexpected reply type for XREAD");
  }

  auto records = ParseStreamEntries(*entries, "XREAD");
  if (records.empty()) {
    return std::nullopt;
  }
  return std::move(records.front());
}

} // namespace redis_ipc::store::redis
