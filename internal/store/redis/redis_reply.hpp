#pragma once

#include <boost/redis/resp3/node.hpp>
#include <boost/redis/resp3/type.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/store/api/connection.hpp"

namespace redis_ipc::store::redis {

/*
  Reply

  Tree view of one RESP3 reply. Boost.Redis hands a generic response over
  as a flat pre-order list of nodes; the connection folds it into a Reply
  before interpreting it.
*/
struct Reply {
  boost::redis::resp3::type type = boost::redis::resp3::type::null;
  std::string               value;
  std::vector<Reply>        elements;

  bool IsNull() const;
  bool IsAggregate() const;
  bool IsString() const;
};

// Throws StoreError on a truncated or over-long node list.
Reply BuildReply(const std::vector<boost::redis::resp3::node>& nodes);

uint64_t ReplyInteger(const Reply& reply, const char* command);

// Field name holding the envelope inside a stream entry.
inline constexpr const char* kStreamPayloadField = "d";

// One "[id, [field, value, ...]]" element of XRANGE / XREVRANGE / XREAD.
StreamRecord ParseStreamEntry(const Reply& entry);

std::vector<StreamRecord> ParseStreamEntries(const Reply& reply, const char* command);

// XREAD over a single stream: null on timeout, otherwise a map (RESP3) or
// an array of [key, entries] pairs (RESP2) holding that stream's entries.
std::optional<StreamRecord> ParseStreamRead(const Reply& reply);

} // namespace redis_ipc::store::redis
