#pragma once

#include "redis_ipc/v1/envelope.pb.h"

#include "internal/cache/cache.hpp"
#include "internal/codec/codec.hpp"
#include "internal/factory.hpp"
#include "internal/queue/queue.hpp"
#include "internal/stream/event_stream.hpp"
#include "internal/util/errors.hpp"

namespace redis_ipc::v1 {
using ::redis_ipc::cache::Cache;
using ::redis_ipc::cache::CacheElement;
using ::redis_ipc::cache::CacheOptions;
using ::redis_ipc::codec::Codec;
using ::redis_ipc::codec::ProtobufCodec;
using ::redis_ipc::codec::ProtoJsonCodec;
using ::redis_ipc::codec::StringCodec;
using ::redis_ipc::factory::Runtime;
using ::redis_ipc::queue::QueueMessage;
using ::redis_ipc::queue::QueueOptions;
using ::redis_ipc::queue::ReadQueue;
using ::redis_ipc::queue::WriteQueue;
using ::redis_ipc::stream::EventStream;
using ::redis_ipc::stream::StreamCursor;
using ::redis_ipc::stream::StreamEvent;
using ::redis_ipc::stream::StreamOptions;
using ::redis_ipc::stream::StreamReader;
} // namespace redis_ipc::v1
