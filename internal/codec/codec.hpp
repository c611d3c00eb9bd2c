#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/util/errors.hpp"

namespace redis_ipc::codec {

/*
  Serialization of user payloads.

  Every structure is constructed with an explicit codec; nothing is inferred
  from T. Encode failures throw util::SerializationError, decode failures
  util::DecodeError.
*/
template <typename T>
class Codec {
 public:
  virtual ~Codec() = default;

  virtual std::string Encode(const T& value) const       = 0;
  virtual T           Decode(std::string_view data) const = 0;
};

template <typename T>
using CodecPtr = std::shared_ptr<const Codec<T>>;

// Raw bytes, no framing.
class StringCodec final : public Codec<std::string> {
 public:
  std::string Encode(const std::string& value) const override {
    return value;
  }

  std::string Decode(std::string_view data) const override {
    return std::string(data);
  }
};

// Protobuf binary wire format.
template <typename M>
class ProtobufCodec final : public Codec<M> {
  static_assert(std::is_base_of_v<google::protobuf::Message, M>, "ProtobufCodec requires a protobuf message type");

 public:
  std::string Encode(const M& value) const override {
    std::string out;
    if (!value.SerializeToString(&out)) {
      throw util::SerializationError("failed to serialize " + std::string(value.GetTypeName()));
    }
    return out;
  }

  M Decode(std::string_view data) const override {
    M value;
    if (!value.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
      throw util::DecodeError("failed to parse " + std::string(value.GetTypeName()));
    }
    return value;
  }
};

// Protobuf JSON mapping; readable in redis-cli at the cost of size.
template <typename M>
class ProtoJsonCodec final : public Codec<M> {
  static_assert(std::is_base_of_v<google::protobuf::Message, M>, "ProtoJsonCodec requires a protobuf message type");

 public:
  std::string Encode(const M& value) const override {
    std::string out;
    auto        status = google::protobuf::util::MessageToJsonString(value, &out);
    if (!status.ok()) {
      throw util::SerializationError("failed to serialize " + std::string(value.GetTypeName()) + " to JSON: " +
                                     std::string(status.message()));
    }
    return out;
  }

  M Decode(std::string_view data) const override {
    M                                        value;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    auto status = google::protobuf::util::JsonStringToMessage(std::string(data), &value, options);
    if (!status.ok()) {
      throw util::DecodeError("failed to parse " + std::string(value.GetTypeName()) + " from JSON: " +
                              std::string(status.message()));
    }
    return value;
  }
};

} // namespace redis_ipc::codec
