#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace redis_ipc::util {

/*
  UUID helpers

  Random RFC4122 v4 ids used for queue message ids and default client
  identities.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Shorthand for ToString(GenerateUUID()).
std::string GenerateUUIDString();

} // namespace redis_ipc::util
