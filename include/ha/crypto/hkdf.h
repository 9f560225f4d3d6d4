#pragma once

#include <array>
#include <span>

#include "ha/common.h"

namespace ha::crypto {

// RFC 5869 extract-and-expand to a single 32-byte key.
std::array<uint8_t, 32> HkdfSha256(std::span<const uint8_t> ikm, std::span<const uint8_t> salt,
                                   std::span<const uint8_t> info);

}  // namespace ha::crypto
