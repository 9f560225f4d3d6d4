#pragma once
#include <array>
#include <cstdint>
#include <span>

namespace ha::crypto {

using Sha256Digest = std::array<uint8_t, 32>;

Sha256Digest Sha256(std::span<const uint8_t> data);

}  // namespace ha::crypto
