#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace ha::crypto {

inline constexpr std::size_t kHmacSha256Size = 32;
using HmacTag = std::array<uint8_t, kHmacSha256Size>;

HmacTag HmacSha256(std::span<const uint8_t> key, std::span<const uint8_t> message);

}  // namespace ha::crypto
