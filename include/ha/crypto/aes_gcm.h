#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace ha::crypto {

inline constexpr std::size_t kGcmKeySize = 32;
inline constexpr std::size_t kGcmNonceSize = 12;
inline constexpr std::size_t kGcmTagSize = 16;

using GcmKey = std::array<uint8_t, kGcmKeySize>;
using GcmNonce = std::array<uint8_t, kGcmNonceSize>;
using GcmTag = std::array<uint8_t, kGcmTagSize>;

struct GcmSealed {
  std::vector<uint8_t> ciphertext;
  GcmTag tag{};
};

// AES-256-GCM with |aad| bound into the tag.
GcmSealed GcmSeal(const GcmKey& key, const GcmNonce& nonce, std::span<const uint8_t> aad,
                  std::span<const uint8_t> plaintext);

// Throws AuthenticationFailureError when |tag| does not verify.
std::vector<uint8_t> GcmOpen(const GcmKey& key, const GcmNonce& nonce, std::span<const uint8_t> aad,
                             std::span<const uint8_t> ciphertext, const GcmTag& tag);

}  // namespace ha::crypto
