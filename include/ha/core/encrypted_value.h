#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace ha::core {

// Opaque reference to ciphertext held by the encryption engine. Carries no
// plaintext and exposes no arithmetic; only the engine can interpret it.
class EncryptedValueHandle {
 public:
  static constexpr size_t kSize = 32;
  using Bytes = std::array<uint8_t, kSize>;

  EncryptedValueHandle() = default;
  explicit EncryptedValueHandle(const Bytes& bytes) noexcept : bytes_(bytes) {}

  // Parses the 64-character hex form. Throws ha::Error (Validation) on bad input.
  static EncryptedValueHandle FromHex(std::string_view text);
  static std::optional<EncryptedValueHandle> TryFromHex(std::string_view text) noexcept;

  [[nodiscard]] std::string ToHex() const;
  [[nodiscard]] const Bytes& bytes() const noexcept { return bytes_; }
  [[nodiscard]] std::span<const uint8_t> AsSpan() const noexcept { return {bytes_.data(), bytes_.size()}; }
  [[nodiscard]] bool empty() const noexcept;

  friend bool operator==(const EncryptedValueHandle&, const EncryptedValueHandle&) = default;
  friend auto operator<=>(const EncryptedValueHandle&, const EncryptedValueHandle&) = default;

 private:
  Bytes bytes_{};
};

}  // namespace ha::core
