#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace ha::tlv {

class Writer {
 public:
  Writer& Append(uint16_t type, std::span<const uint8_t> value);
  Writer& AppendString(uint16_t type, std::string_view value);
  Writer& AppendU64(uint16_t type, uint64_t value);
  Writer& AppendU8(uint16_t type, uint8_t value);

  [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept { return buffer_; }
  std::vector<uint8_t> Take() noexcept { return std::move(buffer_); }

 private:
  std::vector<uint8_t> buffer_;
};

// Little-endian fixed width decode helpers for record values.
bool ReadU64(std::span<const uint8_t> value, uint64_t& out) noexcept;
bool ReadU8(std::span<const uint8_t> value, uint8_t& out) noexcept;

}  // namespace ha::tlv
