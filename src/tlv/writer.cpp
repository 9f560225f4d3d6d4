#include "ha/tlv/writer.h"

#include <cstring>
#include <limits>

#include "ha/common.h"
#include "ha/error.h"

namespace ha::tlv {

Writer& Writer::Append(uint16_t type, std::span<const uint8_t> value) {
  if (value.size() > std::numeric_limits<uint16_t>::max()) {
    throw Error{ErrorDomain::Validation, 0, "TLV value exceeds 65535 bytes"};
  }
  const uint16_t type_le = ha::ToLittleEndian16(type);
  const uint16_t length_le = ha::ToLittleEndian16(static_cast<uint16_t>(value.size()));
  const auto type_bytes = ha::AsBytesConst(type_le);
  const auto length_bytes = ha::AsBytesConst(length_le);
  buffer_.insert(buffer_.end(), type_bytes.begin(), type_bytes.end());
  buffer_.insert(buffer_.end(), length_bytes.begin(), length_bytes.end());
  buffer_.insert(buffer_.end(), value.begin(), value.end());
  return *this;
}

Writer& Writer::AppendString(uint16_t type, std::string_view value) {
  return Append(type, ha::AsBytesConst(value));
}

Writer& Writer::AppendU64(uint16_t type, uint64_t value) {
  const uint64_t value_le = ha::ToLittleEndian64(value);
  return Append(type, ha::AsBytesConst(value_le));
}

Writer& Writer::AppendU8(uint16_t type, uint8_t value) {
  return Append(type, std::span<const uint8_t>(&value, 1));
}

bool ReadU64(std::span<const uint8_t> value, uint64_t& out) noexcept {
  if (value.size() != sizeof(uint64_t)) {
    return false;
  }
  uint64_t value_le = 0;
  std::memcpy(&value_le, value.data(), sizeof(value_le));
  out = ha::FromLittleEndian64(value_le);
  return true;
}

bool ReadU8(std::span<const uint8_t> value, uint8_t& out) noexcept {
  if (value.size() != 1) {
    return false;
  }
  out = value[0];
  return true;
}

}  // namespace ha::tlv
