#include "ha/tlv/parser.h"

#include <algorithm>
#include <cstring>

#include "ha/common.h"

namespace ha::tlv {

Parser::Parser(std::span<const uint8_t> buffer, std::size_t max_records, std::size_t max_payload) {
  std::size_t offset = 0;
  std::size_t count = 0;
  while ((buffer.size() - offset) >= sizeof(uint16_t) * 2) {
    if (count >= max_records) {
      valid_ = false;
      return;
    }

    uint16_t type_le = 0;
    uint16_t length_le = 0;
    std::memcpy(&type_le, buffer.data() + offset, sizeof(type_le));
    std::memcpy(&length_le, buffer.data() + offset + sizeof(type_le), sizeof(length_le));

    const uint16_t type = ha::FromLittleEndian16(type_le);
    const std::size_t length = static_cast<std::size_t>(ha::FromLittleEndian16(length_le));

    if (length > max_payload) {
      valid_ = false;
      return;
    }

    offset += sizeof(uint16_t) * 2;
    if (offset > buffer.size() || (buffer.size() - offset) < length) {
      valid_ = false;
      return;
    }

    auto payload = buffer.subspan(offset, length);
    records_.push_back(Record{type, payload});

    offset += length;
    ++count;
  }

  valid_ = offset == buffer.size();
  consumed_ = offset;
}

std::optional<Record> Parser::Find(uint16_t type) const noexcept {
  auto it = std::find_if(records_.begin(), records_.end(),
                         [type](const Record& record) { return record.type == type; });
  if (it == records_.end()) {
    return std::nullopt;
  }
  return *it;
}

std::size_t Parser::Count(uint16_t type) const noexcept {
  return static_cast<std::size_t>(std::count_if(
      records_.begin(), records_.end(), [type](const Record& record) { return record.type == type; }));
}

}  // namespace ha::tlv
