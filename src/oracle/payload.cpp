#include "ha/oracle/payload.h"

#include "ha/tlv/parser.h"
#include "ha/tlv/writer.h"

namespace ha::oracle {

namespace {

bool IsWellFormedUtf8(std::string_view text) noexcept {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<uint8_t>(text[i]);
    std::size_t extra = 0;
    uint32_t min_code = 0;
    uint32_t code = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      extra = 1;
      min_code = 0x80;
      code = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      extra = 2;
      min_code = 0x800;
      code = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      extra = 3;
      min_code = 0x10000;
      code = lead & 0x07;
    } else {
      return false;
    }
    if (i + extra >= text.size()) {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto cont = static_cast<uint8_t>(text[i + k]);
      if ((cont & 0xC0) != 0x80) {
        return false;
      }
      code = (code << 6) | (cont & 0x3F);
    }
    if (code < min_code || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

std::optional<tlv::Record> SingleRecord(const tlv::Parser& parser, uint16_t type) {
  if (!parser.valid() || parser.size() != 1) {
    return std::nullopt;
  }
  return parser.Find(type);
}

}  // namespace

bool IsValidHashText(std::string_view text) noexcept {
  if (text.empty() || text.size() > kMaxHashTextBytes) {
    return false;
  }
  if (text.find('\0') != std::string_view::npos) {
    return false;
  }
  return IsWellFormedUtf8(text);
}

void AppendHashPayload(std::vector<uint8_t>& out, std::string_view hash_text) {
  tlv::Writer writer;
  writer.AppendString(kHashPayloadType, hash_text);
  const auto& bytes = writer.bytes();
  out.insert(out.end(), bytes.begin(), bytes.end());
}

void AppendBooleanPayload(std::vector<uint8_t>& out, bool value) {
  tlv::Writer writer;
  writer.AppendU8(kBooleanPayloadType, value ? 1 : 0);
  const auto& bytes = writer.bytes();
  out.insert(out.end(), bytes.begin(), bytes.end());
}

std::optional<std::string> DecodeHashPayload(std::span<const uint8_t> payload) {
  tlv::Parser parser(payload);
  auto record = SingleRecord(parser, kHashPayloadType);
  if (!record) {
    return std::nullopt;
  }
  std::string text(reinterpret_cast<const char*>(record->value.data()), record->value.size());
  if (!IsValidHashText(text)) {
    return std::nullopt;
  }
  return text;
}

std::optional<bool> DecodeBooleanPayload(std::span<const uint8_t> payload) {
  tlv::Parser parser(payload);
  auto record = SingleRecord(parser, kBooleanPayloadType);
  if (!record) {
    return std::nullopt;
  }
  uint8_t value = 0;
  if (!tlv::ReadU8(record->value, value) || value > 1) {
    return std::nullopt;
  }
  return value == 1;
}

}  // namespace ha::oracle
