#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ha::oracle {

// Cleartext payload records carried by oracle callbacks, framed as TLV.
inline constexpr uint16_t kHashPayloadType = 0x0001;
inline constexpr uint16_t kBooleanPayloadType = 0x0002;
inline constexpr std::size_t kMaxHashTextBytes = 1024;

// 1..kMaxHashTextBytes of well-formed UTF-8 containing no NUL.
bool IsValidHashText(std::string_view text) noexcept;

void AppendHashPayload(std::vector<uint8_t>& out, std::string_view hash_text);
void AppendBooleanPayload(std::vector<uint8_t>& out, bool value);

// Each decoder accepts a payload holding exactly one record of its type and
// nothing else.
std::optional<std::string> DecodeHashPayload(std::span<const uint8_t> payload);
std::optional<bool> DecodeBooleanPayload(std::span<const uint8_t> payload);

}  // namespace ha::oracle
