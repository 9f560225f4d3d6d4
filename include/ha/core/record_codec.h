#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "ha/core/records.h"

namespace ha::core::codec {

inline constexpr uint8_t kFormatVersion = 1;

inline constexpr std::string_view kHashKeyPrefix{"hash_"};
inline constexpr std::string_view kGuessKeyPrefix{"guess_"};
inline constexpr std::string_view kRequestKeyPrefix{"request_"};
inline constexpr std::string_view kNextIdKey{"meta_next_id"};

std::string HashKey(RecordId id);
std::string GuessKey(RecordId id);
std::string RequestKey(RequestId id);

std::vector<uint8_t> EncodeHashRecord(const PasswordHashRecord& record);
std::vector<uint8_t> EncodeGuessRecord(const GuessRecord& record);
std::vector<uint8_t> EncodePendingRequest(const PendingRequest& request);
std::vector<uint8_t> EncodeCounter(uint64_t value);

// Decoders throw ha::Error (IO, kCorruptRecord) on any structural problem or
// on a state combination the invariants forbid.
PasswordHashRecord DecodeHashRecord(std::span<const uint8_t> bytes);
GuessRecord DecodeGuessRecord(std::span<const uint8_t> bytes);
PendingRequest DecodePendingRequest(std::span<const uint8_t> bytes);
uint64_t DecodeCounter(std::span<const uint8_t> bytes);

}  // namespace ha::core::codec
