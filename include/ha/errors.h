#pragma once

#include <string_view>

namespace ha::errors::msg {
// Centralized message catalog
inline constexpr std::string_view kUnknownTarget{"Target hash record does not exist"};
inline constexpr std::string_view kUnknownRecord{"Record does not exist"};
inline constexpr std::string_view kAlreadyRevealed{"Hash record already revealed"};
inline constexpr std::string_view kNotAwaitingReveal{"Hash record has no outstanding decryption request"};
inline constexpr std::string_view kAlreadyVerified{"Guess record already verified"};
inline constexpr std::string_view kRequestAlreadyOutstanding{"Decryption request already outstanding for record"};
inline constexpr std::string_view kNoOutstandingRequest{"No outstanding request to roll back"};
inline constexpr std::string_view kIdSpaceExhausted{"Record identifier space exhausted"};
inline constexpr std::string_view kDuplicateRequestId{"Oracle request identifier already registered"};
inline constexpr std::string_view kUnknownRequest{"Oracle callback for unregistered request"};
inline constexpr std::string_view kInvalidProof{"Oracle decryption proof rejected"};
inline constexpr std::string_view kMalformedPayload{"Oracle cleartext payload malformed"};
inline constexpr std::string_view kUnauthorized{"Requester is not the record owner"};
inline constexpr std::string_view kEngineUnavailable{"Encryption engine unavailable"};
inline constexpr std::string_view kEngineSubmissionFailed{"Encryption engine rejected submission"};
inline constexpr std::string_view kInvalidHashText{"Hash text must be 1..1024 bytes of UTF-8 without NUL"};
inline constexpr std::string_view kMixedValueTypes{"Equality operands hold different value types"};
inline constexpr std::string_view kUnknownHandle{"Encrypted value handle not known to engine"};
inline constexpr std::string_view kEmptyHandleList{"Decryption request without handles"};
inline constexpr std::string_view kInvalidHandleText{"Encrypted value handle must be 64 hex characters"};
inline constexpr std::string_view kStoreKeyRejected{"Store key contains unsupported characters"};
inline constexpr std::string_view kStoreReadFailed{"Failed to read store entry"};
inline constexpr std::string_view kCorruptRecord{"Persisted record is corrupt"};
inline constexpr std::string_view kKeyFileUnreadable{"Engine key file unreadable"};
inline constexpr std::string_view kKeyFileWriteFailed{"Engine key file could not be created"};
}  // namespace ha::errors::msg
