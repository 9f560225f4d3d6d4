#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "ha/core/encrypted_value.h"

namespace ha::core {

using RecordId = uint64_t;
using RequestId = uint64_t;

enum class RecordKind : uint8_t { kHash = 1, kGuess = 2 };

enum class RevealState : uint8_t { kSealed = 0, kDecryptionRequested = 1, kRevealed = 2 };

enum class VerificationState : uint8_t { kPending = 0, kCorrect = 1, kIncorrect = 2 };

struct PasswordHashRecord {
  RecordId id{0};
  EncryptedValueHandle encrypted_hash{};
  uint64_t submitted_at{0}; // unix seconds
  std::string owner;
  std::string description;
  RevealState reveal_state{RevealState::kSealed};
  std::optional<std::string> revealed_hash; // set iff reveal_state == kRevealed

  [[nodiscard]] bool revealed() const noexcept { return reveal_state == RevealState::kRevealed; }
};

struct GuessRecord {
  RecordId id{0};
  RecordId target_hash_id{0};
  EncryptedValueHandle encrypted_guess{};
  VerificationState verification_state{VerificationState::kPending};
  bool verification_requested{false};
  uint64_t submitted_at{0};
  std::string owner;
};

// Entry of the request ledger: which record an outstanding oracle call resolves.
struct PendingRequest {
  RequestId request_id{0};
  RecordId target_record_id{0};
  RecordKind kind{RecordKind::kHash};

  friend bool operator==(const PendingRequest&, const PendingRequest&) = default;
};

struct AuditStatistics {
  uint64_t total_hashes{0};
  uint64_t revealed_hashes{0};
  uint64_t total_guesses{0};
  uint64_t correct_guesses{0};
  uint64_t incorrect_guesses{0};
  uint64_t pending_guesses{0};
};

std::string_view ToString(RecordKind kind) noexcept;
std::string_view ToString(RevealState state) noexcept;
std::string_view ToString(VerificationState state) noexcept;

}  // namespace ha::core
