#include "ha/core/records.h"

namespace ha::core {

std::string_view ToString(RecordKind kind) noexcept {
  switch (kind) {
  case RecordKind::kHash:
    return "hash";
  case RecordKind::kGuess:
    return "guess";
  }
  return "unknown";
}

std::string_view ToString(RevealState state) noexcept {
  switch (state) {
  case RevealState::kSealed:
    return "sealed";
  case RevealState::kDecryptionRequested:
    return "decryption_requested";
  case RevealState::kRevealed:
    return "revealed";
  }
  return "unknown";
}

std::string_view ToString(VerificationState state) noexcept {
  switch (state) {
  case VerificationState::kPending:
    return "pending";
  case VerificationState::kCorrect:
    return "correct";
  case VerificationState::kIncorrect:
    return "incorrect";
  }
  return "unknown";
}

}  // namespace ha::core
