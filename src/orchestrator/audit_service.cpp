#include "ha/orchestrator/audit_service.h"

#include <algorithm>
#include <array>
#include <string>
#include <utility>
#include <variant>

#include "ha/error.h"
#include "ha/errors.h"
#include "ha/orchestrator/event_bus.h"

namespace ha::orchestrator {

namespace {

std::string Num(uint64_t value) {
  return std::to_string(value);
}

void PublishProtocolError(std::string_view event_id, core::RequestId request_id, const Error& error) {
  Event event{};
  event.category = error.domain == ErrorDomain::Security ? EventCategory::kSecurity : EventCategory::kDiagnostics;
  event.severity = error.domain == ErrorDomain::Protocol || error.domain == ErrorDomain::State
                       ? EventSeverity::kError
                       : EventSeverity::kWarning;
  event.event_id = std::string(event_id);
  event.message = error.what();
  event.fields.emplace_back("request_id", Num(request_id), FieldPrivacy::kPublic, true);
  event.fields.emplace_back("error", std::string(errors::CodeName(error.code)));
  EventBus::Instance().Publish(event);
}

void PublishRollback(std::string_view kind, core::RecordId record_id, const Error& cause) {
  Event event{};
  event.category = EventCategory::kDiagnostics;
  event.severity = EventSeverity::kWarning;
  event.event_id = "decryption_request_rolled_back";
  event.message = cause.what();
  event.fields.emplace_back("kind", std::string(kind));
  event.fields.emplace_back("record_id", Num(record_id), FieldPrivacy::kPublic, true);
  event.fields.emplace_back("error", std::string(errors::CodeName(cause.code)));
  EventBus::Instance().Publish(event);
}

void PublishRollbackFailure(core::RecordId record_id, const Error& failure) {
  Event event{};
  event.category = EventCategory::kDiagnostics;
  event.severity = EventSeverity::kCritical;
  event.event_id = "rollback_failed";
  event.message = failure.what();
  event.fields.emplace_back("record_id", Num(record_id), FieldPrivacy::kPublic, true);
  EventBus::Instance().Publish(event);
}

void PublishRestoreFailure(const core::PendingRequest& consumed, const Error& failure) {
  Event event{};
  event.category = EventCategory::kDiagnostics;
  event.severity = EventSeverity::kCritical;
  event.event_id = "callback_restore_failed";
  event.message = failure.what();
  event.fields.emplace_back("request_id", Num(consumed.request_id), FieldPrivacy::kPublic, true);
  event.fields.emplace_back("record_id", Num(consumed.target_record_id), FieldPrivacy::kPublic, true);
  EventBus::Instance().Publish(event);
}

void PublishDecryptionRequested(std::string_view kind, core::RecordId record_id, core::RequestId request_id) {
  Event event{};
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  event.event_id = "decryption_requested";
  event.message = "Decryption submitted to oracle";
  event.fields.emplace_back("kind", std::string(kind));
  event.fields.emplace_back("record_id", Num(record_id), FieldPrivacy::kPublic, true);
  event.fields.emplace_back("request_id", Num(request_id), FieldPrivacy::kPublic, true);
  EventBus::Instance().Publish(event);
}

// Runs |undo| and reports, rather than masks, a failure of the undo itself.
template <class Undo>
void RollBack(std::string_view kind, core::RecordId record_id, const Error& cause, Undo&& undo) {
  try {
    undo();
    PublishRollback(kind, record_id, cause);
  } catch (const Error& failure) {
    PublishRollbackFailure(record_id, failure);
  }
}

}  // namespace

AuditService::AuditService(core::RecordStore& store, core::RequestLedger& ledger,
                           oracle::DecryptionOracleClient& client)
    : store_(store), ledger_(ledger), client_(client) {}

core::RecordId AuditService::SubmitHash(const core::EncryptedValueHandle& encrypted_hash, const std::string& owner,
                                        const std::string& description) {
  RequireIdentity(owner);
  const auto id = store_.CreateHashRecord(encrypted_hash, owner, description);

  Event event{};
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  event.event_id = "hash_submitted";
  event.message = "Encrypted password hash stored";
  event.fields.emplace_back("hash_id", Num(id), FieldPrivacy::kPublic, true);
  event.fields.emplace_back("owner", owner, FieldPrivacy::kHash);
  EventBus::Instance().Publish(event);
  return id;
}

core::RecordId AuditService::SubmitGuess(core::RecordId target_hash_id,
                                         const core::EncryptedValueHandle& encrypted_guess,
                                         const std::string& owner) {
  RequireIdentity(owner);
  const auto id = store_.CreateGuessRecord(target_hash_id, encrypted_guess, owner);

  Event event{};
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  event.event_id = "guess_submitted";
  event.message = "Encrypted guess stored";
  event.fields.emplace_back("guess_id", Num(id), FieldPrivacy::kPublic, true);
  event.fields.emplace_back("hash_id", Num(target_hash_id), FieldPrivacy::kPublic, true);
  event.fields.emplace_back("owner", owner, FieldPrivacy::kHash);
  EventBus::Instance().Publish(event);
  return id;
}

core::RequestId AuditService::RequestHashReveal(core::RecordId hash_id, const std::string& requester) {
  auto record = store_.GetHash(hash_id);
  if (!record) {
    ThrowAuditError(ErrorDomain::Validation, errors::audit::kUnknownRecord, errors::msg::kUnknownRecord,
                    Num(hash_id));
  }
  if (requester.empty() || requester != record->owner) {
    ThrowAuditError(ErrorDomain::Security, errors::audit::kUnauthorized, errors::msg::kUnauthorized,
                    "hash " + Num(hash_id));
  }

  store_.MarkDecryptionRequested(hash_id);
  core::RequestId request_id = 0;
  try {
    const std::array<core::EncryptedValueHandle, 1> handles{record->encrypted_hash};
    request_id = client_.RequestDecryption(handles);
    // Published before Register so no callback event can precede it.
    PublishDecryptionRequested("hash", hash_id, request_id);
    ledger_.Register(request_id, hash_id, core::RecordKind::kHash);
  } catch (const Error& error) {
    if (error.code == errors::audit::kDuplicateRequestId) {
      PublishProtocolError("oracle_submission_rejected", request_id, error);
    }
    RollBack("hash", hash_id, error, [&] { store_.RollbackDecryptionRequest(hash_id); });
    throw;
  }

  return request_id;
}

core::RequestId AuditService::RequestGuessVerification(core::RecordId guess_id, const std::string& requester) {
  auto guess = store_.GetGuess(guess_id);
  if (!guess) {
    ThrowAuditError(ErrorDomain::Validation, errors::audit::kUnknownRecord, errors::msg::kUnknownRecord,
                    Num(guess_id));
  }
  if (requester.empty() || requester != guess->owner) {
    ThrowAuditError(ErrorDomain::Security, errors::audit::kUnauthorized, errors::msg::kUnauthorized,
                    "guess " + Num(guess_id));
  }
  auto target = store_.GetHash(guess->target_hash_id);
  if (!target) {
    ThrowAuditError(ErrorDomain::Validation, errors::audit::kUnknownTarget, errors::msg::kUnknownTarget,
                    Num(guess->target_hash_id));
  }

  store_.MarkVerificationRequested(guess_id);
  core::RequestId request_id = 0;
  try {
    // Only the encrypted equality bit is ever decrypted, never the guess or the hash.
    const auto is_match = client_.RequestEquality(guess->encrypted_guess, target->encrypted_hash);
    const std::array<core::EncryptedValueHandle, 1> handles{is_match};
    request_id = client_.RequestDecryption(handles);
    PublishDecryptionRequested("guess", guess_id, request_id);
    ledger_.Register(request_id, guess_id, core::RecordKind::kGuess);
  } catch (const Error& error) {
    if (error.code == errors::audit::kDuplicateRequestId) {
      PublishProtocolError("oracle_submission_rejected", request_id, error);
    }
    RollBack("guess", guess_id, error, [&] { store_.RollbackVerificationRequest(guess_id); });
    throw;
  }

  return request_id;
}

core::PendingRequest AuditService::HandleOracleCallback(core::RequestId request_id,
                                                        std::span<const uint8_t> payload,
                                                        std::span<const uint8_t> proof) {
  oracle::DecodedResult decoded;
  try {
    decoded = client_.OnCallback(request_id, payload, proof);
  } catch (const Error& error) {
    PublishProtocolError("oracle_callback_rejected", request_id, error);
    throw;
  }

  Event event{};
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  try {
    if (decoded.kind == core::RecordKind::kHash) {
      store_.ApplyRevealedHash(decoded.target_record_id, std::get<std::string>(std::move(decoded.value)));
      event.event_id = "hash_revealed";
      event.message = "Password hash revealed to owner";
      event.fields.emplace_back("hash_id", Num(decoded.target_record_id), FieldPrivacy::kPublic, true);
    } else {
      const bool is_match = std::get<bool>(decoded.value);
      store_.ApplyGuessResult(decoded.target_record_id, is_match);
      event.event_id = "guess_verified";
      event.message = "Guess verified against encrypted hash";
      event.fields.emplace_back("guess_id", Num(decoded.target_record_id), FieldPrivacy::kPublic, true);
      event.fields.emplace_back("result", is_match ? "correct" : "incorrect");
    }
  } catch (const Error& error) {
    PublishProtocolError("oracle_callback_rejected", request_id, error);
    if (RestorePendingRequest({request_id, decoded.target_record_id, decoded.kind})) {
      Error retry = error;
      retry.retryability = Retryability::kRetryable;
      throw retry;
    }
    throw;
  }
  event.fields.emplace_back("request_id", Num(request_id), FieldPrivacy::kPublic, true);
  EventBus::Instance().Publish(event);
  return core::PendingRequest{request_id, decoded.target_record_id, decoded.kind};
}

std::optional<core::PasswordHashRecord> AuditService::GetHash(core::RecordId id) const {
  return store_.GetHash(id);
}

std::optional<core::GuessRecord> AuditService::GetGuess(core::RecordId id) const {
  return store_.GetGuess(id);
}

std::vector<core::PasswordHashRecord> AuditService::ListHashes() const {
  auto hashes = store_.ListHashes();
  std::sort(hashes.begin(), hashes.end(), [](const auto& a, const auto& b) {
    if (a.submitted_at != b.submitted_at) {
      return a.submitted_at > b.submitted_at;
    }
    return a.id > b.id;
  });
  return hashes;
}

std::vector<core::GuessRecord> AuditService::ListGuesses() const {
  return store_.ListGuesses();
}

std::vector<core::GuessRecord> AuditService::GuessesForHash(core::RecordId hash_id) const {
  if (!store_.GetHash(hash_id)) {
    ThrowAuditError(ErrorDomain::Validation, errors::audit::kUnknownRecord, errors::msg::kUnknownRecord,
                    Num(hash_id));
  }
  return store_.GuessesForHash(hash_id);
}

core::AuditStatistics AuditService::Statistics() const {
  return store_.Statistics();
}

bool AuditService::IsAvailable() const {
  return client_.IsAvailable();
}

bool AuditService::RestorePendingRequest(const core::PendingRequest& consumed) {
  try {
    bool awaiting = false;
    if (consumed.kind == core::RecordKind::kHash) {
      const auto hash = store_.GetHash(consumed.target_record_id);
      awaiting = hash && hash->reveal_state == core::RevealState::kDecryptionRequested;
    } else {
      const auto guess = store_.GetGuess(consumed.target_record_id);
      awaiting = guess && guess->verification_requested &&
                 guess->verification_state == core::VerificationState::kPending;
    }
    if (!awaiting) {
      return false;
    }
    ledger_.Register(consumed.request_id, consumed.target_record_id, consumed.kind);
  } catch (const Error& failure) {
    PublishRestoreFailure(consumed, failure);
    return false;
  }
  Event event{};
  event.category = EventCategory::kDiagnostics;
  event.severity = EventSeverity::kWarning;
  event.event_id = "oracle_callback_requeued";
  event.message = "Callback left pending for redelivery";
  event.fields.emplace_back("request_id", Num(consumed.request_id), FieldPrivacy::kPublic, true);
  event.fields.emplace_back("record_id", Num(consumed.target_record_id), FieldPrivacy::kPublic, true);
  EventBus::Instance().Publish(event);
  return true;
}

void AuditService::RequireIdentity(const std::string& identity) const {
  if (identity.empty()) {
    ThrowAuditError(ErrorDomain::Security, errors::audit::kUnauthorized, errors::msg::kUnauthorized,
                    "empty identity");
  }
}

}  // namespace ha::orchestrator
