#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ha/core/record_store.h"
#include "ha/core/request_ledger.h"
#include "ha/oracle/decryption_oracle_client.h"

namespace ha::orchestrator {

// Public surface of the audit core. Composes the record store, the request
// ledger and the oracle client; every state change is announced on the
// EventBus.
//
// Hash lifecycle:  Sealed -> DecryptionRequested -> Revealed
// Guess lifecycle: Pending -> Correct | Incorrect
//
// Request operations transition the record before submitting to the engine
// and undo that transition if submission or registration fails, so a failed
// call leaves no trace.
class AuditService {
 public:
  AuditService(core::RecordStore& store, core::RequestLedger& ledger, oracle::DecryptionOracleClient& client);

  core::RecordId SubmitHash(const core::EncryptedValueHandle& encrypted_hash, const std::string& owner,
                            const std::string& description = {});
  core::RecordId SubmitGuess(core::RecordId target_hash_id, const core::EncryptedValueHandle& encrypted_guess,
                             const std::string& owner);

  // Only the hash owner may reveal it. Returns the oracle request id.
  core::RequestId RequestHashReveal(core::RecordId hash_id, const std::string& requester);
  // Only the guess owner may verify it. Returns the oracle request id.
  core::RequestId RequestGuessVerification(core::RecordId guess_id, const std::string& requester);

  // Applies one oracle callback exactly once. Returns the ledger entry it
  // consumed. If the result cannot be stored while the record still awaits
  // it, the entry is re-registered and the error is rethrown as kRetryable;
  // the same callback may then be delivered again.
  core::PendingRequest HandleOracleCallback(core::RequestId request_id, std::span<const uint8_t> payload,
                                            std::span<const uint8_t> proof);

  [[nodiscard]] std::optional<core::PasswordHashRecord> GetHash(core::RecordId id) const;
  [[nodiscard]] std::optional<core::GuessRecord> GetGuess(core::RecordId id) const;
  // Newest first.
  [[nodiscard]] std::vector<core::PasswordHashRecord> ListHashes() const;
  [[nodiscard]] std::vector<core::GuessRecord> ListGuesses() const;
  // Throws ha::Error (Validation, kUnknownRecord) for an unknown hash id.
  [[nodiscard]] std::vector<core::GuessRecord> GuessesForHash(core::RecordId hash_id) const;
  [[nodiscard]] core::AuditStatistics Statistics() const;
  [[nodiscard]] bool IsAvailable() const;

 private:
  void RequireIdentity(const std::string& identity) const;
  // Re-registers |consumed| if its record still awaits the result.
  bool RestorePendingRequest(const core::PendingRequest& consumed);

  core::RecordStore& store_;
  core::RequestLedger& ledger_;
  oracle::DecryptionOracleClient& client_;
};

}  // namespace ha::orchestrator
