#pragma once

#include <atomic>
#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "ha/core/records.h"

namespace ha::storage {
class KeyValueStore;
}

namespace ha::core {

// Sole owner of hash and guess records. Every mutation validates and applies
// its state transition under one exclusive lock; reads share it.
class RecordStore {
 public:
  RecordStore() = default;
  // Records and the id counter are written through to |store|.
  explicit RecordStore(storage::KeyValueStore* store);

  RecordStore(const RecordStore&) = delete;
  RecordStore& operator=(const RecordStore&) = delete;

  RecordId CreateHashRecord(const EncryptedValueHandle& encrypted_hash, std::string owner,
                            std::string description = {});
  RecordId CreateGuessRecord(RecordId target_hash_id, const EncryptedValueHandle& encrypted_guess,
                             std::string owner);

  void MarkDecryptionRequested(RecordId hash_id);
  void RollbackDecryptionRequest(RecordId hash_id);
  void ApplyRevealedHash(RecordId hash_id, std::string plaintext_hash);

  void MarkVerificationRequested(RecordId guess_id);
  void RollbackVerificationRequest(RecordId guess_id);
  void ApplyGuessResult(RecordId guess_id, bool is_match);

  [[nodiscard]] std::optional<PasswordHashRecord> GetHash(RecordId id) const;
  [[nodiscard]] std::optional<GuessRecord> GetGuess(RecordId id) const;
  [[nodiscard]] std::vector<PasswordHashRecord> ListHashes() const;
  [[nodiscard]] std::vector<GuessRecord> ListGuesses() const;
  [[nodiscard]] std::vector<GuessRecord> GuessesForHash(RecordId hash_id) const;
  [[nodiscard]] AuditStatistics Statistics() const;

  // Replaces in-memory state with the backing store contents. Returns the
  // number of records loaded.
  std::size_t Load();

  // Test seam: positions the id counter so exhaustion can be exercised.
  void SetNextIdForTesting(RecordId next_id);

 private:
  RecordId AllocateIdLocked();
  PasswordHashRecord& HashLocked(RecordId id);
  GuessRecord& GuessLocked(RecordId id);
  void PersistHashLocked(const PasswordHashRecord& record);
  void PersistGuessLocked(const GuessRecord& record);
  void PersistCounterLocked(RecordId next_id);

  mutable std::shared_mutex mutex_;
  std::map<RecordId, PasswordHashRecord> hashes_;
  std::map<RecordId, GuessRecord> guesses_;
  std::atomic<RecordId> next_id_{1};
  storage::KeyValueStore* store_{nullptr};
};

}  // namespace ha::core
