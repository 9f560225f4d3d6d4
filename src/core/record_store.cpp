#include "ha/core/record_store.h"

#include <algorithm>
#include <chrono>
#include <limits>
#include <mutex>
#include <utility>

#include "ha/core/record_codec.h"
#include "ha/error.h"
#include "ha/errors.h"
#include "ha/storage/kv_store.h"

namespace ha::core {

namespace {

uint64_t UnixNow() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                                   std::chrono::system_clock::now().time_since_epoch())
                                   .count());
}

std::string IdText(RecordId id) {
  return std::to_string(id);
}

}  // namespace

RecordStore::RecordStore(storage::KeyValueStore* store) : store_(store) {}

RecordId RecordStore::CreateHashRecord(const EncryptedValueHandle& encrypted_hash, std::string owner,
                                       std::string description) {
  std::unique_lock lock(mutex_);
  PasswordHashRecord record;
  record.id = AllocateIdLocked();
  record.encrypted_hash = encrypted_hash;
  record.submitted_at = UnixNow();
  record.owner = std::move(owner);
  record.description = std::move(description);
  PersistCounterLocked(record.id + 1);
  PersistHashLocked(record);
  next_id_.store(record.id + 1, std::memory_order_release);
  const RecordId id = record.id;
  hashes_.emplace(id, std::move(record));
  return id;
}

RecordId RecordStore::CreateGuessRecord(RecordId target_hash_id,
                                        const EncryptedValueHandle& encrypted_guess, std::string owner) {
  std::unique_lock lock(mutex_);
  if (hashes_.find(target_hash_id) == hashes_.end()) {
    ThrowAuditError(ErrorDomain::Validation, errors::audit::kUnknownTarget, errors::msg::kUnknownTarget,
                    IdText(target_hash_id));
  }
  GuessRecord record;
  record.id = AllocateIdLocked();
  record.target_hash_id = target_hash_id;
  record.encrypted_guess = encrypted_guess;
  record.submitted_at = UnixNow();
  record.owner = std::move(owner);
  PersistCounterLocked(record.id + 1);
  PersistGuessLocked(record);
  next_id_.store(record.id + 1, std::memory_order_release);
  const RecordId id = record.id;
  guesses_.emplace(id, std::move(record));
  return id;
}

void RecordStore::MarkDecryptionRequested(RecordId hash_id) {
  std::unique_lock lock(mutex_);
  auto& record = HashLocked(hash_id);
  if (record.reveal_state == RevealState::kRevealed) {
    ThrowAuditError(ErrorDomain::State, errors::audit::kAlreadyRevealed, errors::msg::kAlreadyRevealed,
                    IdText(hash_id));
  }
  if (record.reveal_state == RevealState::kDecryptionRequested) {
    ThrowAuditError(ErrorDomain::State, errors::audit::kRequestAlreadyOutstanding,
                    errors::msg::kRequestAlreadyOutstanding, IdText(hash_id));
  }
  auto updated = record;
  updated.reveal_state = RevealState::kDecryptionRequested;
  PersistHashLocked(updated);
  record = std::move(updated);
}

void RecordStore::RollbackDecryptionRequest(RecordId hash_id) {
  std::unique_lock lock(mutex_);
  auto& record = HashLocked(hash_id);
  if (record.reveal_state != RevealState::kDecryptionRequested) {
    ThrowAuditError(ErrorDomain::State, errors::audit::kNoOutstandingRequest,
                    errors::msg::kNoOutstandingRequest, IdText(hash_id));
  }
  auto updated = record;
  updated.reveal_state = RevealState::kSealed;
  PersistHashLocked(updated);
  record = std::move(updated);
}

void RecordStore::ApplyRevealedHash(RecordId hash_id, std::string plaintext_hash) {
  std::unique_lock lock(mutex_);
  auto& record = HashLocked(hash_id);
  if (record.reveal_state != RevealState::kDecryptionRequested) {
    ThrowAuditError(ErrorDomain::State, errors::audit::kAlreadyRevealed,
                    record.revealed() ? errors::msg::kAlreadyRevealed : errors::msg::kNotAwaitingReveal,
                    IdText(hash_id));
  }
  auto updated = record;
  updated.reveal_state = RevealState::kRevealed;
  updated.revealed_hash = std::move(plaintext_hash);
  PersistHashLocked(updated);
  record = std::move(updated);
}

void RecordStore::MarkVerificationRequested(RecordId guess_id) {
  std::unique_lock lock(mutex_);
  auto& record = GuessLocked(guess_id);
  if (record.verification_state != VerificationState::kPending) {
    ThrowAuditError(ErrorDomain::State, errors::audit::kAlreadyVerified, errors::msg::kAlreadyVerified,
                    IdText(guess_id));
  }
  if (record.verification_requested) {
    ThrowAuditError(ErrorDomain::State, errors::audit::kRequestAlreadyOutstanding,
                    errors::msg::kRequestAlreadyOutstanding, IdText(guess_id));
  }
  auto updated = record;
  updated.verification_requested = true;
  PersistGuessLocked(updated);
  record = std::move(updated);
}

void RecordStore::RollbackVerificationRequest(RecordId guess_id) {
  std::unique_lock lock(mutex_);
  auto& record = GuessLocked(guess_id);
  if (!record.verification_requested) {
    ThrowAuditError(ErrorDomain::State, errors::audit::kNoOutstandingRequest,
                    errors::msg::kNoOutstandingRequest, IdText(guess_id));
  }
  auto updated = record;
  updated.verification_requested = false;
  PersistGuessLocked(updated);
  record = std::move(updated);
}

void RecordStore::ApplyGuessResult(RecordId guess_id, bool is_match) {
  std::unique_lock lock(mutex_);
  auto& record = GuessLocked(guess_id);
  if (record.verification_state != VerificationState::kPending) {
    ThrowAuditError(ErrorDomain::State, errors::audit::kAlreadyVerified, errors::msg::kAlreadyVerified,
                    IdText(guess_id));
  }
  auto updated = record;
  updated.verification_state = is_match ? VerificationState::kCorrect : VerificationState::kIncorrect;
  updated.verification_requested = false;
  PersistGuessLocked(updated);
  record = std::move(updated);
}

std::optional<PasswordHashRecord> RecordStore::GetHash(RecordId id) const {
  std::shared_lock lock(mutex_);
  auto it = hashes_.find(id);
  if (it == hashes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<GuessRecord> RecordStore::GetGuess(RecordId id) const {
  std::shared_lock lock(mutex_);
  auto it = guesses_.find(id);
  if (it == guesses_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<PasswordHashRecord> RecordStore::ListHashes() const {
  std::shared_lock lock(mutex_);
  std::vector<PasswordHashRecord> result;
  result.reserve(hashes_.size());
  for (const auto& [id, record] : hashes_) {
    result.push_back(record);
  }
  return result;
}

std::vector<GuessRecord> RecordStore::ListGuesses() const {
  std::shared_lock lock(mutex_);
  std::vector<GuessRecord> result;
  result.reserve(guesses_.size());
  for (const auto& [id, record] : guesses_) {
    result.push_back(record);
  }
  return result;
}

std::vector<GuessRecord> RecordStore::GuessesForHash(RecordId hash_id) const {
  std::shared_lock lock(mutex_);
  std::vector<GuessRecord> result;
  for (const auto& [id, record] : guesses_) {
    if (record.target_hash_id == hash_id) {
      result.push_back(record);
    }
  }
  return result;
}

AuditStatistics RecordStore::Statistics() const {
  std::shared_lock lock(mutex_);
  AuditStatistics stats;
  stats.total_hashes = hashes_.size();
  stats.total_guesses = guesses_.size();
  for (const auto& [id, record] : hashes_) {
    if (record.revealed()) {
      ++stats.revealed_hashes;
    }
  }
  for (const auto& [id, record] : guesses_) {
    switch (record.verification_state) {
    case VerificationState::kPending:
      ++stats.pending_guesses;
      break;
    case VerificationState::kCorrect:
      ++stats.correct_guesses;
      break;
    case VerificationState::kIncorrect:
      ++stats.incorrect_guesses;
      break;
    }
  }
  return stats;
}

std::size_t RecordStore::Load() {
  if (!store_) {
    return 0;
  }
  std::map<RecordId, PasswordHashRecord> hashes;
  std::map<RecordId, GuessRecord> guesses;
  RecordId highest = 0;
  for (const auto& key : store_->Keys(codec::kHashKeyPrefix)) {
    auto bytes = store_->Get(key);
    if (!bytes) {
      continue;
    }
    auto record = codec::DecodeHashRecord(*bytes);
    if (key != codec::HashKey(record.id)) {
      ThrowAuditError(ErrorDomain::IO, errors::io::kCorruptRecord, errors::msg::kCorruptRecord, key);
    }
    highest = std::max(highest, record.id);
    hashes.emplace(record.id, std::move(record));
  }
  for (const auto& key : store_->Keys(codec::kGuessKeyPrefix)) {
    auto bytes = store_->Get(key);
    if (!bytes) {
      continue;
    }
    auto record = codec::DecodeGuessRecord(*bytes);
    if (key != codec::GuessKey(record.id) || hashes.find(record.target_hash_id) == hashes.end() ||
        hashes.find(record.id) != hashes.end()) {
      ThrowAuditError(ErrorDomain::IO, errors::io::kCorruptRecord, errors::msg::kCorruptRecord, key);
    }
    highest = std::max(highest, record.id);
    guesses.emplace(record.id, std::move(record));
  }

  RecordId next = highest + 1;
  if (auto counter = store_->Get(codec::kNextIdKey)) {
    const RecordId stored = codec::DecodeCounter(*counter);
    if (stored < next) {
      ThrowAuditError(ErrorDomain::IO, errors::io::kCorruptRecord, errors::msg::kCorruptRecord,
                      "id counter behind stored records");
    }
    next = stored;
  }

  std::unique_lock lock(mutex_);
  hashes_ = std::move(hashes);
  guesses_ = std::move(guesses);
  next_id_.store(next, std::memory_order_release);
  return hashes_.size() + guesses_.size();
}

void RecordStore::SetNextIdForTesting(RecordId next_id) {
  std::unique_lock lock(mutex_);
  next_id_.store(next_id, std::memory_order_release);
}

RecordId RecordStore::AllocateIdLocked() {
  const RecordId candidate = next_id_.load(std::memory_order_acquire);
  if (candidate == std::numeric_limits<RecordId>::max()) {
    ThrowAuditError(ErrorDomain::State, errors::audit::kIdSpaceExhausted, errors::msg::kIdSpaceExhausted);
  }
  return candidate;
}

PasswordHashRecord& RecordStore::HashLocked(RecordId id) {
  auto it = hashes_.find(id);
  if (it == hashes_.end()) {
    ThrowAuditError(ErrorDomain::Validation, errors::audit::kUnknownRecord, errors::msg::kUnknownRecord,
                    IdText(id));
  }
  return it->second;
}

GuessRecord& RecordStore::GuessLocked(RecordId id) {
  auto it = guesses_.find(id);
  if (it == guesses_.end()) {
    ThrowAuditError(ErrorDomain::Validation, errors::audit::kUnknownRecord, errors::msg::kUnknownRecord,
                    IdText(id));
  }
  return it->second;
}

void RecordStore::PersistHashLocked(const PasswordHashRecord& record) {
  if (!store_) {
    return;
  }
  auto bytes = codec::EncodeHashRecord(record);
  store_->Put(codec::HashKey(record.id), bytes);
}

void RecordStore::PersistGuessLocked(const GuessRecord& record) {
  if (!store_) {
    return;
  }
  auto bytes = codec::EncodeGuessRecord(record);
  store_->Put(codec::GuessKey(record.id), bytes);
}

void RecordStore::PersistCounterLocked(RecordId next_id) {
  if (!store_) {
    return;
  }
  auto bytes = codec::EncodeCounter(next_id);
  store_->Put(codec::kNextIdKey, bytes);
}

}  // namespace ha::core
