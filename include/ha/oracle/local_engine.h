#pragma once

#include <array>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ha/crypto/aes_gcm.h"
#include "ha/oracle/encryption_engine.h"
#include "ha/oracle/proof.h"

namespace ha::storage {
class KeyValueStore;
}

namespace ha::oracle {

// Reference engine for tools and tests. Values are sealed with AES-256-GCM
// under a key derived from the master secret; handles are random ids. Equal
// yields a fresh sealed boolean. Decryption requests are queued and only
// produce callbacks when the owner drains them, so delivery order and timing
// stay under caller control.
class LocalEngine : public EncryptionEngine {
 public:
  static constexpr std::size_t kMasterSecretSize = 32;
  using MasterSecret = std::array<uint8_t, kMasterSecretSize>;

  // Sealed values and queued jobs are written through to |store| under
  // "ct_" and "engine_" keys.
  explicit LocalEngine(const MasterSecret& master_secret, storage::KeyValueStore* store = nullptr);

  ~LocalEngine() override;

  LocalEngine(const LocalEngine&) = delete;
  LocalEngine& operator=(const LocalEngine&) = delete;

  core::EncryptedValueHandle Encrypt(std::string_view hash_text) override;
  core::EncryptedValueHandle Equal(const core::EncryptedValueHandle& lhs,
                                   const core::EncryptedValueHandle& rhs) override;
  core::RequestId RequestDecryption(std::span<const core::EncryptedValueHandle> handles) override;
  [[nodiscard]] bool IsAvailable() const override;

  core::EncryptedValueHandle EncryptBoolean(bool value);

  // A queued job whose sealed values no longer authenticate. It is dropped
  // from the queue and the store instead of blocking the jobs behind it.
  struct FailedJob {
    core::RequestId request_id{0};
    std::string reason;
  };

  // Removes every queued job and returns its callback, in submission order.
  std::vector<OracleCallback> TakePendingCallbacks();
  // Drains the queue through |sink|. A job is removed only after |sink|
  // returns for it; if |sink| throws, that job and the ones after it stay
  // queued. Returns the number of callbacks fired.
  std::size_t DeliverPending(const CallbackSink& sink);
  [[nodiscard]] std::size_t PendingCount() const;
  // Jobs dropped since the last call.
  std::vector<FailedJob> TakeFailedJobs();

  // Key the matching HmacProofVerifier needs.
  [[nodiscard]] const OracleKey& oracle_key() const noexcept { return oracle_key_; }

  // Failure injection: the next RequestDecryption throws before queuing.
  void FailNextSubmission();
  void SetAvailable(bool available);

  // Restores sealed values, queued jobs and the request counter from the
  // backing store. Returns the number of sealed values loaded.
  std::size_t Load();

 private:
  enum class ValueType : uint8_t { kText = 1, kBoolean = 2 };

  struct SealedValue {
    ValueType type{ValueType::kText};
    crypto::GcmNonce nonce{};
    std::vector<uint8_t> ciphertext;
    crypto::GcmTag tag{};
  };

  struct Job {
    core::RequestId request_id{0};
    std::vector<core::EncryptedValueHandle> handles;
  };

  core::EncryptedValueHandle SealLocked(ValueType type, std::span<const uint8_t> plaintext);
  std::vector<uint8_t> OpenLocked(const core::EncryptedValueHandle& handle, ValueType& type) const;
  const SealedValue& FindLocked(const core::EncryptedValueHandle& handle) const;
  void PersistValueLocked(const core::EncryptedValueHandle& handle, const SealedValue& value);
  void PersistJobLocked(const Job& job);
  std::vector<OracleCallback> BuildCallbacksLocked();
  void CompleteJobLocked(core::RequestId request_id);

  mutable std::mutex mutex_;
  crypto::GcmKey seal_key_{};
  OracleKey oracle_key_{};
  std::map<core::EncryptedValueHandle, SealedValue> values_;
  std::deque<Job> jobs_;
  std::vector<FailedJob> failed_jobs_;
  core::RequestId next_request_id_{1};
  bool fail_next_submission_{false};
  bool available_{true};
  storage::KeyValueStore* store_{nullptr};
};

}  // namespace ha::oracle
