#pragma once

#include <span>
#include <string>
#include <variant>

#include "ha/core/records.h"
#include "ha/core/request_ledger.h"
#include "ha/oracle/encryption_engine.h"
#include "ha/oracle/proof.h"

namespace ha::oracle {

struct DecodedResult {
  core::RequestId request_id{0};
  core::RecordId target_record_id{0};
  core::RecordKind kind{core::RecordKind::kHash};
  // Revealed hash text for kHash, equality outcome for kGuess.
  std::variant<std::string, bool> value;
};

// Submits decryption requests and turns oracle callbacks into decoded,
// proof-checked results. Never touches records; applying a result is the
// caller's job.
class DecryptionOracleClient {
 public:
  DecryptionOracleClient(EncryptionEngine& engine, core::RequestLedger& ledger,
                         const ProofVerifier& verifier);

  // Returns the engine's request id as soon as the engine accepts the job.
  // The caller registers it in the ledger before any callback is handled.
  core::RequestId RequestDecryption(std::span<const core::EncryptedValueHandle> handles);

  core::EncryptedValueHandle RequestEquality(const core::EncryptedValueHandle& lhs,
                                             const core::EncryptedValueHandle& rhs);

  // Order of checks: proof (kInvalidProof), registration (kUnknownRequest),
  // payload shape for the registered kind (kMalformedPayload), then the
  // consuming resolve. The ledger entry survives the first three failures.
  DecodedResult OnCallback(core::RequestId request_id, std::span<const uint8_t> payload,
                           std::span<const uint8_t> proof);

  [[nodiscard]] bool IsAvailable() const { return engine_.IsAvailable(); }

 private:
  EncryptionEngine& engine_;
  core::RequestLedger& ledger_;
  const ProofVerifier& verifier_;
};

}  // namespace ha::oracle
