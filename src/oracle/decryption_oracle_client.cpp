#include "ha/oracle/decryption_oracle_client.h"

#include <string>
#include <utility>

#include "ha/error.h"
#include "ha/errors.h"
#include "ha/oracle/payload.h"

namespace ha::oracle {

DecryptionOracleClient::DecryptionOracleClient(EncryptionEngine& engine, core::RequestLedger& ledger,
                                               const ProofVerifier& verifier)
    : engine_(engine), ledger_(ledger), verifier_(verifier) {}

core::RequestId DecryptionOracleClient::RequestDecryption(std::span<const core::EncryptedValueHandle> handles) {
  if (handles.empty()) {
    ThrowAuditError(ErrorDomain::Validation, errors::audit::kUnknownHandle, errors::msg::kEmptyHandleList);
  }
  if (!engine_.IsAvailable()) {
    ThrowAuditError(ErrorDomain::Dependency, errors::audit::kEngineUnavailable, errors::msg::kEngineUnavailable);
  }
  return engine_.RequestDecryption(handles);
}

core::EncryptedValueHandle DecryptionOracleClient::RequestEquality(const core::EncryptedValueHandle& lhs,
                                                                   const core::EncryptedValueHandle& rhs) {
  if (!engine_.IsAvailable()) {
    ThrowAuditError(ErrorDomain::Dependency, errors::audit::kEngineUnavailable, errors::msg::kEngineUnavailable);
  }
  return engine_.Equal(lhs, rhs);
}

DecodedResult DecryptionOracleClient::OnCallback(core::RequestId request_id, std::span<const uint8_t> payload,
                                                 std::span<const uint8_t> proof) {
  if (!verifier_.Verify(request_id, payload, proof)) {
    ThrowAuditError(ErrorDomain::Security, errors::audit::kInvalidProof, errors::msg::kInvalidProof,
                    std::to_string(request_id));
  }
  auto pending = ledger_.Lookup(request_id);
  if (!pending) {
    ThrowAuditError(ErrorDomain::Protocol, errors::audit::kUnknownRequest, errors::msg::kUnknownRequest,
                    std::to_string(request_id));
  }

  DecodedResult result;
  result.request_id = request_id;
  result.target_record_id = pending->target_record_id;
  result.kind = pending->kind;
  if (pending->kind == core::RecordKind::kHash) {
    auto hash_text = DecodeHashPayload(payload);
    if (!hash_text) {
      ThrowAuditError(ErrorDomain::Validation, errors::audit::kMalformedPayload, errors::msg::kMalformedPayload,
                      "expected one hash record");
    }
    result.value = std::move(*hash_text);
  } else {
    auto is_match = DecodeBooleanPayload(payload);
    if (!is_match) {
      ThrowAuditError(ErrorDomain::Validation, errors::audit::kMalformedPayload, errors::msg::kMalformedPayload,
                      "expected one boolean record");
    }
    result.value = *is_match;
  }

  // Concurrent duplicates race here; exactly one Resolve succeeds.
  const auto resolved = ledger_.Resolve(request_id);
  if (!(resolved == *pending)) {
    ThrowAuditError(ErrorDomain::Protocol, errors::audit::kUnknownRequest, errors::msg::kUnknownRequest,
                    "ledger entry changed during callback");
  }
  return result;
}

}  // namespace ha::oracle
