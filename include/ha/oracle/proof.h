#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

#include "ha/core/records.h"
#include "ha/crypto/hmac_sha256.h"

namespace ha::oracle {

inline constexpr std::string_view kProofDomain{"ha-oracle-proof-v1"};

using OracleKey = crypto::HmacTag;
using OracleProof = crypto::HmacTag;

// HMAC-SHA256(key, kProofDomain || request_id (big-endian) || payload).
OracleProof ComputeOracleProof(std::span<const uint8_t> key, core::RequestId request_id,
                               std::span<const uint8_t> payload);

// Decides whether a callback payload was produced by the decryption oracle
// for the given request.
class ProofVerifier {
 public:
  virtual ~ProofVerifier() = default;
  virtual bool Verify(core::RequestId request_id, std::span<const uint8_t> payload,
                      std::span<const uint8_t> proof) const = 0;
};

class HmacProofVerifier : public ProofVerifier {
 public:
  explicit HmacProofVerifier(const OracleKey& key) : key_(key) {}
  ~HmacProofVerifier() override;

  HmacProofVerifier(const HmacProofVerifier&) = delete;
  HmacProofVerifier& operator=(const HmacProofVerifier&) = delete;

  bool Verify(core::RequestId request_id, std::span<const uint8_t> payload,
              std::span<const uint8_t> proof) const override;

 private:
  OracleKey key_;
};

}  // namespace ha::oracle
