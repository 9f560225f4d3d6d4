#include "ha/oracle/proof.h"

#include <vector>

#include "ha/common.h"
#include "ha/crypto/ct.h"
#include "ha/security/zeroizer.h"

namespace ha::oracle {

OracleProof ComputeOracleProof(std::span<const uint8_t> key, core::RequestId request_id,
                               std::span<const uint8_t> payload) {
  const uint64_t request_be = ha::ToBigEndian(request_id);
  const auto domain = ha::AsBytesConst(kProofDomain);
  const auto request_bytes = ha::AsBytesConst(request_be);
  std::vector<uint8_t> message;
  message.reserve(domain.size() + request_bytes.size() + payload.size());
  message.insert(message.end(), domain.begin(), domain.end());
  message.insert(message.end(), request_bytes.begin(), request_bytes.end());
  message.insert(message.end(), payload.begin(), payload.end());
  return crypto::HmacSha256(key, std::span<const uint8_t>(message.data(), message.size()));
}

HmacProofVerifier::~HmacProofVerifier() {
  security::Zeroizer::Wipe(key_);
}

bool HmacProofVerifier::Verify(core::RequestId request_id, std::span<const uint8_t> payload,
                               std::span<const uint8_t> proof) const {
  const auto expected = ComputeOracleProof(std::span<const uint8_t>(key_.data(), key_.size()),
                                           request_id, payload);
  return crypto::ct::CompareEqual(std::span<const uint8_t>(expected.data(), expected.size()), proof);
}

}  // namespace ha::oracle
