#pragma once

#include <cstdint>
#include <functional>
#include <span>
#include <string_view>
#include <vector>

#include "ha/core/encrypted_value.h"
#include "ha/core/records.h"

namespace ha::oracle {

// A decryption result as delivered by the oracle: the cleartext payload of the
// requested handles and a proof binding it to the request.
struct OracleCallback {
  core::RequestId request_id{0};
  std::vector<uint8_t> payload;
  std::vector<uint8_t> proof;
};

using CallbackSink = std::function<void(const OracleCallback&)>;

// Homomorphic engine seen from the audit core. Handles are opaque; the engine
// alone can operate on or decrypt what they reference.
class EncryptionEngine {
 public:
  virtual ~EncryptionEngine() = default;

  // Encrypts a hash string. Throws ha::Error (Validation) for text the
  // cleartext payload format cannot carry.
  virtual core::EncryptedValueHandle Encrypt(std::string_view hash_text) = 0;

  // Encrypted equality predicate of two values of the same type.
  virtual core::EncryptedValueHandle Equal(const core::EncryptedValueHandle& lhs,
                                           const core::EncryptedValueHandle& rhs) = 0;

  // Queues an asynchronous decryption and returns its request id without
  // waiting for the result. Throws ha::Error (Dependency) when the
  // submission is refused.
  virtual core::RequestId RequestDecryption(std::span<const core::EncryptedValueHandle> handles) = 0;

  [[nodiscard]] virtual bool IsAvailable() const = 0;
};

}  // namespace ha::oracle
