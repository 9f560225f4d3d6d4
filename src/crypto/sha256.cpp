#include "ha/crypto/sha256.h"

#include <openssl/evp.h>

#include "openssl_error.h"

namespace ha::crypto {

Sha256Digest Sha256(std::span<const uint8_t> data) {
  Sha256Digest digest{};
  unsigned int written = 0;
  if (EVP_Digest(data.data(), data.size(), digest.data(), &written, EVP_sha256(), nullptr) != 1 ||
      written != digest.size()) {
    detail::ThrowOpenSslError("EVP_Digest(SHA-256)");
  }
  return digest;
}

}  // namespace ha::crypto
