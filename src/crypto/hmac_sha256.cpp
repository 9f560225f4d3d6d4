#include "ha/crypto/hmac_sha256.h"

#include <memory>

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include "openssl_error.h"

namespace ha::crypto {

namespace {

struct MacFree {
  void operator()(EVP_MAC* mac) const noexcept { EVP_MAC_free(mac); }
  void operator()(EVP_MAC_CTX* ctx) const noexcept { EVP_MAC_CTX_free(ctx); }
};

// Fetched once; EVP_MAC objects are safe to share across threads.
EVP_MAC* HmacAlgorithm() {
  static const std::unique_ptr<EVP_MAC, MacFree> mac(EVP_MAC_fetch(nullptr, "HMAC", nullptr));
  if (!mac) {
    detail::ThrowOpenSslError("EVP_MAC_fetch(HMAC)");
  }
  return mac.get();
}

}  // namespace

HmacTag HmacSha256(std::span<const uint8_t> key, std::span<const uint8_t> message) {
  std::unique_ptr<EVP_MAC_CTX, MacFree> ctx(EVP_MAC_CTX_new(HmacAlgorithm()));
  if (!ctx) {
    detail::ThrowOpenSslError("EVP_MAC_CTX_new");
  }
  char digest[] = "SHA256";
  const OSSL_PARAM params[] = {
      OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest, 0),
      OSSL_PARAM_construct_end()};
  if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params) != 1 ||
      EVP_MAC_update(ctx.get(), message.data(), message.size()) != 1) {
    detail::ThrowOpenSslError("HMAC-SHA256");
  }
  HmacTag tag{};
  std::size_t written = 0;
  if (EVP_MAC_final(ctx.get(), tag.data(), &written, tag.size()) != 1 || written != tag.size()) {
    detail::ThrowOpenSslError("HMAC-SHA256 final");
  }
  return tag;
}

}  // namespace ha::crypto
