#include "ha/crypto/aes_gcm.h"

#include <memory>

#include <openssl/evp.h>

#include "ha/error.h"
#include "openssl_error.h"

namespace ha::crypto {

namespace {

struct CipherCtxFree {
  void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxFree>;

// Sets up an AES-256-GCM context with a 96-bit nonce and feeds the AAD.
CipherCtx StartGcm(bool encrypt, const GcmKey& key, const GcmNonce& nonce,
                   std::span<const uint8_t> aad) {
  CipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    detail::ThrowOpenSslError("EVP_CIPHER_CTX_new");
  }
  const int enc = encrypt ? 1 : 0;
  if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr, enc) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(nonce.size()), nullptr) != 1 ||
      EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc) != 1) {
    detail::ThrowOpenSslError("AES-256-GCM init");
  }
  if (!aad.empty()) {
    int ignored = 0;
    if (EVP_CipherUpdate(ctx.get(), nullptr, &ignored, aad.data(),
                         static_cast<int>(aad.size())) != 1) {
      detail::ThrowOpenSslError("AES-256-GCM aad");
    }
  }
  return ctx;
}

// Runs |input| through |ctx|; |out| must hold input.size() bytes.
std::size_t UpdateGcm(EVP_CIPHER_CTX* ctx, std::span<const uint8_t> input, uint8_t* out) {
  if (input.empty()) {
    return 0;
  }
  int written = 0;
  if (EVP_CipherUpdate(ctx, out, &written, input.data(), static_cast<int>(input.size())) != 1) {
    detail::ThrowOpenSslError("AES-256-GCM update");
  }
  return static_cast<std::size_t>(written);
}

}  // namespace

GcmSealed GcmSeal(const GcmKey& key, const GcmNonce& nonce, std::span<const uint8_t> aad,
                  std::span<const uint8_t> plaintext) {
  auto ctx = StartGcm(true, key, nonce, aad);

  GcmSealed result;
  // GCM is a stream mode; the extra block only keeps data() valid for empty input.
  result.ciphertext.resize(plaintext.size() + kGcmTagSize);
  std::size_t total = UpdateGcm(ctx.get(), plaintext, result.ciphertext.data());
  int tail = 0;
  if (EVP_CipherFinal_ex(ctx.get(), result.ciphertext.data() + total, &tail) != 1) {
    detail::ThrowOpenSslError("AES-256-GCM final");
  }
  total += static_cast<std::size_t>(tail);
  result.ciphertext.resize(total);

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          static_cast<int>(result.tag.size()), result.tag.data()) != 1) {
    detail::ThrowOpenSslError("AES-256-GCM get tag");
  }
  return result;
}

std::vector<uint8_t> GcmOpen(const GcmKey& key, const GcmNonce& nonce, std::span<const uint8_t> aad,
                             std::span<const uint8_t> ciphertext, const GcmTag& tag) {
  auto ctx = StartGcm(false, key, nonce, aad);

  std::vector<uint8_t> plaintext(ciphertext.size() + kGcmTagSize);
  std::size_t total = UpdateGcm(ctx.get(), ciphertext, plaintext.data());

  // OpenSSL takes the expected tag through a non-const pointer.
  GcmTag expected = tag;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          static_cast<int>(expected.size()), expected.data()) != 1) {
    detail::ThrowOpenSslError("AES-256-GCM set tag");
  }

  int tail = 0;
  if (EVP_CipherFinal_ex(ctx.get(), plaintext.data() + total, &tail) <= 0) {
    ERR_clear_error();
    throw AuthenticationFailureError("AES-256-GCM tag mismatch");
  }
  total += static_cast<std::size_t>(tail);
  plaintext.resize(total);
  return plaintext;
}

}  // namespace ha::crypto
