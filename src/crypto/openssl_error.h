#pragma once

#include <string>

#include <openssl/err.h>

#include "ha/error.h"

namespace ha::crypto::detail {

// Drains the OpenSSL error queue into a Crypto-domain ha::Error.
[[noreturn]] inline void ThrowOpenSslError(const char* operation) {
  std::string message(operation);
  const unsigned long code = ERR_get_error();
  if (code != 0) {
    char reason[256] = {0};
    ERR_error_string_n(code, reason, sizeof(reason));
    message += ": ";
    message += reason;
  } else {
    message += " failed";
  }
  ERR_clear_error();
  throw Error(ErrorDomain::Crypto, 0, message, static_cast<int>(ERR_GET_REASON(code)));
}

}  // namespace ha::crypto::detail
