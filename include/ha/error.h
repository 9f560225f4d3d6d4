#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ha {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Dependency = 0x06,
    State = 0x07,
    Protocol = 0x08,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // platform error numbers. Codes inside the reserved range are stable across
  // releases.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Dependency:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Protocol:
      return 0x0800;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace audit {
      inline constexpr int kUnknownTarget = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kUnknownRecord = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kMalformedPayload = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kUnknownHandle = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kInvalidHandleText = Make(ErrorDomain::Validation, 0x05);
      inline constexpr int kAlreadyRevealed = Make(ErrorDomain::State, 0x01);
      inline constexpr int kAlreadyVerified = Make(ErrorDomain::State, 0x02);
      inline constexpr int kRequestAlreadyOutstanding = Make(ErrorDomain::State, 0x03);
      inline constexpr int kIdSpaceExhausted = Make(ErrorDomain::State, 0x04);
      inline constexpr int kNoOutstandingRequest = Make(ErrorDomain::State, 0x05);
      inline constexpr int kDuplicateRequestId = Make(ErrorDomain::Protocol, 0x01);
      inline constexpr int kUnknownRequest = Make(ErrorDomain::Protocol, 0x02);
      inline constexpr int kUnauthorized = Make(ErrorDomain::Security, 0x01);
      inline constexpr int kInvalidProof = Make(ErrorDomain::Security, 0x02);
      inline constexpr int kEngineUnavailable = Make(ErrorDomain::Dependency, 0x01);
    } // namespace audit

    namespace io {
      inline constexpr int kStoreKeyRejected = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kStoreReadFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kCorruptRecord = Make(ErrorDomain::IO, 0x03);
    } // namespace io

    namespace config {
      inline constexpr int kKeyFileUnreadable = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kKeyFileWriteFailed = Make(ErrorDomain::Config, 0x02);
    } // namespace config

    // Symbolic name for an error code, used by the CLI and in log fields.
    std::string_view CodeName(int code) noexcept;
  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };
  struct AuthenticationFailureError : public std::runtime_error {
    explicit AuthenticationFailureError(const std::string& msg) : std::runtime_error(msg) {}
  };

  // Throws ha::Error with the catalog message for |code| and an optional detail suffix.
  [[noreturn]] void ThrowAuditError(ErrorDomain domain, int code, std::string_view message,
                                    std::string_view detail = {});
} // namespace ha
