#include "ha/error.h"

#include <string>

namespace ha {

namespace errors {

std::string_view CodeName(int code) noexcept {
  switch (code) {
  case audit::kUnknownTarget:
    return "UnknownTarget";
  case audit::kUnknownRecord:
    return "UnknownRecord";
  case audit::kMalformedPayload:
    return "MalformedPayload";
  case audit::kUnknownHandle:
    return "UnknownHandle";
  case audit::kInvalidHandleText:
    return "InvalidHandleText";
  case audit::kAlreadyRevealed:
    return "AlreadyRevealed";
  case audit::kAlreadyVerified:
    return "AlreadyVerified";
  case audit::kRequestAlreadyOutstanding:
    return "RequestAlreadyOutstanding";
  case audit::kIdSpaceExhausted:
    return "IdSpaceExhausted";
  case audit::kNoOutstandingRequest:
    return "NoOutstandingRequest";
  case audit::kDuplicateRequestId:
    return "DuplicateRequestId";
  case audit::kUnknownRequest:
    return "UnknownRequest";
  case audit::kUnauthorized:
    return "Unauthorized";
  case audit::kInvalidProof:
    return "InvalidProof";
  case audit::kEngineUnavailable:
    return "EngineUnavailable";
  case io::kStoreKeyRejected:
    return "StoreKeyRejected";
  case io::kStoreReadFailed:
    return "StoreReadFailed";
  case io::kCorruptRecord:
    return "CorruptRecord";
  case config::kKeyFileUnreadable:
    return "KeyFileUnreadable";
  case config::kKeyFileWriteFailed:
    return "KeyFileWriteFailed";
  default:
    break;
  }
  return "Unclassified";
}

}  // namespace errors

void ThrowAuditError(ErrorDomain domain, int code, std::string_view message,
                     std::string_view detail) {
  std::string text(message);
  if (!detail.empty()) {
    text.append(": ");
    text.append(detail);
  }
  throw Error{domain, code, std::move(text)};
}

}  // namespace ha
