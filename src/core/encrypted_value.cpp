#include "ha/core/encrypted_value.h"

#include <algorithm>

#include "ha/common.h"
#include "ha/error.h"
#include "ha/errors.h"

namespace ha::core {

EncryptedValueHandle EncryptedValueHandle::FromHex(std::string_view text) {
  auto parsed = TryFromHex(text);
  if (!parsed) {
    ThrowAuditError(ErrorDomain::Validation, errors::audit::kInvalidHandleText,
                    errors::msg::kInvalidHandleText);
  }
  return *parsed;
}

std::optional<EncryptedValueHandle> EncryptedValueHandle::TryFromHex(std::string_view text) noexcept {
  Bytes bytes{};
  if (!HexDecode(text, std::span<uint8_t>(bytes.data(), bytes.size()))) {
    return std::nullopt;
  }
  return EncryptedValueHandle(bytes);
}

std::string EncryptedValueHandle::ToHex() const {
  return HexEncode(AsSpan());
}

bool EncryptedValueHandle::empty() const noexcept {
  return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

}  // namespace ha::core
