#include "ha/core/record_codec.h"
#include "ha/error.h"
#include "ha/oracle/payload.h"

#include <cstddef>
#include <cstdint>
#include <span>

// Oracle callback payloads and stored records both arrive from outside the
// process; neither decoder may crash on arbitrary bytes.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  if (data == nullptr) {
    return 0;
  }
  std::span<const uint8_t> bytes(data, size);
  if (auto text = ha::oracle::DecodeHashPayload(bytes)) {
    if (!ha::oracle::IsValidHashText(*text)) {
      __builtin_trap();
    }
  }
  (void)ha::oracle::DecodeBooleanPayload(bytes);
  try {
    (void)ha::core::codec::DecodeHashRecord(bytes);
  } catch (const ha::Error&) {
  }
  try {
    (void)ha::core::codec::DecodeGuessRecord(bytes);
  } catch (const ha::Error&) {
  }
  try {
    (void)ha::core::codec::DecodePendingRequest(bytes);
  } catch (const ha::Error&) {
  }
  return 0;
}
