#include "ha/core/record_codec.h"

#include <algorithm>
#include <optional>
#include <string_view>

#include "ha/error.h"
#include "ha/errors.h"
#include "ha/tlv/parser.h"
#include "ha/tlv/writer.h"

namespace ha::core::codec {

namespace {

constexpr uint16_t kVersionTag = 0x7F00;

namespace hash_tag {
constexpr uint16_t kId = 0x01;
constexpr uint16_t kHandle = 0x02;
constexpr uint16_t kSubmittedAt = 0x03;
constexpr uint16_t kOwner = 0x04;
constexpr uint16_t kDescription = 0x05;
constexpr uint16_t kRevealState = 0x06;
constexpr uint16_t kRevealedHash = 0x07;
}  // namespace hash_tag

namespace guess_tag {
constexpr uint16_t kId = 0x01;
constexpr uint16_t kTarget = 0x02;
constexpr uint16_t kHandle = 0x03;
constexpr uint16_t kState = 0x04;
constexpr uint16_t kRequested = 0x05;
constexpr uint16_t kSubmittedAt = 0x06;
constexpr uint16_t kOwner = 0x07;
}  // namespace guess_tag

namespace request_tag {
constexpr uint16_t kRequestId = 0x01;
constexpr uint16_t kTarget = 0x02;
constexpr uint16_t kKind = 0x03;
}  // namespace request_tag

constexpr uint16_t kCounterTag = 0x01;

[[noreturn]] void Corrupt(std::string_view detail) {
  ThrowAuditError(ErrorDomain::IO, errors::io::kCorruptRecord, errors::msg::kCorruptRecord, detail);
}

class FieldReader {
 public:
  explicit FieldReader(std::span<const uint8_t> bytes) : parser_(bytes) {
    if (!parser_.valid()) {
      Corrupt("invalid TLV framing");
    }
    uint8_t version = 0;
    auto record = parser_.Find(kVersionTag);
    if (!record || !tlv::ReadU8(record->value, version) || version != kFormatVersion) {
      Corrupt("unsupported format version");
    }
  }

  uint64_t U64(uint16_t type, std::string_view name) const {
    uint64_t value = 0;
    auto record = Single(type, name);
    if (!tlv::ReadU64(record.value, value)) {
      Corrupt(name);
    }
    return value;
  }

  uint8_t U8(uint16_t type, std::string_view name) const {
    uint8_t value = 0;
    auto record = Single(type, name);
    if (!tlv::ReadU8(record.value, value)) {
      Corrupt(name);
    }
    return value;
  }

  std::string String(uint16_t type, std::string_view name) const {
    auto record = Single(type, name);
    return std::string(reinterpret_cast<const char*>(record.value.data()), record.value.size());
  }

  std::optional<std::string> OptionalString(uint16_t type, std::string_view name) const {
    if (parser_.Count(type) == 0) {
      return std::nullopt;
    }
    return String(type, name);
  }

  EncryptedValueHandle Handle(uint16_t type, std::string_view name) const {
    auto record = Single(type, name);
    if (record.value.size() != EncryptedValueHandle::kSize) {
      Corrupt(name);
    }
    EncryptedValueHandle::Bytes bytes{};
    std::copy(record.value.begin(), record.value.end(), bytes.begin());
    return EncryptedValueHandle(bytes);
  }

 private:
  tlv::Record Single(uint16_t type, std::string_view name) const {
    if (parser_.Count(type) != 1) {
      Corrupt(name);
    }
    return *parser_.Find(type);
  }

  tlv::Parser parser_;
};

tlv::Writer NewWriter() {
  tlv::Writer writer;
  writer.AppendU8(kVersionTag, kFormatVersion);
  return writer;
}

}  // namespace

std::string HashKey(RecordId id) {
  return std::string(kHashKeyPrefix) + std::to_string(id);
}

std::string GuessKey(RecordId id) {
  return std::string(kGuessKeyPrefix) + std::to_string(id);
}

std::string RequestKey(RequestId id) {
  return std::string(kRequestKeyPrefix) + std::to_string(id);
}

std::vector<uint8_t> EncodeHashRecord(const PasswordHashRecord& record) {
  auto writer = NewWriter();
  writer.AppendU64(hash_tag::kId, record.id)
      .Append(hash_tag::kHandle, record.encrypted_hash.AsSpan())
      .AppendU64(hash_tag::kSubmittedAt, record.submitted_at)
      .AppendString(hash_tag::kOwner, record.owner)
      .AppendString(hash_tag::kDescription, record.description)
      .AppendU8(hash_tag::kRevealState, static_cast<uint8_t>(record.reveal_state));
  if (record.revealed_hash) {
    writer.AppendString(hash_tag::kRevealedHash, *record.revealed_hash);
  }
  return writer.Take();
}

PasswordHashRecord DecodeHashRecord(std::span<const uint8_t> bytes) {
  FieldReader reader(bytes);
  PasswordHashRecord record;
  record.id = reader.U64(hash_tag::kId, "hash id");
  record.encrypted_hash = reader.Handle(hash_tag::kHandle, "hash handle");
  record.submitted_at = reader.U64(hash_tag::kSubmittedAt, "hash timestamp");
  record.owner = reader.String(hash_tag::kOwner, "hash owner");
  record.description = reader.String(hash_tag::kDescription, "hash description");
  const uint8_t state = reader.U8(hash_tag::kRevealState, "reveal state");
  if (state > static_cast<uint8_t>(RevealState::kRevealed)) {
    Corrupt("reveal state out of range");
  }
  record.reveal_state = static_cast<RevealState>(state);
  record.revealed_hash = reader.OptionalString(hash_tag::kRevealedHash, "revealed hash");
  if (record.revealed_hash.has_value() != record.revealed()) {
    Corrupt("revealed hash inconsistent with reveal state");
  }
  return record;
}

std::vector<uint8_t> EncodeGuessRecord(const GuessRecord& record) {
  auto writer = NewWriter();
  writer.AppendU64(guess_tag::kId, record.id)
      .AppendU64(guess_tag::kTarget, record.target_hash_id)
      .Append(guess_tag::kHandle, record.encrypted_guess.AsSpan())
      .AppendU8(guess_tag::kState, static_cast<uint8_t>(record.verification_state))
      .AppendU8(guess_tag::kRequested, record.verification_requested ? 1 : 0)
      .AppendU64(guess_tag::kSubmittedAt, record.submitted_at)
      .AppendString(guess_tag::kOwner, record.owner);
  return writer.Take();
}

GuessRecord DecodeGuessRecord(std::span<const uint8_t> bytes) {
  FieldReader reader(bytes);
  GuessRecord record;
  record.id = reader.U64(guess_tag::kId, "guess id");
  record.target_hash_id = reader.U64(guess_tag::kTarget, "guess target");
  record.encrypted_guess = reader.Handle(guess_tag::kHandle, "guess handle");
  const uint8_t state = reader.U8(guess_tag::kState, "verification state");
  if (state > static_cast<uint8_t>(VerificationState::kIncorrect)) {
    Corrupt("verification state out of range");
  }
  record.verification_state = static_cast<VerificationState>(state);
  const uint8_t requested = reader.U8(guess_tag::kRequested, "verification requested");
  if (requested > 1) {
    Corrupt("verification requested flag out of range");
  }
  record.verification_requested = requested == 1;
  if (record.verification_requested && record.verification_state != VerificationState::kPending) {
    Corrupt("verified guess with outstanding request");
  }
  record.submitted_at = reader.U64(guess_tag::kSubmittedAt, "guess timestamp");
  record.owner = reader.String(guess_tag::kOwner, "guess owner");
  return record;
}

std::vector<uint8_t> EncodePendingRequest(const PendingRequest& request) {
  auto writer = NewWriter();
  writer.AppendU64(request_tag::kRequestId, request.request_id)
      .AppendU64(request_tag::kTarget, request.target_record_id)
      .AppendU8(request_tag::kKind, static_cast<uint8_t>(request.kind));
  return writer.Take();
}

PendingRequest DecodePendingRequest(std::span<const uint8_t> bytes) {
  FieldReader reader(bytes);
  PendingRequest request;
  request.request_id = reader.U64(request_tag::kRequestId, "request id");
  request.target_record_id = reader.U64(request_tag::kTarget, "request target");
  const uint8_t kind = reader.U8(request_tag::kKind, "request kind");
  if (kind != static_cast<uint8_t>(RecordKind::kHash) &&
      kind != static_cast<uint8_t>(RecordKind::kGuess)) {
    Corrupt("request kind out of range");
  }
  request.kind = static_cast<RecordKind>(kind);
  return request;
}

std::vector<uint8_t> EncodeCounter(uint64_t value) {
  auto writer = NewWriter();
  writer.AppendU64(kCounterTag, value);
  return writer.Take();
}

uint64_t DecodeCounter(std::span<const uint8_t> bytes) {
  FieldReader reader(bytes);
  return reader.U64(kCounterTag, "counter");
}

}  // namespace ha::core::codec
