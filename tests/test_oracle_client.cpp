#include "ha/core/request_ledger.h"
#include "ha/error.h"
#include "ha/oracle/decryption_oracle_client.h"
#include "ha/oracle/local_engine.h"
#include "ha/oracle/payload.h"
#include "ha/oracle/proof.h"
#include "ha/tlv/writer.h"

#include <array>
#include <cassert>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "test_support.h"

namespace {

using ha::core::EncryptedValueHandle;
using ha::core::RecordKind;
using ha::core::RequestLedger;
using ha::oracle::DecryptionOracleClient;
using ha::oracle::HmacProofVerifier;
using ha::oracle::LocalEngine;
using ha::testing::ExpectError;
namespace audit = ha::errors::audit;

LocalEngine::MasterSecret TestSecret() {
  LocalEngine::MasterSecret secret{};
  for (size_t i = 0; i < secret.size(); ++i) {
    secret[i] = static_cast<uint8_t>(i * 7 + 1);
  }
  return secret;
}

std::vector<uint8_t> HashPayload(std::string_view text) {
  std::vector<uint8_t> out;
  ha::oracle::AppendHashPayload(out, text);
  return out;
}

void TestPayloadDecoding() {
  using ha::oracle::DecodeBooleanPayload;
  using ha::oracle::DecodeHashPayload;

  assert(DecodeHashPayload(HashPayload("abc123")) == std::optional<std::string>("abc123"));
  assert(DecodeHashPayload(HashPayload("p\xC3\xA4ss")) == std::optional<std::string>("p\xC3\xA4ss"));

  std::vector<uint8_t> truth;
  ha::oracle::AppendBooleanPayload(truth, true);
  assert(DecodeBooleanPayload(truth) == std::optional<bool>(true));
  assert(!DecodeHashPayload(truth));

  auto doubled = HashPayload("abc");
  ha::oracle::AppendHashPayload(doubled, "def");
  assert(!DecodeHashPayload(doubled));

  ha::tlv::Writer empty_hash;
  empty_hash.AppendString(ha::oracle::kHashPayloadType, "");
  assert(!DecodeHashPayload(empty_hash.bytes()));

  ha::tlv::Writer with_nul;
  with_nul.AppendString(ha::oracle::kHashPayloadType, std::string_view("ab\0cd", 5));
  assert(!DecodeHashPayload(with_nul.bytes()));

  ha::tlv::Writer bad_utf8;
  bad_utf8.AppendString(ha::oracle::kHashPayloadType, "\xC3\x28");
  assert(!DecodeHashPayload(bad_utf8.bytes()));

  ha::tlv::Writer too_long;
  too_long.AppendString(ha::oracle::kHashPayloadType, std::string(ha::oracle::kMaxHashTextBytes + 1, 'a'));
  assert(!DecodeHashPayload(too_long.bytes()));

  ha::tlv::Writer bool_two;
  bool_two.AppendU8(ha::oracle::kBooleanPayloadType, 2);
  assert(!DecodeBooleanPayload(bool_two.bytes()));

  const std::array<uint8_t, 3> truncated{0x01, 0x00, 0x05};
  assert(!DecodeHashPayload(truncated));
  assert(!DecodeBooleanPayload(std::span<const uint8_t>()));
}

void TestProofBinding() {
  ha::oracle::OracleKey key{};
  key.fill(0x42);
  HmacProofVerifier verifier(key);
  const auto payload = HashPayload("abc123");
  const auto proof = ha::oracle::ComputeOracleProof(key, 9, payload);

  assert(verifier.Verify(9, payload, proof));
  assert(!verifier.Verify(10, payload, proof));
  assert(!verifier.Verify(9, HashPayload("abc124"), proof));
  auto flipped = proof;
  flipped[0] ^= 0x01;
  assert(!verifier.Verify(9, payload, flipped));
  assert(!verifier.Verify(9, payload, std::span<const uint8_t>(proof.data(), proof.size() - 1)));
}

void TestCallbackChecksKeepLedgerEntry() {
  LocalEngine engine(TestSecret());
  RequestLedger ledger;
  HmacProofVerifier verifier(engine.oracle_key());
  DecryptionOracleClient client(engine, ledger, verifier);

  const auto handle = engine.Encrypt("abc123");
  const std::array<EncryptedValueHandle, 1> handles{handle};
  const auto request_id = client.RequestDecryption(handles);
  ledger.Register(request_id, 1, RecordKind::kHash);

  auto callbacks = engine.TakePendingCallbacks();
  assert(callbacks.size() == 1 && callbacks[0].request_id == request_id);
  const auto& callback = callbacks[0];

  auto forged = callback.proof;
  forged.back() ^= 0x80;
  ExpectError([&] { client.OnCallback(request_id, callback.payload, forged); }, audit::kInvalidProof);
  assert(ledger.Lookup(request_id));

  // Well-signed but shaped for the wrong kind.
  std::vector<uint8_t> wrong_kind;
  ha::oracle::AppendBooleanPayload(wrong_kind, true);
  const auto wrong_proof = ha::oracle::ComputeOracleProof(engine.oracle_key(), request_id, wrong_kind);
  ExpectError([&] { client.OnCallback(request_id, wrong_kind, wrong_proof); }, audit::kMalformedPayload);
  assert(ledger.Lookup(request_id));

  const auto stray_proof = ha::oracle::ComputeOracleProof(engine.oracle_key(), 77, callback.payload);
  ExpectError([&] { client.OnCallback(77, callback.payload, stray_proof); }, audit::kUnknownRequest);

  const auto decoded = client.OnCallback(request_id, callback.payload, callback.proof);
  assert(decoded.target_record_id == 1 && decoded.kind == RecordKind::kHash);
  assert(std::get<std::string>(decoded.value) == "abc123");
  assert(!ledger.Lookup(request_id));
  ExpectError([&] { client.OnCallback(request_id, callback.payload, callback.proof); }, audit::kUnknownRequest);
}

void TestEqualityDecryptsOnlyTheBit() {
  LocalEngine engine(TestSecret());
  RequestLedger ledger;
  HmacProofVerifier verifier(engine.oracle_key());
  DecryptionOracleClient client(engine, ledger, verifier);

  const auto secret = engine.Encrypt("5f4dcc3b5aa765d61d8327deb882cf99");
  const auto right = engine.Encrypt("5f4dcc3b5aa765d61d8327deb882cf99");
  const auto wrong = engine.Encrypt("e10adc3949ba59abbe56e057f20f883e");

  const std::array<EncryptedValueHandle, 1> match{client.RequestEquality(right, secret)};
  const std::array<EncryptedValueHandle, 1> mismatch{client.RequestEquality(wrong, secret)};
  const auto match_request = client.RequestDecryption(match);
  const auto mismatch_request = client.RequestDecryption(mismatch);
  ledger.Register(match_request, 10, RecordKind::kGuess);
  ledger.Register(mismatch_request, 11, RecordKind::kGuess);

  auto callbacks = engine.TakePendingCallbacks();
  assert(callbacks.size() == 2);
  // Deliver out of submission order.
  const auto second = client.OnCallback(callbacks[1].request_id, callbacks[1].payload, callbacks[1].proof);
  const auto first = client.OnCallback(callbacks[0].request_id, callbacks[0].payload, callbacks[0].proof);
  assert(first.target_record_id == 10 && std::get<bool>(first.value));
  assert(second.target_record_id == 11 && !std::get<bool>(second.value));
  assert(!ha::oracle::DecodeHashPayload(callbacks[0].payload));
}

void TestEngineRefusals() {
  LocalEngine engine(TestSecret());
  RequestLedger ledger;
  HmacProofVerifier verifier(engine.oracle_key());
  DecryptionOracleClient client(engine, ledger, verifier);

  ExpectError([&] { engine.Encrypt(""); }, audit::kMalformedPayload);
  ExpectError([&] { client.RequestDecryption({}); }, audit::kUnknownHandle);

  EncryptedValueHandle::Bytes unknown_bytes{};
  unknown_bytes.fill(0x5A);
  const std::array<EncryptedValueHandle, 1> unknown{EncryptedValueHandle(unknown_bytes)};
  ExpectError([&] { client.RequestDecryption(unknown); }, audit::kUnknownHandle);

  const std::array<EncryptedValueHandle, 1> known{engine.Encrypt("abc")};
  engine.FailNextSubmission();
  ExpectError([&] { client.RequestDecryption(known); }, audit::kEngineUnavailable);
  assert(engine.PendingCount() == 0);
  client.RequestDecryption(known);
  assert(engine.PendingCount() == 1);

  ExpectError([&] { client.RequestEquality(known[0], engine.EncryptBoolean(true)); }, audit::kUnknownHandle);

  engine.SetAvailable(false);
  assert(!client.IsAvailable());
  ExpectError([&] { client.RequestDecryption(known); }, audit::kEngineUnavailable);
}

} // namespace

int main() {
  TestPayloadDecoding();
  TestProofBinding();
  TestCallbackChecksKeepLedgerEntry();
  TestEqualityDecryptsOnlyTheBit();
  TestEngineRefusals();
  std::cout << "oracle client tests passed" << std::endl;
  return 0;
}
