#include "ha/core/record_codec.h"
#include "ha/core/record_store.h"
#include "ha/core/request_ledger.h"
#include "ha/error.h"
#include "ha/oracle/decryption_oracle_client.h"
#include "ha/oracle/local_engine.h"
#include "ha/oracle/proof.h"
#include "ha/orchestrator/audit_service.h"
#include "ha/orchestrator/config.h"
#include "ha/orchestrator/event_bus.h"
#include "ha/storage/kv_store.h"

#include <array>
#include <cerrno>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "test_support.h"

namespace {

using ha::core::RevealState;
using ha::core::VerificationState;
using ha::testing::ExpectError;
namespace audit = ha::errors::audit;
namespace fs = std::filesystem;

ha::oracle::LocalEngine::MasterSecret TestSecret() {
  ha::oracle::LocalEngine::MasterSecret secret{};
  for (size_t i = 0; i < secret.size(); ++i) {
    secret[i] = static_cast<uint8_t>(0xA0 ^ i);
  }
  return secret;
}

// Everything a process holds open against one data directory.
struct Process {
  explicit Process(const fs::path& root)
      : records(root / "records"), engine_store(root / "engine"), engine(TestSecret(), &engine_store),
        store(&records), ledger(&records), verifier(engine.oracle_key()), client(engine, ledger, verifier),
        service(store, ledger, client) {
    engine.Load();
    store.Load();
    ledger.Load();
  }

  ha::storage::FileKeyValueStore records;
  ha::storage::FileKeyValueStore engine_store;
  ha::oracle::LocalEngine engine;
  ha::core::RecordStore store;
  ha::core::RequestLedger ledger;
  ha::oracle::HmacProofVerifier verifier;
  ha::oracle::DecryptionOracleClient client;
  ha::orchestrator::AuditService service;
};

void TestFlowSurvivesRestart() {
  ha::testing::TempDir dir("ha_persist_flow_");
  ha::core::RecordId hash_id = 0;
  ha::core::RecordId guess_id = 0;
  ha::core::RequestId reveal_request = 0;
  {
    Process p(dir.path());
    hash_id = p.service.SubmitHash(p.engine.Encrypt("abc123"), "alice", "legacy ldap");
    guess_id = p.service.SubmitGuess(hash_id, p.engine.Encrypt("abc123"), "bob");
    reveal_request = p.service.RequestHashReveal(hash_id, "alice");
    p.service.RequestGuessVerification(guess_id, "bob");
    assert(p.engine.PendingCount() == 2);
  }

  Process p(dir.path());
  const auto hash = p.service.GetHash(hash_id);
  assert(hash && hash->owner == "alice" && hash->description == "legacy ldap");
  assert(hash->reveal_state == RevealState::kDecryptionRequested);
  assert(p.service.GetGuess(guess_id)->verification_requested);
  assert(p.ledger.Size() == 2);
  assert(p.ledger.Lookup(reveal_request)->target_record_id == hash_id);
  assert(p.engine.PendingCount() == 2);

  const auto delivered = p.engine.DeliverPending([&](const ha::oracle::OracleCallback& cb) {
    p.service.HandleOracleCallback(cb.request_id, cb.payload, cb.proof);
  });
  assert(delivered == 2);
  assert(p.service.GetHash(hash_id)->revealed_hash == std::optional<std::string>("abc123"));
  assert(p.service.GetGuess(guess_id)->verification_state == VerificationState::kCorrect);
  assert(p.ledger.Size() == 0);

  // Ids keep increasing after a restart.
  const auto next = p.service.SubmitHash(p.engine.Encrypt("def"), "alice");
  assert(next == guess_id + 1);
}

void TestResolvedRequestStaysResolved() {
  ha::testing::TempDir dir("ha_persist_resolved_");
  ha::oracle::OracleCallback saved;
  {
    Process p(dir.path());
    const auto id = p.service.SubmitHash(p.engine.Encrypt("abc123"), "alice");
    p.service.RequestHashReveal(id, "alice");
    auto callbacks = p.engine.TakePendingCallbacks();
    assert(callbacks.size() == 1);
    saved = callbacks.front();
    p.service.HandleOracleCallback(saved.request_id, saved.payload, saved.proof);
  }
  Process p(dir.path());
  assert(p.ledger.Size() == 0);
  assert(p.engine.PendingCount() == 0);
  ExpectError([&] { p.service.HandleOracleCallback(saved.request_id, saved.payload, saved.proof); },
              audit::kUnknownRequest);
  // The engine does not reuse the consumed request id.
  const auto id = p.service.SubmitHash(p.engine.Encrypt("xyz"), "alice");
  assert(p.service.RequestHashReveal(id, "alice") > saved.request_id);
}

void TestCorruptRecordDetected() {
  ha::testing::TempDir dir("ha_persist_corrupt_");
  {
    Process p(dir.path());
    p.service.SubmitHash(p.engine.Encrypt("abc"), "alice");
  }
  ha::storage::FileKeyValueStore records(dir.path() / "records");
  auto bytes = records.Get(ha::core::codec::HashKey(1));
  assert(bytes && bytes->size() > 4);
  bytes->resize(bytes->size() - 3);
  records.Put(ha::core::codec::HashKey(1), *bytes);

  ha::core::RecordStore store(&records);
  ExpectError([&] { store.Load(); }, ha::errors::io::kCorruptRecord);

  // A record filed under the wrong key is rejected too.
  ha::core::PasswordHashRecord stray;
  stray.id = 5;
  stray.owner = "alice";
  records.Put(ha::core::codec::HashKey(1), ha::core::codec::EncodeHashRecord(stray));
  ExpectError([&] { store.Load(); }, ha::errors::io::kCorruptRecord);
}

void TestGuessWithoutTargetRejected() {
  ha::storage::MemoryKeyValueStore kv;
  ha::core::GuessRecord orphan;
  orphan.id = 2;
  orphan.target_hash_id = 1;
  orphan.owner = "bob";
  kv.Put(ha::core::codec::GuessKey(2), ha::core::codec::EncodeGuessRecord(orphan));
  ha::core::RecordStore store(&kv);
  ExpectError([&] { store.Load(); }, ha::errors::io::kCorruptRecord);
}

void TestTamperedCiphertextSkipped() {
  ha::testing::TempDir dir("ha_persist_cipher_");
  std::array<ha::core::EncryptedValueHandle, 3> handles;
  {
    ha::storage::FileKeyValueStore kv(dir.path());
    ha::oracle::LocalEngine engine(TestSecret(), &kv);
    handles = {engine.Encrypt("aaa111"), engine.Encrypt("bbb222"), engine.Encrypt("ccc333")};
    for (const auto& handle : handles) {
      const std::array<ha::core::EncryptedValueHandle, 1> one{handle};
      engine.RequestDecryption(one);
    }
  }
  ha::storage::FileKeyValueStore kv(dir.path());
  const auto key = "ct_" + handles[1].ToHex();
  auto bytes = kv.Get(key);
  assert(bytes);
  bytes->back() ^= 0x01;
  kv.Put(key, *bytes);

  ha::oracle::LocalEngine engine(TestSecret(), &kv);
  assert(engine.Load() == 3);
  assert(engine.PendingCount() == 3);
  const auto callbacks = engine.TakePendingCallbacks();
  assert(callbacks.size() == 2);
  assert(callbacks[0].request_id == 1 && callbacks[1].request_id == 3);
  assert(engine.PendingCount() == 0);
  assert(kv.Keys("engine_job_").empty());

  const auto failed = engine.TakeFailedJobs();
  assert(failed.size() == 1 && failed.front().request_id == 2);
  assert(!failed.front().reason.empty());
  assert(engine.TakeFailedJobs().empty());

  // Opening the tampered value directly still reports corruption.
  ExpectError([&] { engine.Equal(handles[1], handles[0]); }, ha::errors::io::kCorruptRecord);
}

// A sink failure leaves that job and the later ones queued, also across a restart.
void TestDeliveryStopsAtFailingSink() {
  ha::testing::TempDir dir("ha_persist_sink_");
  {
    ha::storage::FileKeyValueStore kv(dir.path());
    ha::oracle::LocalEngine engine(TestSecret(), &kv);
    for (const char* text : {"one", "two", "three"}) {
      const std::array<ha::core::EncryptedValueHandle, 1> handles{engine.Encrypt(text)};
      engine.RequestDecryption(handles);
    }
    std::vector<ha::core::RequestId> seen;
    bool threw = false;
    try {
      engine.DeliverPending([&](const ha::oracle::OracleCallback& cb) {
        if (cb.request_id == 2) {
          throw ha::Error(ha::ErrorDomain::IO, EIO, "sink unavailable");
        }
        seen.push_back(cb.request_id);
      });
    } catch (const ha::Error& error) {
      threw = error.code == EIO;
    }
    assert(threw);
    assert(seen == std::vector<ha::core::RequestId>{1});
    assert(engine.PendingCount() == 2);
    assert(kv.Keys("engine_job_").size() == 2);
  }
  ha::storage::FileKeyValueStore kv(dir.path());
  ha::oracle::LocalEngine engine(TestSecret(), &kv);
  engine.Load();
  std::vector<ha::core::RequestId> seen;
  const auto delivered = engine.DeliverPending([&](const ha::oracle::OracleCallback& cb) {
    seen.push_back(cb.request_id);
  });
  assert(delivered == 2);
  assert((seen == std::vector<ha::core::RequestId>{2, 3}));
  assert(engine.PendingCount() == 0);
}

// Fails every write under |prefix| while armed.
class FailingWriteStore : public ha::storage::KeyValueStore {
public:
  explicit FailingWriteStore(std::string prefix) : prefix_(std::move(prefix)) {}

  void Arm(bool armed) { armed_ = armed; }

  std::optional<std::vector<uint8_t>> Get(std::string_view key) const override { return inner_.Get(key); }
  void Put(std::string_view key, std::span<const uint8_t> value) override {
    if (armed_ && key.rfind(prefix_, 0) == 0) {
      throw ha::Error(ha::ErrorDomain::IO, ENOSPC, "write failed: " + std::string(key));
    }
    inner_.Put(key, value);
  }
  bool Erase(std::string_view key) override { return inner_.Erase(key); }
  std::vector<std::string> Keys(std::string_view prefix) const override { return inner_.Keys(prefix); }

private:
  ha::storage::MemoryKeyValueStore inner_;
  std::string prefix_;
  bool armed_{false};
};

void TestCallbackRedeliveredAfterStoreFailure() {
  FailingWriteStore records("hash_");
  ha::oracle::LocalEngine engine(TestSecret());
  ha::core::RecordStore store(&records);
  ha::core::RequestLedger ledger(&records);
  ha::oracle::HmacProofVerifier verifier(engine.oracle_key());
  ha::oracle::DecryptionOracleClient client(engine, ledger, verifier);
  ha::orchestrator::AuditService service(store, ledger, client);

  const auto hash_id = service.SubmitHash(engine.Encrypt("abc123"), "alice");
  const auto request_id = service.RequestHashReveal(hash_id, "alice");
  const auto callbacks = engine.TakePendingCallbacks();
  assert(callbacks.size() == 1);
  const auto& cb = callbacks.front();

  records.Arm(true);
  bool retryable = false;
  try {
    service.HandleOracleCallback(cb.request_id, cb.payload, cb.proof);
  } catch (const ha::Error& error) {
    assert(error.domain == ha::ErrorDomain::IO && error.code == ENOSPC);
    retryable = error.retryability == ha::Retryability::kRetryable;
  }
  assert(retryable);
  assert(service.GetHash(hash_id)->reveal_state == RevealState::kDecryptionRequested);
  assert(ledger.Lookup(request_id) && ledger.Lookup(request_id)->target_record_id == hash_id);
  assert(records.Get(ha::core::codec::RequestKey(request_id)));

  records.Arm(false);
  const auto consumed = service.HandleOracleCallback(cb.request_id, cb.payload, cb.proof);
  assert(consumed.target_record_id == hash_id);
  assert(service.GetHash(hash_id)->revealed_hash == std::optional<std::string>("abc123"));
  assert(ledger.Size() == 0);
  ExpectError([&] { service.HandleOracleCallback(cb.request_id, cb.payload, cb.proof); }, audit::kUnknownRequest);
}

// A result that arrives for a record no longer awaiting it is not re-queued.
void TestTerminalRecordNotRequeued() {
  ha::storage::MemoryKeyValueStore records;
  ha::oracle::LocalEngine engine(TestSecret());
  ha::core::RecordStore store(&records);
  ha::core::RequestLedger ledger(&records);
  ha::oracle::HmacProofVerifier verifier(engine.oracle_key());
  ha::oracle::DecryptionOracleClient client(engine, ledger, verifier);
  ha::orchestrator::AuditService service(store, ledger, client);

  const auto hash_id = service.SubmitHash(engine.Encrypt("abc123"), "alice");
  service.RequestHashReveal(hash_id, "alice");
  const auto cb = engine.TakePendingCallbacks().front();
  store.ApplyRevealedHash(hash_id, "abc123");

  bool fatal = false;
  try {
    service.HandleOracleCallback(cb.request_id, cb.payload, cb.proof);
  } catch (const ha::Error& error) {
    assert(error.code == audit::kAlreadyRevealed);
    fatal = error.retryability == ha::Retryability::kFatal;
  }
  assert(fatal);
  assert(ledger.Size() == 0);
}

} // namespace

int main() {
  ha::testing::TempDir logs("ha_persist_logs_");
  ha::orchestrator::ConfigureDefaultJsonLogger({logs.path(), ha::orchestrator::kDefaultAuditLogMaxBytes});

  TestFlowSurvivesRestart();
  TestResolvedRequestStaysResolved();
  TestCorruptRecordDetected();
  TestGuessWithoutTargetRejected();
  TestTamperedCiphertextSkipped();
  TestDeliveryStopsAtFailingSink();
  TestCallbackRedeliveredAfterStoreFailure();
  TestTerminalRecordNotRequeued();
  std::cout << "persistence tests passed" << std::endl;
  return 0;
}
