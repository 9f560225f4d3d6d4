#include "ha/core/record_codec.h"
#include "ha/core/request_ledger.h"
#include "ha/error.h"
#include "ha/storage/kv_store.h"

#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "test_support.h"

namespace {

using ha::core::PendingRequest;
using ha::core::RecordKind;
using ha::core::RequestLedger;
using ha::testing::ExpectError;
namespace audit = ha::errors::audit;

void TestResolveReturnsRegisteredPairOnce() {
  RequestLedger ledger;
  ledger.Register(7, 42, RecordKind::kHash);
  ledger.Register(8, 43, RecordKind::kGuess);

  auto peek = ledger.Lookup(7);
  assert(peek && peek->target_record_id == 42 && peek->kind == RecordKind::kHash);
  assert(ledger.Size() == 2);

  const auto resolved = ledger.Resolve(7);
  assert((resolved == PendingRequest{7, 42, RecordKind::kHash}));
  ExpectError([&] { ledger.Resolve(7); }, audit::kUnknownRequest);
  assert(!ledger.Lookup(7));

  const auto guess = ledger.Resolve(8);
  assert(guess.target_record_id == 43 && guess.kind == RecordKind::kGuess);
  assert(ledger.Size() == 0);
}

void TestDuplicateRegistrationRejected() {
  RequestLedger ledger;
  ledger.Register(1, 10, RecordKind::kHash);
  ExpectError([&] { ledger.Register(1, 11, RecordKind::kGuess); }, audit::kDuplicateRequestId);
  auto entry = ledger.Lookup(1);
  assert(entry && entry->target_record_id == 10 && entry->kind == RecordKind::kHash);
}

void TestCancel() {
  RequestLedger ledger;
  ledger.Register(3, 30, RecordKind::kGuess);
  assert(ledger.Cancel(3));
  assert(!ledger.Cancel(3));
  ExpectError([&] { ledger.Resolve(3); }, audit::kUnknownRequest);
}

void TestConcurrentResolveConsumesOnce() {
  RequestLedger ledger;
  for (ha::core::RequestId id = 1; id <= 64; ++id) {
    ledger.Register(id, id + 100, RecordKind::kHash);
  }
  std::atomic<int> successes{0};
  std::atomic<int> rejections{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < 8; ++t) {
    workers.emplace_back([&] {
      for (ha::core::RequestId id = 1; id <= 64; ++id) {
        try {
          ledger.Resolve(id);
          successes.fetch_add(1);
        } catch (const ha::Error& err) {
          if (err.code == audit::kUnknownRequest) {
            rejections.fetch_add(1);
          }
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  assert(successes.load() == 64);
  assert(rejections.load() == 64 * 7);
  assert(ledger.Size() == 0);
}

void TestWriteThroughAndLoad() {
  ha::storage::MemoryKeyValueStore store;
  {
    RequestLedger ledger(&store);
    ledger.Register(5, 50, RecordKind::kHash);
    ledger.Register(6, 60, RecordKind::kGuess);
    ledger.Resolve(5);
  }
  assert(!store.Get(ha::core::codec::RequestKey(5)));
  assert(store.Get(ha::core::codec::RequestKey(6)));

  RequestLedger reloaded(&store);
  assert(reloaded.Load() == 1);
  auto outstanding = reloaded.Outstanding();
  assert(outstanding.size() == 1);
  assert((outstanding[0] == PendingRequest{6, 60, RecordKind::kGuess}));
  reloaded.Resolve(6);
  assert(store.Keys(ha::core::codec::kRequestKeyPrefix).empty());
}

} // namespace

int main() {
  TestResolveReturnsRegisteredPairOnce();
  TestDuplicateRegistrationRejected();
  TestCancel();
  TestConcurrentResolveConsumesOnce();
  TestWriteThroughAndLoad();
  std::cout << "request ledger tests passed" << std::endl;
  return 0;
}
