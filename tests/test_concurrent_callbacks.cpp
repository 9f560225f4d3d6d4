#include "ha/core/record_store.h"
#include "ha/core/request_ledger.h"
#include "ha/error.h"
#include "ha/oracle/decryption_oracle_client.h"
#include "ha/oracle/local_engine.h"
#include "ha/oracle/proof.h"
#include "ha/orchestrator/audit_service.h"
#include "ha/orchestrator/config.h"
#include "ha/orchestrator/event_bus.h"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <cstddef>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "test_support.h"

namespace {

using ha::core::RevealState;
using ha::core::VerificationState;

constexpr int kThreads = 8;

ha::oracle::LocalEngine::MasterSecret TestSecret() {
  ha::oracle::LocalEngine::MasterSecret secret{};
  secret.fill(0x11);
  return secret;
}

struct Harness {
  ha::oracle::LocalEngine engine{TestSecret()};
  ha::core::RecordStore store;
  ha::core::RequestLedger ledger;
  ha::oracle::HmacProofVerifier verifier{engine.oracle_key()};
  ha::oracle::DecryptionOracleClient client{engine, ledger, verifier};
  ha::orchestrator::AuditService service{store, ledger, client};
};

// Every thread delivers every callback; each must apply exactly once.
void TestDuplicateDeliveryAppliesOnce() {
  Harness h;
  constexpr int kHashes = 16;
  std::vector<ha::core::RecordId> hash_ids;
  std::vector<ha::core::RecordId> guess_ids;
  for (int i = 0; i < kHashes; ++i) {
    const std::string text = "hash-" + std::to_string(i);
    const auto hash_id = h.service.SubmitHash(h.engine.Encrypt(text), "alice");
    const auto guess_id =
        h.service.SubmitGuess(hash_id, h.engine.Encrypt(i % 2 == 0 ? text : std::string("miss")), "bob");
    h.service.RequestHashReveal(hash_id, "alice");
    h.service.RequestGuessVerification(guess_id, "bob");
    hash_ids.push_back(hash_id);
    guess_ids.push_back(guess_id);
  }
  const auto callbacks = h.engine.TakePendingCallbacks();
  assert(callbacks.size() == 2 * kHashes);

  std::atomic<int> applied{0};
  std::atomic<int> rejected{0};
  std::atomic<int> unexpected{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (std::size_t n = 0; n < callbacks.size(); ++n) {
        const auto& cb = callbacks[(n + static_cast<std::size_t>(t) * 3) % callbacks.size()];
        try {
          h.service.HandleOracleCallback(cb.request_id, cb.payload, cb.proof);
          applied.fetch_add(1);
        } catch (const ha::Error& error) {
          if (error.code == ha::errors::audit::kUnknownRequest) {
            rejected.fetch_add(1);
          } else {
            unexpected.fetch_add(1);
          }
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  assert(unexpected.load() == 0);
  assert(applied.load() == 2 * kHashes);
  assert(rejected.load() == (kThreads - 1) * 2 * kHashes);
  assert(h.ledger.Size() == 0);
  for (int i = 0; i < kHashes; ++i) {
    const auto hash = h.service.GetHash(hash_ids[i]);
    assert(hash->reveal_state == RevealState::kRevealed);
    assert(hash->revealed_hash == std::optional<std::string>("hash-" + std::to_string(i)));
    const auto expected = i % 2 == 0 ? VerificationState::kCorrect : VerificationState::kIncorrect;
    assert(h.service.GetGuess(guess_ids[i])->verification_state == expected);
  }
  const auto stats = h.service.Statistics();
  assert(stats.revealed_hashes == kHashes);
  assert(stats.correct_guesses + stats.incorrect_guesses == kHashes);
}

// Submissions and reads racing against each other keep ids unique.
void TestConcurrentSubmissions() {
  Harness h;
  constexpr int kPerThread = 32;
  std::vector<std::thread> threads;
  std::vector<std::vector<ha::core::RecordId>> ids(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        ids[t].push_back(h.service.SubmitHash(h.engine.Encrypt("v" + std::to_string(i)), "owner" + std::to_string(t)));
        (void)h.service.ListHashes();
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  std::vector<ha::core::RecordId> all;
  for (const auto& chunk : ids) {
    for (std::size_t i = 1; i < chunk.size(); ++i) {
      assert(chunk[i] > chunk[i - 1]);
    }
    all.insert(all.end(), chunk.begin(), chunk.end());
  }
  std::sort(all.begin(), all.end());
  assert(std::adjacent_find(all.begin(), all.end()) == all.end());
  assert(all.front() == 1 && all.back() == static_cast<ha::core::RecordId>(kThreads * kPerThread));
}

// Callbacks delivered while reveals are still being requested. A callback
// that beats its registration stays queued and is retried.
void TestRequestEventPrecedesResult() {
  Harness h;
  std::mutex seen_mutex;
  std::vector<std::pair<std::string, std::string>> seen;
  ha::orchestrator::EventBus::Instance().Subscribe([&](const ha::orchestrator::Event& e) {
    if (e.event_id != "decryption_requested" && e.event_id != "hash_revealed") {
      return;
    }
    const auto* request = e.Field("request_id");
    std::lock_guard<std::mutex> lock(seen_mutex);
    seen.emplace_back(e.event_id, request ? request->value : std::string());
  });

  constexpr int kProducers = 4;
  constexpr int kPerProducer = 8;
  std::atomic<int> producing{kProducers};
  std::atomic<int> unexpected{0};
  std::thread deliverer([&] {
    while (producing.load() > 0 || h.engine.PendingCount() > 0) {
      try {
        h.engine.DeliverPending([&](const ha::oracle::OracleCallback& cb) {
          h.service.HandleOracleCallback(cb.request_id, cb.payload, cb.proof);
        });
      } catch (const ha::Error& error) {
        if (error.code != ha::errors::audit::kUnknownRequest) {
          unexpected.fetch_add(1);
        }
        std::this_thread::yield();
      }
    }
  });
  std::vector<std::thread> producers;
  for (int t = 0; t < kProducers; ++t) {
    producers.emplace_back([&, t] {
      for (int i = 0; i < kPerProducer; ++i) {
        const auto id = h.service.SubmitHash(h.engine.Encrypt("p" + std::to_string(t) + "-" + std::to_string(i)),
                                             "alice");
        h.service.RequestHashReveal(id, "alice");
      }
      producing.fetch_sub(1);
    });
  }
  for (auto& producer : producers) {
    producer.join();
  }
  deliverer.join();

  assert(unexpected.load() == 0);
  assert(h.ledger.Size() == 0);
  assert(h.service.Statistics().revealed_hashes == kProducers * kPerProducer);
  std::lock_guard<std::mutex> lock(seen_mutex);
  assert(seen.size() == 2 * kProducers * kPerProducer);
  for (std::size_t i = 0; i < seen.size(); ++i) {
    if (seen[i].first != "hash_revealed") {
      continue;
    }
    const auto earlier = std::find(seen.begin(), seen.begin() + static_cast<std::ptrdiff_t>(i),
                                   std::make_pair(std::string("decryption_requested"), seen[i].second));
    assert(earlier != seen.begin() + static_cast<std::ptrdiff_t>(i));
  }
  ha::orchestrator::ResetEventBusForTesting();
}

} // namespace

int main() {
  ha::testing::TempDir logs("ha_concurrent_logs_");
  ha::orchestrator::ConfigureDefaultJsonLogger({logs.path(), ha::orchestrator::kDefaultAuditLogMaxBytes});

  TestDuplicateDeliveryAppliesOnce();
  TestConcurrentSubmissions();
  TestRequestEventPrecedesResult();
  assert(ha::orchestrator::DefaultJsonLogger()->VerifyChain());
  std::cout << "concurrent callback tests passed" << std::endl;
  return 0;
}
