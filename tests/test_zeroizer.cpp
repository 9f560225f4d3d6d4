#include "ha/oracle/local_engine.h"
#include "ha/oracle/proof.h"
#include "ha/orchestrator/config.h"
#include "ha/security/zeroizer.h"

#include <algorithm>
#include <array>
#include <cassert>
#include <iostream>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_support.h"

namespace {

using ha::security::Zeroizer;

template <class Container>
bool AllZero(const Container& bytes) {
  return std::all_of(bytes.begin(), bytes.end(), [](auto b) { return b == 0; });
}

void TestWipeHelpers() {
  std::array<uint8_t, 32> key{};
  key.fill(0xA5);
  Zeroizer::Wipe(key);
  assert(AllZero(key));

  std::vector<uint8_t> buffer(48, 0x5A);
  Zeroizer::Wipe(std::span<uint8_t>(buffer.data(), 24));
  assert(std::all_of(buffer.begin(), buffer.begin() + 24, [](uint8_t b) { return b == 0; }));
  assert(buffer[24] == 0x5A);
  Zeroizer::WipeVector(buffer);
  assert(buffer.empty());

  std::string secret = "correct horse battery staple";
  Zeroizer::WipeString(secret);
  assert(secret.empty());

  Zeroizer::Wipe(std::span<uint8_t>());
}

void TestScopeWiperRunsOnUnwind() {
  std::array<uint8_t, 16> scratch{};
  scratch.fill(0x77);
  {
    Zeroizer::ScopeWiper wipe(scratch);
    assert(scratch[0] == 0x77);
  }
  assert(AllZero(scratch));

  scratch.fill(0x33);
  bool caught = false;
  try {
    Zeroizer::ScopeWiper wipe(std::span<uint8_t>(scratch.data(), 8));
    throw std::runtime_error("unwind");
  } catch (const std::runtime_error&) {
    caught = true;
  }
  assert(caught);
  assert(std::all_of(scratch.begin(), scratch.begin() + 8, [](uint8_t b) { return b == 0; }));
  assert(std::all_of(scratch.begin() + 8, scratch.end(), [](uint8_t b) { return b == 0x33; }));
}

// The engine keeps its derived keys after the caller wipes the master secret.
void TestEngineOutlivesWipedSecret() {
  ha::testing::TempDir dir("ha_zeroizer_");
  const auto key_file = dir.path() / "engine.key";
  auto secret = ha::orchestrator::LoadOrCreateEngineSecret(key_file);
  const auto reference_secret = secret;
  ha::oracle::LocalEngine engine(secret);
  Zeroizer::Wipe(secret);
  assert(AllZero(secret));

  ha::oracle::LocalEngine reference(reference_secret);
  assert(engine.oracle_key() == reference.oracle_key());
  assert(!AllZero(engine.oracle_key()));

  const auto a = engine.Encrypt("abc123");
  const auto b = engine.Encrypt("abc123");
  assert(!engine.Equal(a, b).empty());
  const std::array<ha::core::EncryptedValueHandle, 1> handles{a};
  engine.RequestDecryption(handles);
  const auto callbacks = engine.TakePendingCallbacks();
  assert(callbacks.size() == 1);
  ha::oracle::HmacProofVerifier verifier(reference.oracle_key());
  assert(verifier.Verify(callbacks[0].request_id, callbacks[0].payload, callbacks[0].proof));

  // Reloading the key file yields the same secret that was wiped in memory.
  assert(ha::orchestrator::LoadOrCreateEngineSecret(key_file) == reference_secret);
}

} // namespace

int main() {
  TestWipeHelpers();
  TestScopeWiperRunsOnUnwind();
  TestEngineOutlivesWipedSecret();
  std::cout << "zeroizer tests passed" << std::endl;
  return 0;
}
