#include "ha/error.h"
#include "ha/orchestrator/config.h"
#include "ha/storage/io_util.h"

#include <sys/stat.h>

#include <array>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "test_support.h"

namespace {

using ha::orchestrator::AuditConfig;
using ha::orchestrator::ParseByteSize;
using ha::testing::ExpectError;
namespace fs = std::filesystem;

void ClearEnvironment() {
  ::unsetenv("HA_DATA_DIR");
  ::unsetenv("HA_AUDIT_LOG_DIR");
  ::unsetenv("HA_AUDIT_LOG_MAX_SIZE");
  ::unsetenv("HA_ENGINE_KEY_FILE");
}

void TestParseByteSize() {
  assert(ParseByteSize("1048576") == std::optional<std::size_t>(1048576));
  assert(ParseByteSize("1") == std::optional<std::size_t>(1));
  assert(!ParseByteSize(""));
  assert(!ParseByteSize("0"));
  assert(!ParseByteSize("-5"));
  assert(!ParseByteSize("10MB"));
  assert(!ParseByteSize(" 10"));
}

void TestEnvironmentDefaults() {
  ClearEnvironment();
  const auto config = AuditConfig::FromEnvironment();
  assert(config.data_dir.is_absolute());
  assert(config.data_dir.filename() == std::string(ha::orchestrator::kDefaultDataDir));
  assert(config.audit_log.directory.filename() == std::string(ha::orchestrator::kDefaultAuditLogDir));
  assert(config.audit_log.max_bytes == ha::orchestrator::kDefaultAuditLogMaxBytes);
  assert(config.engine_key_file == config.data_dir / ha::orchestrator::kEngineKeyFileName);
  assert(!config.engine_key_file_explicit);
}

void TestEnvironmentOverrides() {
  ha::testing::TempDir dir("ha_config_env_");
  const auto data = dir.path() / "data";
  const auto logs = dir.path() / "logs";
  ::setenv("HA_DATA_DIR", data.c_str(), 1);
  ::setenv("HA_AUDIT_LOG_DIR", logs.c_str(), 1);
  ::setenv("HA_AUDIT_LOG_MAX_SIZE", "4096", 1);
  auto config = AuditConfig::FromEnvironment();
  assert(config.data_dir == data);
  assert(config.audit_log.directory == logs);
  assert(config.audit_log.max_bytes == 4096);
  assert(config.engine_key_file == data / "engine.key");

  // The key file follows a later data directory override.
  config.SetDataDir(dir.path() / "other");
  assert(config.engine_key_file == dir.path() / "other" / "engine.key");

  ::setenv("HA_AUDIT_LOG_MAX_SIZE", "lots", 1);
  const auto key = dir.path() / "keys" / "engine.bin";
  ::setenv("HA_ENGINE_KEY_FILE", key.c_str(), 1);
  config = AuditConfig::FromEnvironment();
  assert(config.audit_log.max_bytes == ha::orchestrator::kDefaultAuditLogMaxBytes);
  assert(config.engine_key_file == key && config.engine_key_file_explicit);
  config.SetDataDir(dir.path() / "other");
  assert(config.engine_key_file == key);
  ClearEnvironment();
}

void TestEngineSecretLifecycle() {
  ha::testing::TempDir dir("ha_config_key_");
  const auto path = dir.path() / "nested" / "engine.key";
  const auto created = ha::orchestrator::LoadOrCreateEngineSecret(path);
  assert(fs::exists(path));
  assert(fs::file_size(path) == created.size());

  struct stat info{};
  assert(::stat(path.c_str(), &info) == 0);
  assert((info.st_mode & 0777) == 0600);

  const auto reloaded = ha::orchestrator::LoadOrCreateEngineSecret(path);
  assert(reloaded == created);

  const std::vector<uint8_t> short_key(16, 0x01);
  ha::storage::AtomicReplace(path, short_key);
  ExpectError([&] { ha::orchestrator::LoadOrCreateEngineSecret(path); }, ha::errors::config::kKeyFileUnreadable);
}

void TestAtomicReplaceLeavesTargetOnFailure() {
  ha::testing::TempDir dir("ha_config_atomic_");
  const auto target = dir.path() / "value.bin";
  const std::vector<uint8_t> original{1, 2, 3};
  ha::storage::AtomicReplace(target, original);

  ha::storage::AtomicReplaceHooks hooks;
  hooks.before_rename = [](const fs::path&, const fs::path&) {
    throw ha::Error{ha::ErrorDomain::IO, 5, "simulated crash"};
  };
  const std::vector<uint8_t> replacement{9, 9, 9, 9};
  bool threw = false;
  try {
    ha::storage::AtomicReplace(target, replacement, hooks);
  } catch (const ha::Error&) {
    threw = true;
  }
  assert(threw);
  assert(ha::storage::ReadFileBytes(target) == std::optional<std::vector<uint8_t>>(original));
  std::size_t entries = 0;
  for ([[maybe_unused]] const auto& entry : fs::directory_iterator(dir.path())) {
    ++entries;
  }
  assert(entries == 1);
  assert(!ha::storage::ReadFileBytes(dir.path() / "missing.bin"));
}

} // namespace

int main() {
  TestParseByteSize();
  TestEnvironmentDefaults();
  TestEnvironmentOverrides();
  TestEngineSecretLifecycle();
  TestAtomicReplaceLeavesTargetOnFailure();
  std::cout << "config tests passed" << std::endl;
  return 0;
}
