#include "ha/orchestrator/config.h"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <string>
#include <span>
#include <system_error>
#include <vector>

#include "ha/common.h"
#include "ha/crypto/random.h"
#include "ha/error.h"
#include "ha/errors.h"
#include "ha/security/zeroizer.h"
#include "ha/storage/io_util.h"

namespace ha::orchestrator {

namespace {

std::optional<std::string> ReadEnv(const char* name) {
  const char* value = std::getenv(name);
  if (!value || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::filesystem::path Absolute(const std::filesystem::path& path) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    return path;
  }
  return absolute.lexically_normal();
}

}  // namespace

std::optional<std::size_t> ParseByteSize(std::string_view text) noexcept {
  if (text.empty()) {
    return std::nullopt;
  }
  unsigned long long value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size() || value == 0) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::min<unsigned long long>(value, std::numeric_limits<std::size_t>::max()));
}

AuditConfig AuditConfig::FromEnvironment() {
  AuditConfig config;
  config.data_dir = Absolute(ReadEnv("HA_DATA_DIR").value_or(std::string(kDefaultDataDir)));
  config.audit_log.directory = Absolute(ReadEnv("HA_AUDIT_LOG_DIR").value_or(std::string(kDefaultAuditLogDir)));
  if (auto raw = ReadEnv("HA_AUDIT_LOG_MAX_SIZE")) {
    config.audit_log.max_bytes = ParseByteSize(*raw).value_or(kDefaultAuditLogMaxBytes);
  }
  if (auto key_file = ReadEnv("HA_ENGINE_KEY_FILE")) {
    config.engine_key_file = Absolute(*key_file);
    config.engine_key_file_explicit = true;
  } else {
    config.engine_key_file = config.data_dir / kEngineKeyFileName;
  }
  return config;
}

void AuditConfig::SetDataDir(std::filesystem::path dir) {
  data_dir = Absolute(dir);
  if (!engine_key_file_explicit) {
    engine_key_file = data_dir / kEngineKeyFileName;
  }
}

oracle::LocalEngine::MasterSecret LoadOrCreateEngineSecret(const std::filesystem::path& path) {
  oracle::LocalEngine::MasterSecret secret{};
  std::optional<std::vector<uint8_t>> existing;
  try {
    existing = storage::ReadFileBytes(path);
  } catch (const Error& error) {
    ThrowAuditError(ErrorDomain::Config, errors::config::kKeyFileUnreadable, errors::msg::kKeyFileUnreadable,
                    error.what());
  }
  if (existing) {
    if (existing->size() != secret.size()) {
      security::Zeroizer::WipeVector(*existing);
      ThrowAuditError(ErrorDomain::Config, errors::config::kKeyFileUnreadable, errors::msg::kKeyFileUnreadable,
                      ha::PathToUtf8String(path) + ": expected " + std::to_string(secret.size()) + " bytes");
    }
    std::copy(existing->begin(), existing->end(), secret.begin());
    security::Zeroizer::WipeVector(*existing);
    return secret;
  }

  crypto::SystemRandomBytes(std::span<uint8_t>(secret.data(), secret.size()));
  try {
    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty()) {
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        ThrowAuditError(ErrorDomain::Config, errors::config::kKeyFileWriteFailed,
                        errors::msg::kKeyFileWriteFailed, ec.message());
      }
    }
    storage::AtomicReplace(path, std::span<const uint8_t>(secret.data(), secret.size()));
  } catch (const Error& error) {
    if (error.domain == ErrorDomain::Config) {
      throw;
    }
    ThrowAuditError(ErrorDomain::Config, errors::config::kKeyFileWriteFailed, errors::msg::kKeyFileWriteFailed,
                    error.what());
  }
  return secret;
}

}  // namespace ha::orchestrator
