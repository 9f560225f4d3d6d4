#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>

#include "ha/oracle/local_engine.h"

namespace ha::orchestrator {

inline constexpr std::size_t kDefaultAuditLogMaxBytes = 10 * 1024 * 1024;
inline constexpr std::string_view kDefaultDataDir{"hashaudit-data"};
inline constexpr std::string_view kDefaultAuditLogDir{"logs"};
inline constexpr std::string_view kEngineKeyFileName{"engine.key"};

struct AuditLogOptions {
  std::filesystem::path directory{kDefaultAuditLogDir};
  std::size_t max_bytes{kDefaultAuditLogMaxBytes};
};

// Runtime settings resolved from HA_DATA_DIR, HA_AUDIT_LOG_DIR,
// HA_AUDIT_LOG_MAX_SIZE and HA_ENGINE_KEY_FILE. Unset or invalid values fall
// back to defaults; relative paths are resolved against the working directory.
struct AuditConfig {
  std::filesystem::path data_dir;
  AuditLogOptions audit_log;
  std::filesystem::path engine_key_file;
  bool engine_key_file_explicit{false};

  static AuditConfig FromEnvironment();

  // Command line override; the key file follows the data directory unless it
  // was set explicitly.
  void SetDataDir(std::filesystem::path dir);
};

// Positive decimal byte count, or nullopt.
std::optional<std::size_t> ParseByteSize(std::string_view text) noexcept;

// Reads the engine master secret, creating it with fresh random bytes (mode
// 0600) when the file does not exist. Throws ha::Error (Config) when the file
// exists but is unreadable or has the wrong size.
oracle::LocalEngine::MasterSecret LoadOrCreateEngineSecret(const std::filesystem::path& path);

}  // namespace ha::orchestrator
