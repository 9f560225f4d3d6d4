#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ha/crypto/hmac_sha256.h"
#include "ha/orchestrator/config.h"

namespace ha::orchestrator {

// Structured logging primitives
enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

enum class FieldPrivacy { kPublic, kRedact, kHash };

struct EventField {
  std::string key;
  std::string value;
  FieldPrivacy privacy{FieldPrivacy::kPublic};
  bool numeric{false};

  EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic, bool is_numeric = false)
      : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
};

struct Event {
  EventCategory category{EventCategory::kDiagnostics};
  EventSeverity severity{EventSeverity::kInfo};
  std::string event_id;
  std::string message;
  std::vector<EventField> fields;

  [[nodiscard]] const EventField* Field(std::string_view key) const noexcept;
};

// Hex SHA-256 of |input|; empty input stays empty.
std::string HashForTelemetry(std::string_view input);

const char* SeverityToString(EventSeverity severity) noexcept;
const char* CategoryToString(EventCategory category) noexcept;

// One JSON object per line in <directory>/audit.log. Every line carries
// audit_prev_count, audit_seq and audit_mac, an HMAC-SHA256 over the line and
// the previous MAC, keyed by <log>.key. Each rotated file starts a fresh chain.
class JsonLineLogger {
 public:
  static constexpr std::string_view kLogFileName{"audit.log"};
  static constexpr std::size_t kMaxFiles = 3;

  explicit JsonLineLogger(AuditLogOptions options);
  ~JsonLineLogger();

  JsonLineLogger(const JsonLineLogger&) = delete;
  JsonLineLogger& operator=(const JsonLineLogger&) = delete;

  void Log(const Event& event);

  // Re-reads the current file and checks the chain against in-memory state.
  bool VerifyChain();

  [[nodiscard]] const std::filesystem::path& log_path() const noexcept { return log_path_; }
  [[nodiscard]] bool healthy() const;

 private:
  using Mac = crypto::HmacTag;

  std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
  void EnsureKey();
  void EnsureOpen();
  void RotateIfNeeded(std::size_t incoming_bytes);
  bool ParseLog(Mac& mac, uint64_t& sequence);

  mutable std::mutex mutex_;
  std::ofstream stream_;
  std::filesystem::path log_path_;
  std::filesystem::path key_path_;
  std::size_t max_bytes_;
  Mac hmac_key_{};
  Mac last_mac_{};
  uint64_t entry_counter_{0};
  uint64_t dropped_streak_{0};
  bool key_loaded_{false};
  bool integrity_ok_{true};
};

// Logger behind the default event bus subscriber. Created on first use from
// AuditConfig::FromEnvironment() unless configured before.
std::shared_ptr<JsonLineLogger> DefaultJsonLogger();
void ConfigureDefaultJsonLogger(AuditLogOptions options);

class EventBus {
 public:
  using Subscriber = std::function<void(const Event&)>;

  static EventBus& Instance();

  // Delivers synchronously to a snapshot of the subscribers. Subscriber
  // failures never reach the publisher.
  void Publish(const Event& event);
  void Subscribe(Subscriber fn);

 private:
  EventBus();

  using SubscriberList = std::vector<Subscriber>;

  std::shared_ptr<const SubscriberList> subscribers_snapshot_;
  std::mutex subscribers_mutex_;
};

// Drops the singleton and its subscribers; the next Instance() starts fresh
// with only the default logger attached.
void ResetEventBusForTesting();

}  // namespace ha::orchestrator
