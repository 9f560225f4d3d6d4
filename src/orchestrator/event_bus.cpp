#include "ha/orchestrator/event_bus.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

#include "ha/common.h"
#include "ha/crypto/random.h"
#include "ha/crypto/sha256.h"
#include "ha/error.h"
#include "ha/security/zeroizer.h"
#include "ha/storage/io_util.h"

namespace ha::orchestrator {
namespace {

struct EventBusSingletonStorage {
  std::mutex mutex;
  std::unique_ptr<EventBus> instance;
};

EventBusSingletonStorage& EventBusSingleton() {
  static EventBusSingletonStorage storage;
  return storage;
}

struct DefaultLoggerStorage {
  std::mutex mutex;
  std::shared_ptr<JsonLineLogger> logger;
};

DefaultLoggerStorage& DefaultLogger() {
  static DefaultLoggerStorage storage;
  return storage;
}

struct PublishReentrancyGuard {
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

constexpr std::size_t kHmacSize = crypto::kHmacSha256Size;
constexpr std::size_t kMaxEventBytes = 16 * 1024; // cap serialized size

bool AppendWithLimit(std::string& out, std::string_view chunk, std::size_t limit) {
  if (out.size() + chunk.size() > limit) {
    return false;
  }
  out.append(chunk);
  return true;
}

bool AppendEscapedWithLimit(std::string& out, std::string_view text, std::size_t limit) {
  for (unsigned char c : text) {
    std::string_view escaped;
    switch (c) {
    case '\\':
      escaped = "\\\\";
      break;
    case '"':
      escaped = "\\\"";
      break;
    case '\b':
      escaped = "\\b";
      break;
    case '\f':
      escaped = "\\f";
      break;
    case '\n':
      escaped = "\\n";
      break;
    case '\r':
      escaped = "\\r";
      break;
    case '\t':
      escaped = "\\t";
      break;
    default:
      break;
    }
    if (!escaped.empty()) {
      if (!AppendWithLimit(out, escaped, limit)) {
        return false;
      }
      continue;
    }
    if (c < 0x20) {
      char buffer[7];
      std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<int>(c));
      if (!AppendWithLimit(out, buffer, limit)) {
        return false;
      }
    } else {
      const char plain = static_cast<char>(c);
      if (!AppendWithLimit(out, std::string_view(&plain, 1), limit)) {
        return false;
      }
    }
  }
  return true;
}

Event BuildOversizeEvent(const Event& original) {
  Event replacement;
  replacement.category = EventCategory::kDiagnostics;
  replacement.severity = EventSeverity::kWarning;
  replacement.event_id = "event_too_large";
  replacement.message = "Event payload exceeded logger limits";
  if (!original.event_id.empty()) {
    replacement.fields.emplace_back("original_event_id", original.event_id);
  }
  replacement.fields.emplace_back("limit_bytes", std::to_string(kMaxEventBytes), FieldPrivacy::kPublic, true);
  return replacement;
}

std::array<uint8_t, kHmacSize> ComputeChainedMac(const std::array<uint8_t, kHmacSize>& key,
                                                 const std::array<uint8_t, kHmacSize>& previous,
                                                 uint64_t previous_count, uint64_t sequence,
                                                 std::string_view canonical) {
  const uint64_t sequence_be = ha::ToBigEndian(sequence);
  const uint64_t previous_be = ha::ToBigEndian(previous_count);
  std::vector<uint8_t> buffer;
  buffer.reserve(previous.size() + sizeof(sequence_be) + sizeof(previous_be) + canonical.size());
  buffer.insert(buffer.end(), previous.begin(), previous.end());
  const auto previous_bytes = ha::AsBytesConst(previous_be);
  buffer.insert(buffer.end(), previous_bytes.begin(), previous_bytes.end());
  const auto sequence_bytes = ha::AsBytesConst(sequence_be);
  buffer.insert(buffer.end(), sequence_bytes.begin(), sequence_bytes.end());
  const auto canonical_bytes = ha::AsBytesConst(canonical);
  buffer.insert(buffer.end(), canonical_bytes.begin(), canonical_bytes.end());
  return crypto::HmacSha256(std::span<const uint8_t>(key.data(), key.size()),
                            std::span<const uint8_t>(buffer.data(), buffer.size()));
}

std::optional<std::string> BuildEventJson(const Event& event, const std::string& timestamp,
                                          std::size_t max_bytes) {
  std::string payload;
  payload.reserve(std::min<std::size_t>(max_bytes, 256));
  if (!AppendWithLimit(payload, "{\"ts\":\"", max_bytes) ||
      !AppendEscapedWithLimit(payload, timestamp, max_bytes) ||
      !AppendWithLimit(payload, "\",\"severity\":\"", max_bytes) ||
      !AppendWithLimit(payload, SeverityToString(event.severity), max_bytes) ||
      !AppendWithLimit(payload, "\",\"category\":\"", max_bytes) ||
      !AppendWithLimit(payload, CategoryToString(event.category), max_bytes) ||
      !AppendWithLimit(payload, "\"", max_bytes)) {
    return std::nullopt;
  }
  if (!event.event_id.empty()) {
    if (!AppendWithLimit(payload, ",\"event_id\":\"", max_bytes) ||
        !AppendEscapedWithLimit(payload, event.event_id, max_bytes) ||
        !AppendWithLimit(payload, "\"", max_bytes)) {
      return std::nullopt;
    }
  }
  if (!event.message.empty()) {
    if (!AppendWithLimit(payload, ",\"message\":\"", max_bytes) ||
        !AppendEscapedWithLimit(payload, event.message, max_bytes) ||
        !AppendWithLimit(payload, "\"", max_bytes)) {
      return std::nullopt;
    }
  }
  for (const auto& field : event.fields) {
    if (!AppendWithLimit(payload, ",\"", max_bytes) ||
        !AppendEscapedWithLimit(payload, field.key, max_bytes) ||
        !AppendWithLimit(payload, "\":", max_bytes)) {
      return std::nullopt;
    }
    std::string sanitized;
    switch (field.privacy) {
    case FieldPrivacy::kPublic:
      sanitized = field.value;
      break;
    case FieldPrivacy::kRedact:
      sanitized = "[REDACTED]";
      break;
    case FieldPrivacy::kHash:
      sanitized = HashForTelemetry(field.value);
      break;
    }
    if (field.numeric && field.privacy == FieldPrivacy::kPublic) {
      if (!AppendWithLimit(payload, sanitized, max_bytes)) {
        return std::nullopt;
      }
    } else if (!AppendWithLimit(payload, "\"", max_bytes) ||
               !AppendEscapedWithLimit(payload, sanitized, max_bytes) ||
               !AppendWithLimit(payload, "\"", max_bytes)) {
      return std::nullopt;
    }
  }
  if (!AppendWithLimit(payload, "}", max_bytes)) {
    return std::nullopt;
  }
  return payload;
}

std::optional<uint64_t> ParseCounterAfter(std::string_view line, std::string_view marker, std::size_t from,
                                          std::size_t& end) {
  auto pos = line.find(marker, from);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  pos += marker.size();
  end = pos;
  while (end < line.size() && std::isdigit(static_cast<unsigned char>(line[end]))) {
    ++end;
  }
  if (end == pos) {
    return std::nullopt;
  }
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(line.data() + pos, line.data() + end, value);
  if (ec != std::errc() || ptr != line.data() + end) {
    return std::nullopt;
  }
  return value;
}

// One subscriber failing must not starve the ones after it.
void ReportSubscriberError(std::string_view event_id, std::string_view what) {
  std::string line = "{\"event\":\"event_bus_subscriber_error\",\"event_id\":\"";
  if (!AppendEscapedWithLimit(line, event_id, kMaxEventBytes / 2)) {
    line += "...";
  }
  line += "\",\"message\":\"";
  if (!AppendEscapedWithLimit(line, what, kMaxEventBytes)) {
    line += "...";
  }
  line += "\"}";
  std::clog << line << std::endl;
}

void ReportLoggerError(std::string_view message, int error_code = 0) {
  std::clog << "{\"event\":\"logger_error\",\"message\":\"" << message << "\"";
  if (error_code != 0) {
    std::clog << ",\"error_code\":" << error_code;
  }
  std::clog << "}" << std::endl;
}

} // namespace

const EventField* Event::Field(std::string_view key) const noexcept {
  auto it = std::find_if(fields.begin(), fields.end(), [key](const EventField& f) { return f.key == key; });
  return it == fields.end() ? nullptr : &*it;
}

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  const auto digest = crypto::Sha256(ha::AsBytesConst(input));
  return ha::HexEncode(std::span<const uint8_t>(digest.data(), digest.size()));
}

const char* SeverityToString(EventSeverity severity) noexcept {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) noexcept {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

JsonLineLogger::JsonLineLogger(AuditLogOptions options)
    : log_path_(options.directory / kLogFileName),
      key_path_(log_path_.string() + ".key"),
      max_bytes_(options.max_bytes) {
  std::lock_guard<std::mutex> guard(mutex_);
  EnsureKey();
  Mac existing_mac{};
  uint64_t existing_seq = 0;
  if (ParseLog(existing_mac, existing_seq)) {
    last_mac_ = existing_mac;
    entry_counter_ = existing_seq;
  } else {
    std::clog << "{\"event\":\"logger_integrity_failure\",\"message\":\"unable to verify existing audit log\"}"
              << std::endl;
    integrity_ok_ = false;
  }
}

JsonLineLogger::~JsonLineLogger() {
  security::Zeroizer::Wipe(hmac_key_);
}

bool JsonLineLogger::healthy() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return integrity_ok_ && key_loaded_;
}

std::string JsonLineLogger::FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  auto fractional =
      std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) % std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

void JsonLineLogger::EnsureKey() {
  if (key_loaded_) {
    return;
  }
  std::error_code ec;
  auto parent = key_path_.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      ReportLoggerError("audit key directory create failed", ec.value());
      integrity_ok_ = false;
      return;
    }
  }
  try {
    if (auto existing = storage::ReadFileBytes(key_path_)) {
      security::Zeroizer::ScopeWiper wipe_existing(std::span<uint8_t>(existing->data(), existing->size()));
      if (existing->size() != hmac_key_.size()) {
        ReportLoggerError("audit key has unexpected size");
        integrity_ok_ = false;
        return;
      }
      std::copy(existing->begin(), existing->end(), hmac_key_.begin());
      key_loaded_ = true;
      return;
    }
    crypto::SystemRandomBytes(std::span<uint8_t>(hmac_key_.data(), hmac_key_.size()));
    storage::AtomicReplace(key_path_, std::span<const uint8_t>(hmac_key_.data(), hmac_key_.size()));
    key_loaded_ = true;
  } catch (const Error& error) {
    ReportLoggerError("audit key unavailable", error.native_code.value_or(error.code));
    integrity_ok_ = false;
  }
}

void JsonLineLogger::EnsureOpen() {
  if (stream_.is_open()) {
    return;
  }
  std::error_code ec;
  auto parent = log_path_.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      ReportLoggerError("audit log directory create failed", ec.value());
      integrity_ok_ = false;
      return;
    }
  }
  stream_.open(log_path_, std::ios::out | std::ios::app);
}

bool JsonLineLogger::ParseLog(Mac& mac, uint64_t& sequence) {
  if (!key_loaded_) {
    return false;
  }
  std::ifstream in(log_path_);
  if (!in) {
    mac.fill(0);
    sequence = 0;
    return true;
  }
  Mac previous{};
  uint64_t seq = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    if (line.size() > kMaxEventBytes + 256) {
      return false;
    }
    std::string_view line_view(line);
    constexpr std::string_view kMacMarker = ",\"audit_mac\":\"";
    auto mac_pos = line_view.find(kMacMarker);
    if (mac_pos == std::string_view::npos) {
      return false;
    }
    auto mac_start = mac_pos + kMacMarker.size();
    auto mac_end = line_view.find('"', mac_start);
    if (mac_end == std::string_view::npos) {
      return false;
    }
    Mac parsed{};
    if (!ha::HexDecode(line_view.substr(mac_start, mac_end - mac_start), parsed)) {
      return false;
    }
    std::size_t prev_end = 0;
    auto parsed_prev = ParseCounterAfter(line_view, "\"audit_prev_count\":", 0, prev_end);
    std::size_t seq_end = 0;
    auto parsed_seq = parsed_prev ? ParseCounterAfter(line_view, "\"audit_seq\":", prev_end, seq_end)
                                  : std::nullopt;
    if (!parsed_prev || !parsed_seq || *parsed_prev != seq || *parsed_seq != seq + 1) {
      return false;
    }
    std::string canonical(line_view.substr(0, mac_pos));
    canonical.push_back('}');
    auto expected_mac = ComputeChainedMac(hmac_key_, previous, seq, seq + 1, canonical);
    if (expected_mac != parsed) {
      return false;
    }
    previous = expected_mac;
    ++seq;
  }
  if (in.bad()) {
    return false;
  }
  mac = previous;
  sequence = seq;
  return true;
}

bool JsonLineLogger::VerifyChain() {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!integrity_ok_) {
    return false;
  }
  if (stream_.is_open()) {
    stream_.flush();
  }
  Mac mac{};
  uint64_t sequence = 0;
  if (!ParseLog(mac, sequence)) {
    return false;
  }
  return sequence == entry_counter_ && mac == last_mac_;
}

void JsonLineLogger::RotateIfNeeded(std::size_t incoming_bytes) {
  std::error_code ec;
  auto current_size = std::filesystem::file_size(log_path_, ec);
  if (ec) {
    current_size = 0;
    ec.clear();
  }
  if (current_size + incoming_bytes <= max_bytes_ || current_size == 0) {
    return;
  }
  if (stream_.is_open()) {
    stream_.close();
  }
  for (std::size_t idx = kMaxFiles; idx > 0; --idx) {
    std::filesystem::path src =
        idx == 1 ? log_path_ : std::filesystem::path(log_path_.string() + "." + std::to_string(idx - 1));
    std::filesystem::path dst(log_path_.string() + "." + std::to_string(idx));
    std::error_code rotate_ec;
    if (!std::filesystem::exists(src, rotate_ec)) {
      continue;
    }
    std::filesystem::remove(dst, rotate_ec);
    if (rotate_ec) {
      ReportLoggerError("audit log rotation cleanup failed", rotate_ec.value());
      rotate_ec.clear();
    }
    std::filesystem::rename(src, dst, rotate_ec);
    if (rotate_ec) {
      ReportLoggerError("audit log rotate rename failed", rotate_ec.value());
    }
  }
  last_mac_.fill(0);
  entry_counter_ = 0;
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!integrity_ok_) {
    return;
  }
  EnsureKey();
  if (!key_loaded_) {
    ReportLoggerError("audit key unavailable");
    integrity_ok_ = false;
    return;
  }
  auto timestamp = FormatTimestamp(std::chrono::system_clock::now());
  auto base = BuildEventJson(event, timestamp, kMaxEventBytes);
  if (!base) {
    base = BuildEventJson(BuildOversizeEvent(event), timestamp, kMaxEventBytes);
    if (!base) {
      return;
    }
  }

  // Rotation restarts the chain, so it must happen before the MAC is computed.
  RotateIfNeeded(base->size() + 128);
  EnsureOpen();
  if (!stream_.is_open()) {
    ++dropped_streak_;
    if (dropped_streak_ == 1) {
      ReportLoggerError("failed to open log file");
    }
    return;
  }

  const uint64_t previous_count = entry_counter_;
  const uint64_t next_sequence = previous_count + 1;
  std::string prefix = base->substr(0, base->size() - 1);
  prefix.append(",\"audit_prev_count\":");
  prefix.append(std::to_string(previous_count));
  prefix.append(",\"audit_seq\":");
  prefix.append(std::to_string(next_sequence));
  std::string canonical = prefix;
  canonical.push_back('}');
  auto mac = ComputeChainedMac(hmac_key_, last_mac_, previous_count, next_sequence, canonical);
  std::string line = prefix;
  line.append(",\"audit_mac\":\"");
  line.append(ha::HexEncode(std::span<const uint8_t>(mac.data(), mac.size())));
  line.append("\"}");

  stream_ << line << '\n';
  stream_.flush();
  if (!stream_) {
    ReportLoggerError("audit log write failed");
    integrity_ok_ = false;
    return;
  }
  last_mac_ = mac;
  entry_counter_ = next_sequence;
  dropped_streak_ = 0;
}

std::shared_ptr<JsonLineLogger> DefaultJsonLogger() {
  auto& storage = DefaultLogger();
  std::lock_guard<std::mutex> guard(storage.mutex);
  if (!storage.logger) {
    storage.logger = std::make_shared<JsonLineLogger>(AuditConfig::FromEnvironment().audit_log);
  }
  return storage.logger;
}

void ConfigureDefaultJsonLogger(AuditLogOptions options) {
  auto logger = std::make_shared<JsonLineLogger>(std::move(options));
  auto& storage = DefaultLogger();
  std::lock_guard<std::mutex> guard(storage.mutex);
  storage.logger = std::move(logger);
}

EventBus::EventBus() {
  auto initial = std::make_shared<SubscriberList>();
  initial->push_back([](const Event& e) { DefaultJsonLogger()->Log(e); });
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(initial),
                             std::memory_order_release);
}

EventBus& EventBus::Instance() {
  auto& storage = EventBusSingleton();
  std::lock_guard<std::mutex> guard(storage.mutex);
  if (!storage.instance) {
    storage.instance.reset(new EventBus());
  }
  return *storage.instance;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (!targets) {
    return;
  }
  for (const auto& subscriber : *targets) {
    if (!subscriber) {
      continue;
    }
    try {
      subscriber(event);
    } catch (const std::exception& ex) {
      ReportSubscriberError(event.event_id, ex.what());
    } catch (...) {
      ReportSubscriberError(event.event_id, "non-standard exception");
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated = current ? std::make_shared<SubscriberList>(*current) : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

void ResetEventBusForTesting() {
  auto& storage = EventBusSingleton();
  std::lock_guard<std::mutex> guard(storage.mutex);
  storage.instance.reset();
}

} // namespace ha::orchestrator
