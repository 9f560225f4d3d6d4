#include "ha/storage/kv_store.h"

#include <algorithm>
#include <system_error>

#include "ha/common.h"
#include "ha/error.h"
#include "ha/errors.h"
#include "ha/storage/io_util.h"

namespace ha::storage {

namespace {

constexpr size_t kMaxKeyLength = 128;
constexpr std::string_view kEntrySuffix{".rec"};

void RequireValidKey(std::string_view key) {
  if (!IsValidStoreKey(key)) {
    ThrowAuditError(ErrorDomain::IO, errors::io::kStoreKeyRejected, errors::msg::kStoreKeyRejected,
                    key.substr(0, kMaxKeyLength));
  }
}

}  // namespace

bool IsValidStoreKey(std::string_view key) noexcept {
  if (key.empty() || key.size() > kMaxKeyLength) {
    return false;
  }
  if (key.front() == '.') {
    return false;
  }
  return std::all_of(key.begin(), key.end(), [](char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
           ch == '_' || ch == '-' || ch == '.';
  });
}

std::optional<std::vector<uint8_t>> MemoryKeyValueStore::Get(std::string_view key) const {
  RequireValidKey(key);
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryKeyValueStore::Put(std::string_view key, std::span<const uint8_t> value) {
  RequireValidKey(key);
  std::lock_guard<std::mutex> guard(mutex_);
  entries_.insert_or_assign(std::string(key), std::vector<uint8_t>(value.begin(), value.end()));
}

bool MemoryKeyValueStore::Erase(std::string_view key) {
  RequireValidKey(key);
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return false;
  }
  entries_.erase(it);
  return true;
}

std::vector<std::string> MemoryKeyValueStore::Keys(std::string_view prefix) const {
  std::lock_guard<std::mutex> guard(mutex_);
  std::vector<std::string> keys;
  for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) {
      break;
    }
    keys.push_back(it->first);
  }
  return keys;
}

FileKeyValueStore::FileKeyValueStore(std::filesystem::path root) : root_(std::move(root)) {
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, ec.value(),
                "Failed to create store directory " + ha::PathToUtf8String(root_) + ": " +
                    ec.message(),
                ec.value(), Retryability::kRetryable};
  }
}

std::filesystem::path FileKeyValueStore::PathFor(std::string_view key) const {
  RequireValidKey(key);
  std::string name(key);
  name.append(kEntrySuffix);
  return root_ / name;
}

std::optional<std::vector<uint8_t>> FileKeyValueStore::Get(std::string_view key) const {
  const auto path = PathFor(key);
  std::lock_guard<std::mutex> guard(mutex_);
  return ReadFileBytes(path);
}

void FileKeyValueStore::Put(std::string_view key, std::span<const uint8_t> value) {
  const auto path = PathFor(key);
  std::lock_guard<std::mutex> guard(mutex_);
  AtomicReplace(path, value);
}

bool FileKeyValueStore::Erase(std::string_view key) {
  const auto path = PathFor(key);
  std::lock_guard<std::mutex> guard(mutex_);
  return RemoveDurably(path);
}

std::vector<std::string> FileKeyValueStore::Keys(std::string_view prefix) const {
  std::lock_guard<std::mutex> guard(mutex_);
  std::vector<std::string> keys;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file()) {
      continue;
    }
    const std::string name = it->path().filename().string();
    if (name.size() <= kEntrySuffix.size() ||
        name.compare(name.size() - kEntrySuffix.size(), kEntrySuffix.size(), kEntrySuffix) != 0) {
      continue;
    }
    std::string key = name.substr(0, name.size() - kEntrySuffix.size());
    if (key.compare(0, prefix.size(), prefix) == 0 && IsValidStoreKey(key)) {
      keys.push_back(std::move(key));
    }
  }
  if (ec) {
    throw Error{ErrorDomain::IO, ec.value(),
                "Failed to list store directory " + ha::PathToUtf8String(root_) + ": " + ec.message(),
                ec.value()};
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

}  // namespace ha::storage
