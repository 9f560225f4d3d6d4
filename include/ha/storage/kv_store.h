#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ha::storage {

// Durable key/value record store. Implementations give read-your-writes
// within a process; no stronger consistency is assumed by callers.
class KeyValueStore {
 public:
  virtual ~KeyValueStore() = default;

  virtual std::optional<std::vector<uint8_t>> Get(std::string_view key) const = 0;
  virtual void Put(std::string_view key, std::span<const uint8_t> value) = 0;
  // Returns false when the key was absent.
  virtual bool Erase(std::string_view key) = 0;
  // Keys beginning with |prefix|, in lexicographic order.
  virtual std::vector<std::string> Keys(std::string_view prefix) const = 0;
};

// Keys are limited to [A-Za-z0-9_.-], 1..128 characters, so they map
// directly to file names.
bool IsValidStoreKey(std::string_view key) noexcept;

class MemoryKeyValueStore : public KeyValueStore {
 public:
  std::optional<std::vector<uint8_t>> Get(std::string_view key) const override;
  void Put(std::string_view key, std::span<const uint8_t> value) override;
  bool Erase(std::string_view key) override;
  std::vector<std::string> Keys(std::string_view prefix) const override;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::vector<uint8_t>, std::less<>> entries_;
};

// One file per key inside |root|; every Put is an atomic replace.
class FileKeyValueStore : public KeyValueStore {
 public:
  explicit FileKeyValueStore(std::filesystem::path root);

  std::optional<std::vector<uint8_t>> Get(std::string_view key) const override;
  void Put(std::string_view key, std::span<const uint8_t> value) override;
  bool Erase(std::string_view key) override;
  std::vector<std::string> Keys(std::string_view prefix) const override;

  [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

 private:
  std::filesystem::path PathFor(std::string_view key) const;

  std::filesystem::path root_;
  mutable std::mutex mutex_;
};

}  // namespace ha::storage
