#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace ha::tlv {

struct Record {
  uint16_t type{0};
  std::span<const uint8_t> value{};
};

// Splits a buffer of little-endian (type, length, value) triples. The parser
// borrows |buffer|; records are only valid while it lives.
class Parser {
 public:
  Parser(std::span<const uint8_t> buffer, std::size_t max_records = 64,
         std::size_t max_payload = 64 * 1024 - 1);

  [[nodiscard]] bool valid() const noexcept { return valid_; }
  [[nodiscard]] std::size_t consumed() const noexcept { return consumed_; }
  [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

  [[nodiscard]] auto begin() const noexcept { return records_.begin(); }
  [[nodiscard]] auto end() const noexcept { return records_.end(); }

  // First record of |type|, if any.
  [[nodiscard]] std::optional<Record> Find(uint16_t type) const noexcept;
  [[nodiscard]] std::size_t Count(uint16_t type) const noexcept;

 private:
  bool valid_{false};
  std::size_t consumed_{0};
  std::vector<Record> records_{};
};

}  // namespace ha::tlv
