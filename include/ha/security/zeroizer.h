#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace ha::security {

// Key material wiping. Writes go through OPENSSL_cleanse so the compiler
// cannot elide them as dead stores.
class Zeroizer {
public:
  static void Wipe(std::span<uint8_t> data) noexcept;

  template <std::size_t N>
  static void Wipe(std::array<uint8_t, N>& bytes) noexcept {
    Wipe(std::span<uint8_t>(bytes.data(), bytes.size()));
  }

  static void WipeVector(std::vector<uint8_t>& bytes) noexcept {
    Wipe(std::span<uint8_t>(bytes.data(), bytes.size()));
    bytes.clear();
  }

  static void WipeString(std::string& text) noexcept {
    Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(text.data()), text.size()));
    text.clear();
  }

  // Wipes the viewed bytes when the scope ends, including on unwind.
  class ScopeWiper {
  public:
    explicit ScopeWiper(std::span<uint8_t> bytes) noexcept : bytes_(bytes) {}
    template <std::size_t N>
    explicit ScopeWiper(std::array<uint8_t, N>& bytes) noexcept
        : bytes_(bytes.data(), bytes.size()) {}

    ScopeWiper(const ScopeWiper&) = delete;
    ScopeWiper& operator=(const ScopeWiper&) = delete;

    ~ScopeWiper() noexcept { Zeroizer::Wipe(bytes_); }

  private:
    std::span<uint8_t> bytes_;
  };
};

}  // namespace ha::security
