// src/hash.cpp
#include "avc/hash.hpp"
#include "text.hpp"
#include <cstdint>
#include <string>

namespace avc {
namespace {

constexpr std::uint32_t kSeedA = 0xdeadbeefu;
constexpr std::uint32_t kSeedB = 0x41c6ce57u;
constexpr std::uint32_t kMulA = 2654435761u;
constexpr std::uint32_t kMulB = 1597334677u;
constexpr std::uint32_t kMixA = 2246822507u;
constexpr std::uint32_t kMixB = 3266489909u;
constexpr std::uint32_t kHighMask = 0x1fffffu; // 21 bits -> 53-bit result

// Wrapping 32x32 multiply, low half kept.
inline constexpr std::uint32_t mul32(std::uint32_t a, std::uint32_t b) {
  return static_cast<std::uint32_t>(static_cast<std::uint64_t>(a) * b);
}

} // namespace

std::uint64_t hash_units(const char16_t* units, std::size_t n) noexcept {
  std::uint32_t h1 = kSeedA;
  std::uint32_t h2 = kSeedB;
  for (std::size_t i = 0; i < n; ++i) {
    const std::uint32_t ch = units[i];
    h1 = mul32(h1 ^ ch, kMulA);
    h2 = mul32(h2 ^ ch, kMulB);
  }

  // Avalanche; each lane folds in the other.
  h1 = mul32(h1 ^ (h1 >> 16), kMixA);
  h1 ^= mul32(h2 ^ (h2 >> 13), kMixB);
  h2 = mul32(h2 ^ (h2 >> 16), kMixA);
  h2 ^= mul32(h1 ^ (h1 >> 13), kMixB);

  return (static_cast<std::uint64_t>(h2 & kHighMask) << 32) | h1;
}

std::uint64_t hash_text(const std::u16string& s) noexcept {
  return hash_units(s.data(), s.size());
}

std::uint64_t hash_text(const std::string& utf8) {
  const icu::UnicodeString u = text::decode(utf8);
  return hash_units(u.getBuffer(), static_cast<std::size_t>(u.length()));
}

} // namespace avc
