// include/avc/hash.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace avc {

// Stable 53-bit hash over UTF-16 code units (two 32-bit lanes, multiply-xor
// per unit, avalanche, then 21 bits of lane 2 above the 32 bits of lane 1).
// Never depends on std::hash, so values are identical across processes and
// platforms. Always < 2^53.
std::uint64_t hash_units(const char16_t* units, std::size_t n) noexcept;

std::uint64_t hash_text(const std::u16string& s) noexcept;

// UTF-8 input is decoded to UTF-16 first; invalid sequences become U+FFFD.
std::uint64_t hash_text(const std::string& utf8);

} // namespace avc
