// src/hue.cpp
#include "avc/avc.hpp"
#include "avc/hash.hpp"
#include "avc/initials.hpp"
#include "text.hpp"

#include <cstdint>
#include <string>

namespace avc {

int hue_for(const std::string& name, ColorBasis basis, PaletteMode palette) {
  std::uint64_t h = 0;
  if (basis == ColorBasis::FullName) {
    const icu::UnicodeString key = text::to_lower(text::trim(text::decode(name)));
    h = hash_units(key.getBuffer(), static_cast<std::size_t>(key.length()));
  } else {
    h = hash_text(extract_initials(name));
  }

  // h is unsigned, so no abs() is needed before the modulo.
  if (palette == PaletteMode::Limited12)
    return static_cast<int>(h % 12) * 30;
  return static_cast<int>(h % 360);
}

} // namespace avc
