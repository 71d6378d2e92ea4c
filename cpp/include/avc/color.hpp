// include/avc/color.hpp
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace avc {

struct Rgb {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;
};

inline bool operator==(const Rgb& a, const Rgb& b) {
  return a.r == b.r && a.g == b.g && a.b == b.b;
}
inline bool operator!=(const Rgb& a, const Rgb& b) { return !(a == b); }

enum class TextColor { White, Black };

// Raised when a string is not exactly '#' followed by 6 hex digits.
class InvalidColorFormat : public std::invalid_argument {
public:
  explicit InvalidColorFormat(const std::string& what)
      : std::invalid_argument(what) {}
};

// Standard chroma / hue-segment conversion. h is wrapped into [0,360),
// s and l are clamped to [0,100]; channels are rounded to nearest.
Rgb hsl_to_rgb(double h, double s, double l) noexcept;

// "#rrggbb", lowercase.
std::string rgb_to_hex(const Rgb& c);

// Inverse of rgb_to_hex. Accepts upper or lower case digits.
// Throws InvalidColorFormat.
Rgb hex_to_rgb(const std::string& hex);

// WCAG 2.1 relative luminance in [0,1].
double relative_luminance(const Rgb& c) noexcept;

// (lighter + 0.05) / (darker + 0.05); argument order does not matter.
double contrast_ratio(double l1, double l2) noexcept;

// White or black, whichever contrasts more with c. Ties go to white.
TextColor best_text_color(const Rgb& c) noexcept;

const char* text_color_hex(TextColor t) noexcept;
Rgb text_color_rgb(TextColor t) noexcept;

// Contrast of background c against a white or black foreground.
double contrast_against(const Rgb& c, TextColor t) noexcept;

std::string format_hsl(int h, int s, int l);

} // namespace avc
