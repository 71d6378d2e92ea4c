// src/color.cpp
#include "avc/color.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace avc {
namespace {

inline std::uint8_t to_channel(double v) {
  const long n = std::lround(v * 255.0);
  return static_cast<std::uint8_t>(std::clamp(n, 0L, 255L));
}

// sRGB channel -> linear light, WCAG 2.1 constants.
inline double linearize(std::uint8_t c) {
  const double s = c / 255.0;
  return s <= 0.03928 ? s / 12.92 : std::pow((s + 0.055) / 1.055, 2.4);
}

inline int hex_digit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

Rgb hsl_to_rgb(double h, double s, double l) noexcept {
  h = std::fmod(h, 360.0);
  if (h < 0)
    h += 360.0;
  s = std::clamp(s, 0.0, 100.0) / 100.0;
  l = std::clamp(l, 0.0, 100.0) / 100.0;

  const double c = (1.0 - std::fabs(2.0 * l - 1.0)) * s;
  const double x = c * (1.0 - std::fabs(std::fmod(h / 60.0, 2.0) - 1.0));
  const double m = l - c / 2.0;

  double r, g, b;
  if (h < 60) {
    r = c; g = x; b = 0;
  } else if (h < 120) {
    r = x; g = c; b = 0;
  } else if (h < 180) {
    r = 0; g = c; b = x;
  } else if (h < 240) {
    r = 0; g = x; b = c;
  } else if (h < 300) {
    r = x; g = 0; b = c;
  } else {
    r = c; g = 0; b = x;
  }
  return Rgb{to_channel(r + m), to_channel(g + m), to_channel(b + m)};
}

std::string rgb_to_hex(const Rgb& c) {
  static const char* hex = "0123456789abcdef";
  const std::uint8_t ch[3] = {c.r, c.g, c.b};
  std::string out = "#";
  out.reserve(7);
  for (std::uint8_t v : ch) {
    out += hex[(v >> 4) & 0xF];
    out += hex[v & 0xF];
  }
  return out;
}

Rgb hex_to_rgb(const std::string& hex) {
  if (hex.size() != 7 || hex[0] != '#')
    throw InvalidColorFormat("invalid colour '" + hex + "': expected #rrggbb");
  std::uint8_t ch[3];
  for (int i = 0; i < 3; ++i) {
    const int hi = hex_digit(hex[1 + 2 * i]);
    const int lo = hex_digit(hex[2 + 2 * i]);
    if (hi < 0 || lo < 0)
      throw InvalidColorFormat("invalid colour '" + hex +
                               "': non-hex digit");
    ch[i] = static_cast<std::uint8_t>(hi << 4 | lo);
  }
  return Rgb{ch[0], ch[1], ch[2]};
}

double relative_luminance(const Rgb& c) noexcept {
  return 0.2126 * linearize(c.r) + 0.7152 * linearize(c.g) +
         0.0722 * linearize(c.b);
}

double contrast_ratio(double l1, double l2) noexcept {
  const double lighter = std::max(l1, l2);
  const double darker = std::min(l1, l2);
  return (lighter + 0.05) / (darker + 0.05);
}

TextColor best_text_color(const Rgb& c) noexcept {
  const double bg = relative_luminance(c);
  const double white = contrast_ratio(1.0, bg);
  const double black = contrast_ratio(bg, 0.0);
  return white >= black ? TextColor::White : TextColor::Black;
}

const char* text_color_hex(TextColor t) noexcept {
  return t == TextColor::White ? "#ffffff" : "#000000";
}

Rgb text_color_rgb(TextColor t) noexcept {
  return t == TextColor::White ? Rgb{255, 255, 255} : Rgb{0, 0, 0};
}

double contrast_against(const Rgb& c, TextColor t) noexcept {
  return contrast_ratio(relative_luminance(c),
                        relative_luminance(text_color_rgb(t)));
}

std::string format_hsl(int h, int s, int l) {
  return "hsl(" + std::to_string(h) + ", " + std::to_string(s) + "%, " +
         std::to_string(l) + "%)";
}

} // namespace avc
