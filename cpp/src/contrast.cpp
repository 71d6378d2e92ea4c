// src/contrast.cpp
#include "avc/contrast.hpp"

namespace avc {

int adjust_lightness(int hue, int saturation, int lightness,
                     double required_ratio) noexcept {
  // Common case: already readable, no search.
  const Rgb start = hsl_to_rgb(hue, saturation, lightness);
  const TextColor text = best_text_color(start);
  if (contrast_against(start, text) >= required_ratio)
    return lightness;

  // The text colour is locked to the one chosen at the starting lightness,
  // even if the other one would win further along the walk.
  if (text == TextColor::White) {
    for (int l = lightness; l >= kLightnessFloor; --l) {
      if (contrast_against(hsl_to_rgb(hue, saturation, l), TextColor::White) >=
          required_ratio)
        return l;
    }
  } else {
    for (int l = lightness; l <= kLightnessCeiling; ++l) {
      if (contrast_against(hsl_to_rgb(hue, saturation, l), TextColor::Black) >=
          required_ratio)
        return l;
    }
  }
  return lightness; // unreachable target: keep the configured value
}

} // namespace avc
