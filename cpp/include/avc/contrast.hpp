// include/avc/contrast.hpp
#pragma once
#include "color.hpp"

namespace avc {

// Search bounds for adjust_lightness.
inline constexpr int kLightnessFloor = 10;
inline constexpr int kLightnessCeiling = 90;

// Returns a lightness whose colour reaches required_ratio against the text
// colour picked at the initial lightness. Walks down to kLightnessFloor for
// white text, up to kLightnessCeiling for black text; the direction is fixed
// up front and never re-evaluated. If no step qualifies the initial lightness
// is returned unchanged.
int adjust_lightness(int hue, int saturation, int lightness,
                     double required_ratio) noexcept;

} // namespace avc
