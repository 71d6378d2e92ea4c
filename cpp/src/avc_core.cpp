// src/avc_core.cpp
#include "avc/avc.hpp"
#include "avc/color.hpp"
#include "avc/contrast.hpp"
#include "avc/initials.hpp"
#include "text.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace avc {

void validate(const Config& cfg) {
  if (cfg.saturation < 0 || cfg.saturation > 100)
    throw std::invalid_argument("saturation must be in [0,100]");
  if (cfg.lightness < 0 || cfg.lightness > 100)
    throw std::invalid_argument("lightness must be in [0,100]");
  if (!std::isfinite(cfg.min_contrast_ratio) || cfg.min_contrast_ratio <= 0.0)
    throw std::invalid_argument("min_contrast_ratio must be a positive number");
}

WcagLevel classify_wcag(double ratio, double nominal_threshold) noexcept {
  if (ratio >= kRatioAAA)
    return WcagLevel::AAAPass;
  if (ratio >= kRatioAA)
    return nominal_threshold >= kRatioAAA ? WcagLevel::AAPassAAAFail
                                          : WcagLevel::AAPass;
  if (ratio >= kRatioLargeText)
    return WcagLevel::FailBelow4_5;
  return WcagLevel::FailBelow3;
}

const char* wcag_label(WcagLevel level) noexcept {
  switch (level) {
  case WcagLevel::AAAPass:
    return "AAA Pass";
  case WcagLevel::AAPass:
    return "AA Pass";
  case WcagLevel::AAPassAAAFail:
    return "AA Pass (AAA Fail)";
  case WcagLevel::FailBelow4_5:
    return "AA Fail";
  case WcagLevel::FailBelow3:
    break;
  }
  return "Fail";
}

ContrastGrade contrast_grade(double ratio, double nominal_threshold) noexcept {
  if (ratio < kRatioLargeText)
    return ContrastGrade::Fail;
  if (ratio < nominal_threshold)
    return ContrastGrade::Warn;
  return ContrastGrade::Pass;
}

const char* palette_key(PaletteMode palette) noexcept {
  return palette == PaletteMode::Limited12 ? "limited-12" : "full-spectrum";
}

std::string format_hsl(const AvatarResult& r) {
  return format_hsl(r.hue, r.saturation, r.lightness);
}

AvatarResult resolve(const std::string& name, const Config& cfg) {
  validate(cfg);

  AvatarResult out;
  out.source_name = text::encode(text::trim(text::decode(name)));
  out.initials = extract_initials(name);
  out.hue = hue_for(name, cfg.basis, cfg.palette);
  out.saturation = cfg.saturation;
  out.lightness = cfg.force_aaa ? adjust_lightness(out.hue, cfg.saturation,
                                                   cfg.lightness, kRatioAAA)
                                : cfg.lightness;

  // Everything below is derived from the final lightness.
  out.rgb = hsl_to_rgb(out.hue, out.saturation, out.lightness);
  out.hex = rgb_to_hex(out.rgb);
  out.text_color = best_text_color(out.rgb);
  out.contrast_ratio = contrast_against(out.rgb, out.text_color);
  out.wcag = classify_wcag(out.contrast_ratio, cfg.min_contrast_ratio);
  return out;
}

std::vector<AvatarResult> resolve_all(const std::vector<std::string>& names,
                                      const Config& cfg) {
  std::vector<AvatarResult> out;
  out.reserve(names.size());
  for (const auto& n : names)
    out.push_back(resolve(n, cfg));
  return out;
}

} // namespace avc
