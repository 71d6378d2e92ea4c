// include/avc/avc.hpp
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "color.hpp"

namespace avc {

// Bump when the result contract changes (hues, colours or labels move).
inline constexpr const char* AVC_VERSION = "0.1.0";

// What the hue hash is computed over.
enum class ColorBasis { Initials, FullName };

// FullSpectrum: hue = hash mod 360. Limited12: 12 buckets, 30 degrees apart.
enum class PaletteMode { FullSpectrum, Limited12 };

enum class WcagLevel { AAAPass, AAPass, AAPassAAAFail, FailBelow4_5, FailBelow3 };

// Status of a contrast ratio relative to the configured threshold.
enum class ContrastGrade { Pass, Warn, Fail };

// Ratio targets used by the classifier and the forced-AAA adjustment.
inline constexpr double kRatioAAA = 7.0;
inline constexpr double kRatioAA = 4.5;
inline constexpr double kRatioLargeText = 3.0;

// Per-call knobs; defaults match the playground's initial state.
struct Config {
  int saturation = 65;              // percent, [0,100]
  int lightness = 45;               // percent, [0,100]
  ColorBasis basis = ColorBasis::Initials;
  PaletteMode palette = PaletteMode::FullSpectrum;
  double min_contrast_ratio = kRatioAA; // nominal threshold (4.5 or 7)
  bool force_aaa = false;           // search lightness for >= 7:1
};

// One avatar. Built fresh by resolve(); never mutated afterwards.
struct AvatarResult {
  std::string source_name;  // trimmed input
  std::string initials;     // 1-2 grapheme clusters, "?" for blank names
  int hue = 0;              // [0,360)
  int saturation = 0;
  int lightness = 0;        // after any contrast adjustment
  Rgb rgb;
  std::string hex;          // "#rrggbb", lowercase
  TextColor text_color = TextColor::White;
  double contrast_ratio = 1.0; // of the final background against text_color
  WcagLevel wcag = WcagLevel::FailBelow3;
};

// Throws std::invalid_argument for out-of-range percentages or a
// non-positive / non-finite contrast threshold.
void validate(const Config& cfg);

// Hue in [0,360) for a name. FullName hashes the trimmed lowercase name,
// Initials hashes extract_initials(name).
int hue_for(const std::string& name, ColorBasis basis, PaletteMode palette);

// >=7 AAA; >=4.5 AA (relabelled AAPassAAAFail when the nominal threshold is
// 7 or more); >=3 FailBelow4_5; otherwise FailBelow3.
WcagLevel classify_wcag(double ratio, double nominal_threshold) noexcept;

// Stable English label, e.g. "AA Pass (AAA Fail)".
const char* wcag_label(WcagLevel level) noexcept;

ContrastGrade contrast_grade(double ratio, double nominal_threshold) noexcept;

// Stable identifier: "full-spectrum" or "limited-12".
const char* palette_key(PaletteMode palette) noexcept;

// "hsl(H, S%, L%)" of the final colour.
std::string format_hsl(const AvatarResult& r);

// Full pipeline for one name. Pure: identical arguments give identical
// results. Throws std::invalid_argument only for an invalid cfg.
AvatarResult resolve(const std::string& name, const Config& cfg);

// resolve() over a batch; output order matches input order.
std::vector<AvatarResult> resolve_all(const std::vector<std::string>& names,
                                      const Config& cfg);

} // namespace avc
