// src/tokens.cpp
#include "avc/tokens.hpp"
#include "text.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace avc {
namespace {

using json = nlohmann::ordered_json;

// Export precision for contrast ratios. Agrees with JavaScript's
// Number(v.toFixed(2)) except when v*100 lands exactly on a binary half-way
// point.
double round2(double v) { return std::round(v * 100.0) / 100.0; }

json settings_of(const Config& cfg) {
  json s;
  s["saturation"] = cfg.saturation;
  s["lightness"] = cfg.lightness;
  s["palette"] = palette_key(cfg.palette);
  s["color-basis"] =
      cfg.basis == ColorBasis::FullName ? "full-name" : "initials";
  s["forced-contrast"] = cfg.force_aaa ? "AAA" : "none";
  return s;
}

json entry_of(const AvatarResult& av) {
  json e;
  e["name"] = av.source_name;
  e["initials"] = av.initials;
  e["background"] = av.hex;
  e["text-color"] = text_color_hex(av.text_color);
  e["hsl"] = format_hsl(av);
  e["contrast-ratio"] = round2(av.contrast_ratio);
  e["wcag"] = wcag_label(av.wcag);
  return e;
}

} // namespace

std::string token_key(const std::string& name) {
  const icu::UnicodeString lower =
      text::to_lower(text::trim(text::decode(name)));
  std::string key;
  bool in_space = false;
  for (std::int32_t i = 0; i < lower.length(); ++i) {
    const char16_t c = lower.charAt(i);
    if (text::is_space(c)) {
      if (!in_space)
        key += '-';
      in_space = true;
      continue;
    }
    in_space = false;
    if ((c >= u'a' && c <= u'z') || (c >= u'0' && c <= u'9') || c == u'-')
      key += static_cast<char>(c);
  }
  return key;
}

json export_tokens(const std::vector<std::string>& names, const Config& cfg) {
  validate(cfg);

  json colors = json::object();
  for (const auto& n : names) {
    if (text::trim(text::decode(n)).isEmpty())
      continue;
    colors[token_key(n)] = entry_of(resolve(n, cfg));
  }
  if (colors.empty())
    throw std::invalid_argument("no names to export");

  json strategy;
  strategy["description"] =
      "Avatar colour strategy generated by avc " + std::string(AVC_VERSION);
  strategy["settings"] = settings_of(cfg);
  strategy["colors"] = std::move(colors);

  json doc;
  doc["avatar-color-strategy"] = std::move(strategy);
  return doc;
}

} // namespace avc
