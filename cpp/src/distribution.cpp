// src/distribution.cpp
#include "avc/distribution.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

namespace avc {
namespace {

std::string one_decimal(double v) {
  char buf[32];
  std::snprintf(buf, sizeof buf, "%.1f", v);
  return buf;
}

const char* palette_prose(PaletteMode p) {
  return p == PaletteMode::Limited12 ? "12-colour palette" : "full spectrum";
}

} // namespace

DistributionReport analyze(const std::vector<int>& hues, std::size_t name_count,
                           PaletteMode palette) {
  if (hues.size() != name_count)
    throw std::invalid_argument("hue count does not match name count");
  for (int h : hues) {
    if (h < 0 || h >= 360)
      throw std::invalid_argument("hue out of range: " + std::to_string(h));
  }

  DistributionReport rep;
  if (name_count < 2)
    return rep;

  std::vector<int> sorted(hues);
  std::sort(sorted.begin(), sorted.end());

  double min_gap = 360.0;
  std::size_t collisions = 0;
  for (std::size_t i = 0; i < sorted.size(); ++i) {
    const std::size_t next = (i + 1) % sorted.size();
    // Last entry wraps around to the first.
    const int gap = next == 0 ? 360 - sorted[i] + sorted[0]
                              : sorted[next] - sorted[i];
    min_gap = std::min(min_gap, static_cast<double>(gap));
    if (gap < kCollisionDegrees)
      ++collisions;
  }

  rep.min_gap = min_gap;
  rep.ideal_gap = 360.0 / static_cast<double>(name_count);
  rep.collision_count = collisions;

  DistributionEntry base;
  base.min_gap = rep.min_gap;
  base.ideal_gap = rep.ideal_gap;
  base.palette = palette;

  if (collisions > 0) {
    DistributionEntry e = base;
    e.severity = Severity::Warning;
    e.kind = EntryKind::HueCollision;
    e.collisions = collisions;
    e.threshold_degrees = kCollisionDegrees;
    rep.entries.push_back(e);
  }
  if (min_gap < kNarrowSpreadDegrees && name_count > 3) {
    DistributionEntry e = base;
    e.severity = Severity::Warning;
    e.kind = EntryKind::NarrowSpread;
    e.threshold_degrees = kNarrowSpreadDegrees;
    rep.entries.push_back(e);
  }
  DistributionEntry summary = base;
  summary.severity = Severity::Info;
  summary.kind = EntryKind::SpreadSummary;
  rep.entries.push_back(summary);
  return rep;
}

DistributionReport analyze(const std::vector<AvatarResult>& results,
                           PaletteMode palette) {
  std::vector<int> hues;
  hues.reserve(results.size());
  for (const auto& r : results)
    hues.push_back(r.hue);
  return analyze(hues, results.size(), palette);
}

const char* entry_kind_key(EntryKind kind) noexcept {
  switch (kind) {
  case EntryKind::HueCollision:
    return "hue-collision";
  case EntryKind::NarrowSpread:
    return "narrow-spread";
  case EntryKind::SpreadSummary:
    break;
  }
  return "spread-summary";
}

std::string describe(const DistributionEntry& e) {
  switch (e.kind) {
  case EntryKind::HueCollision:
    return std::to_string(e.collisions) + " colour pair(s) within " +
           one_decimal(e.threshold_degrees) +
           " degrees of each other; they may be hard to tell apart.";
  case EntryKind::NarrowSpread:
    return "Minimum hue distance is only " + one_decimal(e.min_gap) +
           " degrees. Consider a limited palette or another hash basis.";
  case EntryKind::SpreadSummary:
    break;
  }
  return "Hue spread: min " + one_decimal(e.min_gap) + " deg | ideal " +
         one_decimal(e.ideal_gap) + " deg per name | " +
         palette_prose(e.palette);
}

} // namespace avc
