// include/avc/distribution.hpp
#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "avc.hpp"

namespace avc {

// Two hues closer than this count as a collision.
inline constexpr double kCollisionDegrees = 10.0;
// Minimum gap below which (with more than 3 names) the spread is too narrow.
inline constexpr double kNarrowSpreadDegrees = 5.0;

enum class Severity { Warning, Info };

enum class EntryKind { HueCollision, NarrowSpread, SpreadSummary };

// Structured report line; callers turn it into prose.
struct DistributionEntry {
  Severity severity = Severity::Info;
  EntryKind kind = EntryKind::SpreadSummary;
  std::size_t collisions = 0;     // HueCollision
  double threshold_degrees = 0.0; // HueCollision / NarrowSpread
  double min_gap = 0.0;
  double ideal_gap = 0.0;
  PaletteMode palette = PaletteMode::FullSpectrum;
};

struct DistributionReport {
  double min_gap = 360.0;
  double ideal_gap = 360.0;
  std::size_t collision_count = 0;
  // Order is fixed: collision warning, spread warning, summary.
  std::vector<DistributionEntry> entries;
};

// Circular gap analysis over hues in [0,360). Fewer than two names gives the
// neutral report (no entries). Throws std::invalid_argument if a hue is out
// of range or hues.size() != name_count.
DistributionReport analyze(const std::vector<int>& hues, std::size_t name_count,
                           PaletteMode palette);

DistributionReport analyze(const std::vector<AvatarResult>& results,
                           PaletteMode palette);

// Stable identifier: "hue-collision", "narrow-spread" or "spread-summary".
const char* entry_kind_key(EntryKind kind) noexcept;

// Default English rendering of an entry.
std::string describe(const DistributionEntry& e);

} // namespace avc
