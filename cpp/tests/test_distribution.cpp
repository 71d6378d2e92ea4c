#include "avc/distribution.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using Catch::Matchers::WithinAbs;

TEST_CASE("Fewer than two names gives a neutral report") {
  using avc::PaletteMode; using avc::analyze;
  auto rep = analyze(std::vector<int>{}, 0, PaletteMode::FullSpectrum);
  REQUIRE(rep.entries.empty());
  REQUIRE(rep.collision_count == 0);

  rep = analyze(std::vector<int>{42}, 1, PaletteMode::FullSpectrum);
  REQUIRE(rep.entries.empty());
  REQUIRE(rep.collision_count == 0);
  REQUIRE(rep.min_gap == 360.0);
}

TEST_CASE("Three names: collision reported, spread warning gated") {
  using avc::EntryKind; using avc::Severity;
  const auto rep = avc::analyze(std::vector<int>{180, 0, 5}, 3,
                                avc::PaletteMode::FullSpectrum);
  REQUIRE_THAT(rep.min_gap, WithinAbs(5.0, 1e-12));
  REQUIRE_THAT(rep.ideal_gap, WithinAbs(120.0, 1e-12));
  REQUIRE(rep.collision_count == 1);

  // nameCount > 3 is false, so no spread warning.
  REQUIRE(rep.entries.size() == 2);
  REQUIRE(rep.entries[0].kind == EntryKind::HueCollision);
  REQUIRE(rep.entries[0].severity == Severity::Warning);
  REQUIRE(rep.entries[0].collisions == 1);
  REQUIRE(rep.entries[0].threshold_degrees == avc::kCollisionDegrees);
  REQUIRE(rep.entries[1].kind == EntryKind::SpreadSummary);
  REQUIRE(rep.entries[1].severity == Severity::Info);
}

TEST_CASE("Four names with a narrow gap add the spread warning") {
  using avc::EntryKind;
  const auto rep = avc::analyze(std::vector<int>{0, 3, 180, 270}, 4,
                                avc::PaletteMode::Limited12);
  REQUIRE_THAT(rep.min_gap, WithinAbs(3.0, 1e-12));
  REQUIRE_THAT(rep.ideal_gap, WithinAbs(90.0, 1e-12));
  REQUIRE(rep.collision_count == 1);
  REQUIRE(rep.entries.size() == 3);
  REQUIRE(rep.entries[0].kind == EntryKind::HueCollision);
  REQUIRE(rep.entries[1].kind == EntryKind::NarrowSpread);
  REQUIRE(rep.entries[2].kind == EntryKind::SpreadSummary);
  REQUIRE(rep.entries[2].palette == avc::PaletteMode::Limited12);
}

TEST_CASE("Gaps wrap around the hue circle") {
  const auto rep = avc::analyze(std::vector<int>{355, 2}, 2,
                                avc::PaletteMode::FullSpectrum);
  REQUIRE_THAT(rep.min_gap, WithinAbs(7.0, 1e-12));
  REQUIRE(rep.collision_count == 1);
}

TEST_CASE("Identical hues collide") {
  const auto rep = avc::analyze(std::vector<int>{10, 10}, 2,
                                avc::PaletteMode::FullSpectrum);
  REQUIRE(rep.min_gap == 0.0);
  REQUIRE(rep.collision_count == 1);
  REQUIRE(rep.entries.size() == 2);
}

TEST_CASE("An evenly spread palette only gets the summary") {
  std::vector<int> hues;
  for (int i = 0; i < 12; ++i)
    hues.push_back(i * 30);
  const auto rep = avc::analyze(hues, hues.size(), avc::PaletteMode::Limited12);
  REQUIRE_THAT(rep.min_gap, WithinAbs(30.0, 1e-12));
  REQUIRE(rep.collision_count == 0);
  REQUIRE(rep.entries.size() == 1);
  REQUIRE(rep.entries[0].kind == avc::EntryKind::SpreadSummary);
}

TEST_CASE("Bad input is rejected") {
  using avc::PaletteMode; using avc::analyze;
  REQUIRE_THROWS_AS(analyze(std::vector<int>{0, 360}, 2, PaletteMode::FullSpectrum),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(analyze(std::vector<int>{-1, 20}, 2, PaletteMode::FullSpectrum),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(analyze(std::vector<int>{0, 20}, 3, PaletteMode::FullSpectrum),
                    std::invalid_argument);
}

TEST_CASE("Analysis over resolved avatars") {
  const std::vector<std::string> names = {"Jan de Vries", "Jan Visser",
                                          "Madonna"};
  const auto results = avc::resolve_all(names, avc::Config{});
  const auto rep = avc::analyze(results, avc::PaletteMode::FullSpectrum);
  // Same initials -> same hue.
  REQUIRE(rep.min_gap == 0.0);
  REQUIRE(rep.collision_count == 1);
}

TEST_CASE("Entries render to English text") {
  const auto rep = avc::analyze(std::vector<int>{0, 3, 180, 270}, 4,
                                avc::PaletteMode::FullSpectrum);
  REQUIRE(avc::describe(rep.entries[0]).rfind("1 colour pair(s) within 10.0", 0) == 0);
  REQUIRE(avc::describe(rep.entries[1]).find("only 3.0 degrees") != std::string::npos);
  REQUIRE(avc::describe(rep.entries[2]) ==
          "Hue spread: min 3.0 deg | ideal 90.0 deg per name | full spectrum");
}

TEST_CASE("A gap of exactly 10 degrees is not a collision") {
  const auto rep = avc::analyze(std::vector<int>{0, 10, 180}, 3,
                                avc::PaletteMode::FullSpectrum);
  REQUIRE_THAT(rep.min_gap, WithinAbs(10.0, 1e-12));
  REQUIRE(rep.collision_count == 0);
  REQUIRE(rep.entries.size() == 1);
  REQUIRE(rep.entries[0].kind == avc::EntryKind::SpreadSummary);
}

TEST_CASE("A minimum gap of exactly 5 degrees is not a narrow spread") {
  using avc::EntryKind;
  const auto rep = avc::analyze(std::vector<int>{0, 5, 100, 200}, 4,
                                avc::PaletteMode::FullSpectrum);
  REQUIRE_THAT(rep.min_gap, WithinAbs(5.0, 1e-12));
  REQUIRE(rep.collision_count == 1);
  REQUIRE(rep.entries.size() == 2);
  REQUIRE(rep.entries[0].kind == EntryKind::HueCollision);
  REQUIRE(rep.entries[1].kind == EntryKind::SpreadSummary);
  for (const auto& e : rep.entries)
    REQUIRE(e.kind != EntryKind::NarrowSpread);
}

TEST_CASE("Entries carry stable identifiers for kind and palette") {
  using avc::EntryKind; using avc::PaletteMode;
  REQUIRE(std::string(avc::entry_kind_key(EntryKind::HueCollision)) == "hue-collision");
  REQUIRE(std::string(avc::entry_kind_key(EntryKind::NarrowSpread)) == "narrow-spread");
  REQUIRE(std::string(avc::entry_kind_key(EntryKind::SpreadSummary)) == "spread-summary");
  REQUIRE(std::string(avc::palette_key(PaletteMode::FullSpectrum)) == "full-spectrum");
  REQUIRE(std::string(avc::palette_key(PaletteMode::Limited12)) == "limited-12");

  const auto rep = avc::analyze(std::vector<int>{0, 3, 180, 270}, 4,
                                PaletteMode::Limited12);
  const auto& collision = rep.entries[0];
  REQUIRE(std::string(avc::entry_kind_key(collision.kind)) == "hue-collision");
  REQUIRE(collision.collisions == 1);
  REQUIRE_THAT(collision.min_gap, WithinAbs(3.0, 1e-12));
  REQUIRE_THAT(collision.ideal_gap, WithinAbs(90.0, 1e-12));
  REQUIRE(std::string(avc::palette_key(collision.palette)) == "limited-12");
  REQUIRE(rep.entries[1].threshold_degrees == avc::kNarrowSpreadDegrees);
}
