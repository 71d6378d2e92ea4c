#include "avc/tokens.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using Catch::Matchers::WithinAbs;

TEST_CASE("Token keys are slugged names") {
  using avc::token_key;
  REQUIRE(token_key("Ludwig van Beethoven") == "ludwig-van-beethoven");
  REQUIRE(token_key("  Jan   de Vries! ") == "jan-de-vries");
  REQUIRE(token_key("O'Brien-Smith") == "obrien-smith");
  REQUIRE(token_key("Jos\xC3\xA9 N\xC3\xBA\xC3\xB1\x65z") == "jos-nez");
}

TEST_CASE("Export document layout") {
  avc::Config cfg;
  cfg.palette = avc::PaletteMode::Limited12;
  const auto doc =
      avc::export_tokens({"Ludwig van Beethoven", "  ", "Madonna"}, cfg);

  const auto& s = doc.at("avatar-color-strategy");
  REQUIRE(s.begin().key() == "description");
  const auto& settings = s.at("settings");
  REQUIRE(settings.at("saturation") == 65);
  REQUIRE(settings.at("lightness") == 45);
  REQUIRE(settings.at("palette") == "limited-12");
  REQUIRE(settings.at("color-basis") == "initials");
  REQUIRE(settings.at("forced-contrast") == "none");

  const auto& colors = s.at("colors");
  REQUIRE(colors.size() == 2); // blank name skipped
  const auto& lvb = colors.at("ludwig-van-beethoven");
  REQUIRE(lvb.at("name") == "Ludwig van Beethoven");
  REQUIRE(lvb.at("initials") == "LB");
  REQUIRE(lvb.at("background") == "#28bd28");
  REQUIRE(lvb.at("text-color") == "#000000");
  REQUIRE(lvb.at("hsl") == "hsl(120, 65%, 45%)");
  REQUIRE_THAT(lvb.at("contrast-ratio").get<double>(), WithinAbs(8.40, 1e-9));
  REQUIRE(lvb.at("wcag") == "AAA Pass");
}

TEST_CASE("Export rounds contrast to two decimals") {
  const auto doc = avc::export_tokens({"Ludwig van Beethoven"}, avc::Config{});
  const auto& e =
      doc.at("avatar-color-strategy").at("colors").at("ludwig-van-beethoven");
  REQUIRE_THAT(e.at("contrast-ratio").get<double>(), WithinAbs(5.64, 1e-9));
  REQUIRE(e.at("wcag") == "AA Pass");
}

TEST_CASE("Export without names is rejected") {
  REQUIRE_THROWS_AS(avc::export_tokens({}, avc::Config{}), std::invalid_argument);
  REQUIRE_THROWS_AS(avc::export_tokens({"", "  "}, avc::Config{}),
                    std::invalid_argument);
}
