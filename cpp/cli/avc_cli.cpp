#include "avc/avc.hpp"
#include "avc/distribution.hpp"
#include "avc/tokens.hpp"
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static std::string fixed2(double v) {
  char buf[32];
  std::snprintf(buf, sizeof buf, "%.2f", v);
  return buf;
}

int main(int argc, char** argv) {
  // Flags: --saturation=N, --lightness=N, --contrast=R, --full-name,
  //        --limited, --aaa, --json. Everything else is a name.
  avc::Config cfg;
  bool as_json = false;
  std::vector<std::string> names;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    try {
      if (a.rfind("--saturation=", 0) == 0) {
        cfg.saturation = std::stoi(a.substr(13));
      } else if (a.rfind("--lightness=", 0) == 0) {
        cfg.lightness = std::stoi(a.substr(12));
      } else if (a.rfind("--contrast=", 0) == 0) {
        cfg.min_contrast_ratio = std::stod(a.substr(11));
      } else if (a == "--full-name") {
        cfg.basis = avc::ColorBasis::FullName;
      } else if (a == "--limited") {
        cfg.palette = avc::PaletteMode::Limited12;
      } else if (a == "--aaa") {
        cfg.force_aaa = true;
      } else if (a == "--json") {
        as_json = true;
      } else if (a.rfind("--", 0) == 0) {
        std::cerr << "skip '" << a << "': unknown flag\n";
      } else {
        names.push_back(a);
      }
    } catch (const std::logic_error& e) { // stoi/stod: invalid or out of range
      std::cerr << "skip '" << a << "': " << e.what() << "\n";
    }
  }
  if (names.empty()) {
    std::cerr << "usage: avc_cli [--saturation=N] [--lightness=N] "
                 "[--contrast=R] [--full-name] [--limited] [--aaa] [--json] "
                 "NAME...\n";
    return 2;
  }

  try {
    if (as_json) {
      std::cout << avc::export_tokens(names, cfg).dump(2) << "\n";
      return 0;
    }

    const auto results = avc::resolve_all(names, cfg);
    for (const auto& av : results) {
      std::cout << av.initials << " " << av.hex << " | "
                << avc::format_hsl(av) << " | text="
                << avc::text_color_hex(av.text_color)
                << " | contrast=" << fixed2(av.contrast_ratio) << ":1 | "
                << avc::wcag_label(av.wcag) << " | " << av.source_name << "\n";
    }

    const auto report = avc::analyze(results, cfg.palette);
    for (const auto& e : report.entries) {
      std::cout << (e.severity == avc::Severity::Warning ? "warning: "
                                                         : "info: ")
                << avc::describe(e) << "\n";
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
