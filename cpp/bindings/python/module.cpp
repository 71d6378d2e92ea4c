#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "avc/avc.hpp"
#include "avc/distribution.hpp"
#include "avc/tokens.hpp"

namespace py = pybind11;

static avc::Config make_config(int saturation, int lightness, bool full_name,
                               bool limited, double min_contrast,
                               bool force_aaa) {
  avc::Config cfg;
  cfg.saturation = saturation;
  cfg.lightness = lightness;
  cfg.basis = full_name ? avc::ColorBasis::FullName : avc::ColorBasis::Initials;
  cfg.palette =
      limited ? avc::PaletteMode::Limited12 : avc::PaletteMode::FullSpectrum;
  cfg.min_contrast_ratio = min_contrast;
  cfg.force_aaa = force_aaa;
  return cfg;
}

static py::dict resolve_py(const std::string& name, int saturation,
                           int lightness, bool full_name, bool limited,
                           double min_contrast, bool force_aaa) {
  const avc::Config cfg = make_config(saturation, lightness, full_name,
                                      limited, min_contrast, force_aaa);
  avc::AvatarResult av;
  {
    py::gil_scoped_release nogil;
    av = avc::resolve(name, cfg);
  }

  py::dict out;
  out["name"] = av.source_name;
  out["initials"] = av.initials;
  out["hue"] = av.hue;
  out["saturation"] = av.saturation;
  out["lightness"] = av.lightness;
  out["rgb"] = py::make_tuple(av.rgb.r, av.rgb.g, av.rgb.b);
  out["hex"] = av.hex;
  out["hsl"] = avc::format_hsl(av);
  out["text_color"] = avc::text_color_hex(av.text_color);
  out["contrast_ratio"] = av.contrast_ratio;
  out["wcag"] = avc::wcag_label(av.wcag);
  return out;
}

static py::dict analyze_py(const std::vector<int>& hues, bool limited) {
  const auto palette =
      limited ? avc::PaletteMode::Limited12 : avc::PaletteMode::FullSpectrum;
  const auto rep = avc::analyze(hues, hues.size(), palette);

  py::list entries;
  for (const auto& e : rep.entries) {
    py::dict d;
    d["severity"] = e.severity == avc::Severity::Warning ? "warning" : "info";
    d["kind"] = avc::entry_kind_key(e.kind);
    d["collisions"] = py::int_(e.collisions);
    d["threshold_degrees"] = e.threshold_degrees;
    d["min_gap"] = e.min_gap;
    d["ideal_gap"] = e.ideal_gap;
    d["palette"] = avc::palette_key(e.palette);
    d["message"] = avc::describe(e); // default English text
    entries.append(d);
  }

  py::dict out;
  out["min_gap"] = rep.min_gap;
  out["ideal_gap"] = rep.ideal_gap;
  out["collision_count"] = py::int_(rep.collision_count);
  out["entries"] = entries;
  return out;
}

static std::string export_tokens_py(const std::vector<std::string>& names,
                                    int saturation, int lightness,
                                    bool full_name, bool limited,
                                    double min_contrast, bool force_aaa) {
  const avc::Config cfg = make_config(saturation, lightness, full_name,
                                      limited, min_contrast, force_aaa);
  return avc::export_tokens(names, cfg).dump(2);
}

PYBIND11_MODULE(avccore, m) {
  m.doc() = "Deterministic accessible avatar colours (pybind11)";
  m.attr("__version__") = avc::AVC_VERSION;

  py::register_exception<avc::InvalidColorFormat>(m, "InvalidColorFormat",
                                                  PyExc_ValueError);

  m.def("resolve", &resolve_py,
      py::arg("name"),
      py::arg("saturation") = 65,
      py::arg("lightness") = 45,
      py::arg("full_name") = false,
      py::arg("limited") = false,
      py::arg("min_contrast") = 4.5,
      py::arg("force_aaa") = false,
      R"pbdoc(
Resolve one display name to its avatar colours.

Args:
  name (str): display name (UTF-8).
  saturation, lightness (int): HSL percentages in [0, 100].
  full_name (bool): hash the full name instead of the initials.
  limited (bool): quantise hues to 12 buckets 30 degrees apart.
  min_contrast (float): nominal WCAG threshold (4.5 or 7).
  force_aaa (bool): search lightness for a 7:1 contrast.

Returns:
  dict { name, initials, hue, saturation, lightness, rgb, hex, hsl,
         text_color, contrast_ratio, wcag }.
)pbdoc");

  m.def("analyze", &analyze_py,
        py::arg("hues"), py::arg("limited") = false,
        R"pbdoc(
Hue-gap analysis.

Returns:
  dict { min_gap, ideal_gap, collision_count, entries }, where each entry is
  { severity, kind, collisions, threshold_degrees, min_gap, ideal_gap,
    palette, message } in collision / narrow-spread / summary order.
)pbdoc");

  m.def("hex_to_rgb", [](const std::string& hex) {
          const avc::Rgb c = avc::hex_to_rgb(hex);
          return py::make_tuple(c.r, c.g, c.b);
        },
        py::arg("hex"),
        R"pbdoc(Parse '#rrggbb'; raises InvalidColorFormat otherwise.)pbdoc");

  m.def("export_tokens", &export_tokens_py,
        py::arg("names"),
        py::arg("saturation") = 65,
        py::arg("lightness") = 45,
        py::arg("full_name") = false,
        py::arg("limited") = false,
        py::arg("min_contrast") = 4.5,
        py::arg("force_aaa") = false,
        R"pbdoc(Design-token JSON document for `names`.)pbdoc");
}
