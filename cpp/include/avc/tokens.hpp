// include/avc/tokens.hpp
#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "avc.hpp"

namespace avc {

// Key used for a name in the "colors" object: trimmed, lowercased,
// white-space runs to '-', then everything outside [a-z0-9-] dropped.
std::string token_key(const std::string& name);

// Design-token document for a set of names under one Config:
// { "avatar-color-strategy": { description, settings, colors } }.
// Blank names are skipped; throws std::invalid_argument if none remain.
nlohmann::ordered_json export_tokens(const std::vector<std::string>& names,
                                     const Config& cfg);

} // namespace avc
