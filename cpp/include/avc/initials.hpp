// include/avc/initials.hpp
#pragma once
#include <string>

namespace avc {

// Avatar label for a UTF-8 name: first grapheme of the first and last
// significant words, uppercased. Affix particles ("van", "de", "bin", ...)
// are not significant unless every word is one. Blank names give "?".
std::string extract_initials(const std::string& name);

// Case-insensitive membership in the particle set.
bool is_name_particle(const std::string& word);

} // namespace avc
