// src/text.hpp
// Internal Unicode helpers shared by the name-processing sources; not part of
// the public headers.
#pragma once
#include <string>
#include <vector>
#include <unicode/unistr.h>

namespace avc {
namespace text {

// UTF-8 -> UTF-16. Ill-formed input is replaced with U+FFFD.
icu::UnicodeString decode(const std::string& utf8);
std::string encode(const icu::UnicodeString& s);

// Unicode White_Space plus U+FEFF.
bool is_space(char16_t c) noexcept;

icu::UnicodeString trim(const icu::UnicodeString& s);

// Splits on runs of white space; no empty words.
std::vector<icu::UnicodeString> split_words(const icu::UnicodeString& s);

// Root-locale case mapping, independent of the process locale.
icu::UnicodeString to_lower(icu::UnicodeString s);
icu::UnicodeString to_upper(icu::UnicodeString s);

// First extended grapheme cluster of s; empty for empty s.
icu::UnicodeString first_grapheme(const icu::UnicodeString& s);

} // namespace text
} // namespace avc
