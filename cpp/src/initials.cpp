// src/initials.cpp
#include "avc/initials.hpp"
#include "text.hpp"

#include <string>
#include <vector>

namespace avc {
namespace {

// Lowercase name-affix particles (Dutch, German, French, Italian, Spanish,
// Arabic) that do not stand for a surname on their own.
const char16_t* const kParticles[] = {
    u"van", u"de",   u"der",   u"den", u"het", u"ter", u"ten", u"te",
    u"la",  u"le",   u"les",   u"du",  u"des", u"von", u"zu",  u"di",
    u"da",  u"del",  u"della", u"el",  u"al",  u"bin", u"ibn"};

bool is_particle(const icu::UnicodeString& word) {
  const icu::UnicodeString lower = text::to_lower(word);
  for (const char16_t* p : kParticles) {
    if (lower == icu::UnicodeString(p))
      return true;
  }
  return false;
}

icu::UnicodeString leading_upper(const icu::UnicodeString& word) {
  return text::to_upper(text::first_grapheme(word));
}

} // namespace

bool is_name_particle(const std::string& word) {
  return is_particle(text::trim(text::decode(word)));
}

std::string extract_initials(const std::string& name) {
  const icu::UnicodeString trimmed = text::trim(text::decode(name));
  if (trimmed.isEmpty())
    return "?";

  const std::vector<icu::UnicodeString> words = text::split_words(trimmed);
  std::vector<icu::UnicodeString> significant;
  for (const auto& w : words) {
    if (!is_particle(w))
      significant.push_back(w);
  }
  // All particles ("Van", "de la"): fall back to the literal words.
  const std::vector<icu::UnicodeString>& source =
      significant.empty() ? words : significant;

  icu::UnicodeString out = leading_upper(source.front());
  if (source.size() > 1)
    out += leading_upper(source.back());
  return text::encode(out);
}

} // namespace avc
