// src/text.cpp
#include "text.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/utypes.h>

namespace avc {
namespace text {

icu::UnicodeString decode(const std::string& utf8) {
  return icu::UnicodeString::fromUTF8(
      icu::StringPiece(utf8.data(), static_cast<std::int32_t>(utf8.size())));
}

std::string encode(const icu::UnicodeString& s) {
  std::string out;
  s.toUTF8String(out);
  return out;
}

bool is_space(char16_t c) noexcept {
  // Every White_Space code point is in the BMP, so a lone unit is enough.
  return c == 0xfeff || u_isUWhiteSpace(static_cast<UChar32>(c));
}

icu::UnicodeString trim(const icu::UnicodeString& s) {
  std::int32_t begin = 0;
  std::int32_t end = s.length();
  while (begin < end && is_space(s.charAt(begin)))
    ++begin;
  while (end > begin && is_space(s.charAt(end - 1)))
    --end;
  return icu::UnicodeString(s, begin, end - begin);
}

std::vector<icu::UnicodeString> split_words(const icu::UnicodeString& s) {
  std::vector<icu::UnicodeString> words;
  const std::int32_t n = s.length();
  std::int32_t i = 0;
  while (i < n) {
    while (i < n && is_space(s.charAt(i)))
      ++i;
    const std::int32_t start = i;
    while (i < n && !is_space(s.charAt(i)))
      ++i;
    if (i > start)
      words.emplace_back(s, start, i - start);
  }
  return words;
}

icu::UnicodeString to_lower(icu::UnicodeString s) {
  s.toLower(icu::Locale::getRoot());
  return s;
}

icu::UnicodeString to_upper(icu::UnicodeString s) {
  s.toUpper(icu::Locale::getRoot());
  return s;
}

icu::UnicodeString first_grapheme(const icu::UnicodeString& s) {
  if (s.isEmpty())
    return s;

  UErrorCode status = U_ZERO_ERROR;
  std::unique_ptr<icu::BreakIterator> it(
      icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(),
                                                  status));
  if (U_FAILURE(status) || !it)
    throw std::runtime_error(std::string("icu: cannot create grapheme iterator: ") +
                             u_errorName(status));

  it->setText(s);
  it->first();
  std::int32_t end = it->next();
  if (end == icu::BreakIterator::DONE)
    end = s.length();
  return icu::UnicodeString(s, 0, end);
}

} // namespace text
} // namespace avc
