#pragma once

#include <cstddef>
#include <cstdint>

namespace asciify {

/** One symbol substitution: a single non-ASCII codepoint and its ASCII text. */
struct Replacement {
  char32_t codepoint;
  const char* ascii;
};

/** First and last codepoint of the Combining Diacritical Marks block. */
constexpr char32_t kCombiningMarkFirst = 0x0300;
constexpr char32_t kCombiningMarkLast = 0x036F;

inline bool IsCombiningMark(char32_t cp) {
  return cp >= kCombiningMarkFirst && cp <= kCombiningMarkLast;
}

/**
 * The canonical symbol table, sorted by codepoint.
 * Covers typographic quotes, dashes, ellipsis, a few math/bullet signs,
 * the degree sign, common currencies and the copyright family.
 */
const Replacement* ReplacementTable();

/** Number of entries in ReplacementTable(). */
size_t ReplacementTableSize();

/**
 * Look up the ASCII substitution for a codepoint.
 * @return the substitution, or nullptr if the codepoint is not in the table.
 */
const char* LookupReplacement(char32_t cp);

}  // namespace asciify
