#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <unicode/unistr.h>

namespace asciify::internal {

/**
 * The rule steps of the transliteration pipeline, in application order.
 * Each rule must run after the ones before it:
 *   - decomposition before mark stripping, so accents become separable;
 *   - symbol substitution before the non-ASCII drop, so typographic
 *     punctuation is translated instead of deleted.
 */
enum class Rule {
  kDecompose,              // Unicode NFD
  kSubstituteSymbols,      // ReplacementTable lookups
  kStripCombiningMarks,    // U+0300..U+036F
  kStripNonASCII,          // catch-all drop of codepoints >= 128
  kCollapseBlanks,         // runs of space/tab -> one space
  kNormalizeLineEndings,   // CRLF / CR -> LF
  kTrimLineEnds,           // trailing whitespace of every line
  kTrim                    // leading/trailing whitespace of the whole text
};

constexpr size_t kRuleCount = 8;

constexpr Rule kRuleOrder[kRuleCount] = {
    Rule::kDecompose,        Rule::kSubstituteSymbols,
    Rule::kStripCombiningMarks, Rule::kStripNonASCII,
    Rule::kCollapseBlanks,   Rule::kNormalizeLineEndings,
    Rule::kTrimLineEnds,     Rule::kTrim,
};

/** Short snake_case name of a rule, for listings and logs. */
const char* RuleName(Rule rule);

// --- Individual rules (in-place over UTF-16 text) ---

/**
 * Canonical decomposition via ICU.
 * @throws std::runtime_error if ICU cannot provide the NFD normalizer
 *         (missing ICU data); never for a particular input.
 */
void Decompose(icu::UnicodeString& text);

void SubstituteSymbols(icu::UnicodeString& text);
void StripCombiningMarks(icu::UnicodeString& text);
void StripNonASCII(icu::UnicodeString& text);
void CollapseBlanks(icu::UnicodeString& text);
void NormalizeLineEndings(icu::UnicodeString& text);

// Trailing space, tab, VT and FF are removed from every LF-terminated line.
void TrimLineEnds(icu::UnicodeString& text);

// Leading and trailing space, tab, LF, VT, FF and CR are removed.
void Trim(icu::UnicodeString& text);

void ApplyRule(Rule rule, icu::UnicodeString& text);

/**
 * Apply the rules kRuleOrder[first, last) in order.
 * Out-of-range bounds are clamped to kRuleCount.
 */
void ApplyRules(icu::UnicodeString& text, size_t first, size_t last);

/** Apply the first `count` rules to UTF-8 text and return UTF-8. */
std::string ApplyRules(std::string_view utf8, size_t count);

// --- UTF-8 <-> UTF-16 helpers ---

/** Decode UTF-8; malformed sequences become U+FFFD. */
icu::UnicodeString FromUTF8(std::string_view utf8);

/** Encode as UTF-8; unpaired surrogates become U+FFFD. */
std::string ToUTF8(const icu::UnicodeString& text);

}  // namespace asciify::internal
