#include <asciify/replacement_table.hpp>

#include <algorithm>

namespace asciify {

namespace {

// Sorted by codepoint for binary search
constexpr Replacement kReplacements[] = {
    {0x00A2, "c"},      // cent sign
    {0x00A3, "GBP"},    // pound sign
    {0x00A5, "YEN"},    // yen sign
    {0x00A9, "(c)"},    // copyright
    {0x00AB, "\""},     // left guillemet
    {0x00AE, "(R)"},    // registered
    {0x00B0, " deg "},  // degree
    {0x00B7, "."},      // middle dot
    {0x00BB, "\""},     // right guillemet
    {0x00D7, "x"},      // multiplication
    {0x00F7, "/"},      // division
    {0x2010, "-"},      // hyphen
    {0x2011, "-"},      // non-breaking hyphen
    {0x2012, "-"},      // figure dash
    {0x2013, "-"},      // en dash
    {0x2014, "-"},      // em dash
    {0x2018, "'"},      // left single quote
    {0x2019, "'"},      // right single quote
    {0x201A, "'"},      // single low-9 quote
    {0x201C, "\""},     // left double quote
    {0x201D, "\""},     // right double quote
    {0x201E, "\""},     // double low-9 quote
    {0x2022, "*"},      // bullet
    {0x2026, "..."},    // horizontal ellipsis
    {0x2032, "'"},      // prime
    {0x2033, "\""},     // double prime
    {0x20AC, "EUR"},    // euro
    {0x2122, "(TM)"},   // trademark
};

constexpr size_t kReplacementsCount = sizeof(kReplacements) / sizeof(kReplacements[0]);

}  // namespace

const Replacement* ReplacementTable() { return kReplacements; }

size_t ReplacementTableSize() { return kReplacementsCount; }

const char* LookupReplacement(char32_t cp) {
  // Everything in the table lives above Latin-1 controls
  if (cp < 0xA0) return nullptr;

  const Replacement* end = kReplacements + kReplacementsCount;
  const Replacement* it = std::lower_bound(
      kReplacements, end, cp,
      [](const Replacement& r, char32_t value) { return r.codepoint < value; });
  if (it == end || it->codepoint != cp) return nullptr;
  return it->ascii;
}

}  // namespace asciify
