#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace asciify {

/**
 * Length counts of one conversion.
 *
 * in_chars counts UTF-16 code units of the input (a precomposed "é" is 1,
 * an astral emoji is 2). out_chars is the byte length of the ASCII output.
 */
struct ConversionStats {
  size_t in_chars = 0;
  size_t out_chars = 0;

  /**
   * Signed difference in_chars - out_chars.
   * Negative when expanding substitutions (e.g. "€" -> "EUR",
   * "°" -> " deg ") outweigh the characters dropped.
   */
  int64_t Removed() const {
    return static_cast<int64_t>(in_chars) - static_cast<int64_t>(out_chars);
  }
};

/** The ASCII text and its stats. */
struct ConversionResult {
  std::string ascii;
  ConversionStats stats;
};

/**
 * Transliterate UTF-8 text to ASCII (codepoints 0-127).
 *
 * Pipeline, in order: NFD decomposition, symbol substitution, combining
 * mark removal, removal of every remaining non-ASCII codepoint, space/tab
 * collapse, CRLF/CR -> LF, per-line trailing whitespace trim, global trim.
 *
 * Accepts any byte sequence: malformed UTF-8 decodes to U+FFFD, which the
 * non-ASCII step then drops. The output is a fixed point:
 * Convert(Convert(x).ascii).ascii == Convert(x).ascii.
 */
ConversionResult Convert(std::string_view utf8);

/** Same as above for UTF-16 input; unpaired surrogates are dropped. */
ConversionResult Convert(std::u16string_view utf16);

/** Convert(utf8).ascii without the stats. */
std::string ToASCII(std::string_view utf8);

/** True if every byte of `text` is in [0, 127]. */
bool IsASCII(std::string_view text);

}  // namespace asciify
