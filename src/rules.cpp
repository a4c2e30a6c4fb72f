#include <asciify/internal.hpp>
#include <asciify/replacement_table.hpp>

#include <unicode/normalizer2.h>
#include <unicode/stringpiece.h>
#include <unicode/utf16.h>
#include <unicode/utypes.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

namespace asciify::internal {

namespace {

const icu::Normalizer2& NfdInstance() {
  // ICU owns the instance; it lives until u_cleanup()
  static const icu::Normalizer2* nfd = [] {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* instance = icu::Normalizer2::getNFDInstance(status);
    if (U_FAILURE(status) || instance == nullptr) {
      throw std::runtime_error(std::string("ICU NFD normalizer unavailable: ") +
                               u_errorName(status));
    }
    return instance;
  }();
  return *nfd;
}

inline bool IsBlank(char16_t c) { return c == u' ' || c == u'\t'; }

inline bool IsLineEndSpace(char16_t c) {
  return c == u' ' || c == u'\t' || c == u'\v' || c == u'\f';
}

inline bool IsTrimSpace(char16_t c) {
  return c == u' ' || c == u'\t' || c == u'\n' || c == u'\v' || c == u'\f' ||
         c == u'\r';
}

// Rebuild `text` keeping only the codepoints for which keep(cp) is true
template <typename Pred>
void RetainCodepoints(icu::UnicodeString& text, Pred keep) {
  icu::UnicodeString out;
  const int32_t len = text.length();
  for (int32_t i = 0; i < len;) {
    UChar32 cp = text.char32At(i);
    int32_t n = U16_LENGTH(cp);
    if (keep(cp)) {
      out.append(text, i, n);
    }
    i += n;
  }
  text = std::move(out);
}

}  // namespace

const char* RuleName(Rule rule) {
  switch (rule) {
    case Rule::kDecompose: return "decompose";
    case Rule::kSubstituteSymbols: return "substitute_symbols";
    case Rule::kStripCombiningMarks: return "strip_combining_marks";
    case Rule::kStripNonASCII: return "strip_non_ascii";
    case Rule::kCollapseBlanks: return "collapse_blanks";
    case Rule::kNormalizeLineEndings: return "normalize_line_endings";
    case Rule::kTrimLineEnds: return "trim_line_ends";
    case Rule::kTrim: return "trim";
  }
  return "unknown";
}

void Decompose(icu::UnicodeString& text) {
  if (text.isEmpty()) return;

  const icu::Normalizer2& nfd = NfdInstance();
  UErrorCode status = U_ZERO_ERROR;
  icu::UnicodeString out = nfd.normalize(text, status);
  if (U_FAILURE(status)) {
    throw std::runtime_error(std::string("NFD normalization failed: ") +
                             u_errorName(status));
  }
  text = std::move(out);
}

void SubstituteSymbols(icu::UnicodeString& text) {
  icu::UnicodeString out;
  const int32_t len = text.length();
  for (int32_t i = 0; i < len;) {
    UChar32 cp = text.char32At(i);
    int32_t n = U16_LENGTH(cp);
    const char* ascii = cp >= 0 ? LookupReplacement(static_cast<char32_t>(cp)) : nullptr;
    if (ascii) {
      for (const char* p = ascii; *p; ++p) {
        out.append(static_cast<char16_t>(*p));
      }
    } else {
      out.append(text, i, n);
    }
    i += n;
  }
  text = std::move(out);
}

void StripCombiningMarks(icu::UnicodeString& text) {
  RetainCodepoints(text, [](UChar32 cp) {
    return !IsCombiningMark(static_cast<char32_t>(cp));
  });
}

void StripNonASCII(icu::UnicodeString& text) {
  RetainCodepoints(text, [](UChar32 cp) { return cp >= 0 && cp < 0x80; });
}

void CollapseBlanks(icu::UnicodeString& text) {
  icu::UnicodeString out;
  bool in_blank = false;
  const int32_t len = text.length();
  for (int32_t i = 0; i < len; ++i) {
    char16_t c = text.charAt(i);
    if (IsBlank(c)) {
      if (!in_blank) {
        out.append(u' ');
        in_blank = true;
      }
      continue;
    }
    in_blank = false;
    out.append(c);
  }
  text = std::move(out);
}

void NormalizeLineEndings(icu::UnicodeString& text) {
  icu::UnicodeString out;
  const int32_t len = text.length();
  for (int32_t i = 0; i < len; ++i) {
    char16_t c = text.charAt(i);
    if (c == u'\r') {
      out.append(u'\n');
      if (i + 1 < len && text.charAt(i + 1) == u'\n') {
        ++i;
      }
      continue;
    }
    out.append(c);
  }
  text = std::move(out);
}

void TrimLineEnds(icu::UnicodeString& text) {
  icu::UnicodeString out;
  const int32_t len = text.length();
  int32_t line_start = 0;
  while (line_start <= len) {
    int32_t line_end = text.indexOf(u'\n', line_start);
    if (line_end < 0) line_end = len;

    int32_t keep_end = line_end;
    while (keep_end > line_start && IsLineEndSpace(text.charAt(keep_end - 1))) {
      --keep_end;
    }
    out.append(text, line_start, keep_end - line_start);

    if (line_end == len) break;
    out.append(u'\n');
    line_start = line_end + 1;
  }
  text = std::move(out);
}

void Trim(icu::UnicodeString& text) {
  int32_t start = 0;
  int32_t end = text.length();
  while (start < end && IsTrimSpace(text.charAt(start))) ++start;
  while (end > start && IsTrimSpace(text.charAt(end - 1))) --end;
  if (start == 0 && end == text.length()) return;
  text = icu::UnicodeString(text, start, end - start);
}

void ApplyRule(Rule rule, icu::UnicodeString& text) {
  switch (rule) {
    case Rule::kDecompose: Decompose(text); break;
    case Rule::kSubstituteSymbols: SubstituteSymbols(text); break;
    case Rule::kStripCombiningMarks: StripCombiningMarks(text); break;
    case Rule::kStripNonASCII: StripNonASCII(text); break;
    case Rule::kCollapseBlanks: CollapseBlanks(text); break;
    case Rule::kNormalizeLineEndings: NormalizeLineEndings(text); break;
    case Rule::kTrimLineEnds: TrimLineEnds(text); break;
    case Rule::kTrim: Trim(text); break;
  }
}

void ApplyRules(icu::UnicodeString& text, size_t first, size_t last) {
  last = std::min(last, kRuleCount);
  for (size_t i = first; i < last; ++i) {
    ApplyRule(kRuleOrder[i], text);
  }
}

std::string ApplyRules(std::string_view utf8, size_t count) {
  icu::UnicodeString text = FromUTF8(utf8);
  ApplyRules(text, 0, count);
  return ToUTF8(text);
}

icu::UnicodeString FromUTF8(std::string_view utf8) {
  if (utf8.empty()) return icu::UnicodeString();

  // UnicodeString is int32-indexed; longer input is cut at the limit
  const size_t max_len = static_cast<size_t>(std::numeric_limits<int32_t>::max());
  const int32_t len = static_cast<int32_t>(std::min(utf8.size(), max_len));
  return icu::UnicodeString::fromUTF8(icu::StringPiece(utf8.data(), len));
}

std::string ToUTF8(const icu::UnicodeString& text) {
  std::string out;
  text.toUTF8String(out);
  return out;
}

}  // namespace asciify::internal
