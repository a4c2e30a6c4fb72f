#include <asciify/transliterate.hpp>
#include <asciify/internal.hpp>

#include <algorithm>
#include <limits>

namespace asciify {

namespace {

ConversionResult ConvertText(icu::UnicodeString text) {
  ConversionResult result;
  result.stats.in_chars = static_cast<size_t>(text.length());

  internal::ApplyRules(text, 0, internal::kRuleCount);

  result.ascii = internal::ToUTF8(text);
  result.stats.out_chars = result.ascii.size();
  return result;
}

}  // namespace

ConversionResult Convert(std::string_view utf8) {
  if (utf8.empty()) return ConversionResult{};
  return ConvertText(internal::FromUTF8(utf8));
}

ConversionResult Convert(std::u16string_view utf16) {
  if (utf16.empty()) return ConversionResult{};

  const size_t max_len = static_cast<size_t>(std::numeric_limits<int32_t>::max());
  const int32_t len = static_cast<int32_t>(std::min(utf16.size(), max_len));
  return ConvertText(icu::UnicodeString(utf16.data(), len));
}

std::string ToASCII(std::string_view utf8) {
  return Convert(utf8).ascii;
}

bool IsASCII(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](char c) {
    return static_cast<unsigned char>(c) < 0x80;
  });
}

}  // namespace asciify
