#include <asciify/transliterate.hpp>

#include <iostream>
#include <string>

int main() {
  const char* inputs[] = {
      "caf\xC3\xA9",
      "\xE2\x80\x9CHello\xE2\x80\x9D \xE2\x80\x94 world\xE2\x80\xA6",
      "\xE2\x82\xAC" "100",
      "a   b\tc",
      "\xE4\xB8\xAD\xE6\x96\x87",
  };

  for (const char* input : inputs) {
    auto result = asciify::Convert(input);
    std::cout << "[" << input << "] -> [" << result.ascii << "]"
              << " in=" << result.stats.in_chars
              << " out=" << result.stats.out_chars
              << " removed=" << result.stats.Removed() << "\n";
  }

  // Converting ASCII output again is a no-op.
  std::string once = asciify::ToASCII("Fran\xC3\xA7" "ais na\xC3\xAF" "ve");
  std::cout << once << (asciify::ToASCII(once) == once ? " (stable)" : " (unstable!)")
            << "\n";
  return 0;
}
