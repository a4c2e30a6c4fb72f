// Unit tests for asciify/replacement_table.hpp
// Tests: table ordering, key/value ranges, lookups

#include <gtest/gtest.h>

#include <asciify/replacement_table.hpp>
#include <asciify/transliterate.hpp>

#include <cstdint>
#include <string>

namespace asciify {
namespace {

// =============================================================================
// Table Shape Tests
// =============================================================================

TEST(ReplacementTableTest, NotEmpty) {
  ASSERT_NE(ReplacementTable(), nullptr);
  EXPECT_GT(ReplacementTableSize(), 0u);
}

TEST(ReplacementTableTest, SortedWithoutDuplicates) {
  const Replacement* table = ReplacementTable();
  for (size_t i = 1; i < ReplacementTableSize(); ++i) {
    EXPECT_LT(table[i - 1].codepoint, table[i].codepoint) << "at index " << i;
  }
}

TEST(ReplacementTableTest, KeysAreNonASCII) {
  const Replacement* table = ReplacementTable();
  for (size_t i = 0; i < ReplacementTableSize(); ++i) {
    EXPECT_GE(table[i].codepoint, 0x80u) << "at index " << i;
    EXPECT_FALSE(IsCombiningMark(table[i].codepoint));
  }
}

TEST(ReplacementTableTest, ValuesArePrintableASCII) {
  const Replacement* table = ReplacementTable();
  for (size_t i = 0; i < ReplacementTableSize(); ++i) {
    ASSERT_NE(table[i].ascii, nullptr);
    std::string value = table[i].ascii;
    EXPECT_FALSE(value.empty()) << "U+" << std::hex << static_cast<uint32_t>(table[i].codepoint);
    EXPECT_TRUE(IsASCII(value)) << "U+" << std::hex << static_cast<uint32_t>(table[i].codepoint);
  }
}

// =============================================================================
// Lookup Tests
// =============================================================================

TEST(LookupReplacementTest, Punctuation) {
  EXPECT_STREQ(LookupReplacement(0x2018), "'");
  EXPECT_STREQ(LookupReplacement(0x2019), "'");
  EXPECT_STREQ(LookupReplacement(0x201C), "\"");
  EXPECT_STREQ(LookupReplacement(0x201D), "\"");
  EXPECT_STREQ(LookupReplacement(0x00AB), "\"");
  EXPECT_STREQ(LookupReplacement(0x00BB), "\"");
  EXPECT_STREQ(LookupReplacement(0x2013), "-");
  EXPECT_STREQ(LookupReplacement(0x2014), "-");
  EXPECT_STREQ(LookupReplacement(0x2026), "...");
  EXPECT_STREQ(LookupReplacement(0x2022), "*");
}

TEST(LookupReplacementTest, SymbolsAndCurrencies) {
  EXPECT_STREQ(LookupReplacement(0x00B0), " deg ");
  EXPECT_STREQ(LookupReplacement(0x00A9), "(c)");
  EXPECT_STREQ(LookupReplacement(0x00AE), "(R)");
  EXPECT_STREQ(LookupReplacement(0x2122), "(TM)");
  EXPECT_STREQ(LookupReplacement(0x20AC), "EUR");
  EXPECT_STREQ(LookupReplacement(0x00A3), "GBP");
  EXPECT_STREQ(LookupReplacement(0x00D7), "x");
  EXPECT_STREQ(LookupReplacement(0x00F7), "/");
}

TEST(LookupReplacementTest, EveryEntryFindsItself) {
  const Replacement* table = ReplacementTable();
  for (size_t i = 0; i < ReplacementTableSize(); ++i) {
    EXPECT_EQ(LookupReplacement(table[i].codepoint), table[i].ascii);
  }
}

TEST(LookupReplacementTest, UnmappedReturnsNull) {
  EXPECT_EQ(LookupReplacement('a'), nullptr);
  EXPECT_EQ(LookupReplacement(0x7F), nullptr);
  EXPECT_EQ(LookupReplacement(0x00E9), nullptr);   // é decomposes instead
  EXPECT_EQ(LookupReplacement(0x4E2D), nullptr);   // 中
  EXPECT_EQ(LookupReplacement(0x1F600), nullptr);  // emoji
  EXPECT_EQ(LookupReplacement(0x10FFFF), nullptr);
}

TEST(CombiningMarkTest, BlockBounds) {
  EXPECT_FALSE(IsCombiningMark(0x02FF));
  EXPECT_TRUE(IsCombiningMark(0x0300));
  EXPECT_TRUE(IsCombiningMark(0x0301));
  EXPECT_TRUE(IsCombiningMark(0x036F));
  EXPECT_FALSE(IsCombiningMark(0x0370));
}

}  // namespace
}  // namespace asciify
