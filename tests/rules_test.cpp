// Unit tests for asciify/internal.hpp pipeline rules
// Tests: each rule in isolation, rule ordering, UTF-8/UTF-16 helpers

#include <gtest/gtest.h>

#include <asciify/internal.hpp>
#include <asciify/transliterate.hpp>

#include <set>
#include <string>

namespace asciify::internal {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

std::string RunRule(Rule rule, const std::string& utf8) {
  icu::UnicodeString text = FromUTF8(utf8);
  ApplyRule(rule, text);
  return ToUTF8(text);
}

// =============================================================================
// Rule Metadata Tests
// =============================================================================

TEST(RuleOrderTest, NamesAreDistinct) {
  std::set<std::string> names;
  for (Rule rule : kRuleOrder) {
    std::string name = RuleName(rule);
    EXPECT_FALSE(name.empty());
    EXPECT_NE(name, "unknown");
    names.insert(name);
  }
  EXPECT_EQ(names.size(), kRuleCount);
}

TEST(RuleOrderTest, DecomposeBeforeStrip) {
  EXPECT_EQ(kRuleOrder[0], Rule::kDecompose);
  EXPECT_EQ(kRuleOrder[1], Rule::kSubstituteSymbols);
  EXPECT_EQ(kRuleOrder[2], Rule::kStripCombiningMarks);
  EXPECT_EQ(kRuleOrder[3], Rule::kStripNonASCII);
  EXPECT_EQ(kRuleOrder[kRuleCount - 1], Rule::kTrim);
}

// =============================================================================
// Decompose Tests
// =============================================================================

TEST(DecomposeTest, SplitsPrecomposedLetters) {
  EXPECT_EQ(RunRule(Rule::kDecompose, "\xC3\xA9"), "e\xCC\x81");        // é
  EXPECT_EQ(RunRule(Rule::kDecompose, "\xC3\xA7"), "c\xCC\xA7");        // ç
  EXPECT_EQ(RunRule(Rule::kDecompose, "\xC3\x85"), "A\xCC\x8A");        // Å
  EXPECT_EQ(RunRule(Rule::kDecompose, "\xC3\xB1"), "n\xCC\x83");        // ñ
}

TEST(DecomposeTest, LeavesASCIIAndSymbolsAlone) {
  EXPECT_EQ(RunRule(Rule::kDecompose, "plain text"), "plain text");
  EXPECT_EQ(RunRule(Rule::kDecompose, "\xC2\xA9"), "\xC2\xA9");          // ©
  EXPECT_EQ(RunRule(Rule::kDecompose, "\xE2\x80\xA6"), "\xE2\x80\xA6");  // … (compat only)
  EXPECT_EQ(RunRule(Rule::kDecompose, ""), "");
}

// =============================================================================
// SubstituteSymbols Tests
// =============================================================================

TEST(SubstituteSymbolsTest, ReplacesTableEntries) {
  EXPECT_EQ(RunRule(Rule::kSubstituteSymbols, "\xE2\x80\x9Cx\xE2\x80\x9D"), "\"x\"");
  EXPECT_EQ(RunRule(Rule::kSubstituteSymbols, "25\xC2\xB0"), "25 deg ");
  EXPECT_EQ(RunRule(Rule::kSubstituteSymbols, "\xE2\x82\xAC" "5"), "EUR5");
  EXPECT_EQ(RunRule(Rule::kSubstituteSymbols, "a\xE2\x80\x94" "b"), "a-b");
}

TEST(SubstituteSymbolsTest, KeepsUnmappedCodepoints) {
  EXPECT_EQ(RunRule(Rule::kSubstituteSymbols, "\xC3\xA9"), "\xC3\xA9");
  EXPECT_EQ(RunRule(Rule::kSubstituteSymbols, "\xE4\xB8\xAD"), "\xE4\xB8\xAD");
  EXPECT_EQ(RunRule(Rule::kSubstituteSymbols, "\xF0\x9F\x98\x80"), "\xF0\x9F\x98\x80");
}

// =============================================================================
// StripCombiningMarks / StripNonASCII Tests
// =============================================================================

TEST(StripCombiningMarksTest, RemovesDiacriticalBlockOnly) {
  EXPECT_EQ(RunRule(Rule::kStripCombiningMarks, "e\xCC\x81"), "e");
  EXPECT_EQ(RunRule(Rule::kStripCombiningMarks, "a\xCC\x80\xCC\x81\xCD\xAF" "b"), "ab");
  // Precomposed letters are untouched without decomposition
  EXPECT_EQ(RunRule(Rule::kStripCombiningMarks, "\xC3\xA9"), "\xC3\xA9");
  // U+0483 (Cyrillic titlo) is outside U+0300..U+036F
  EXPECT_EQ(RunRule(Rule::kStripCombiningMarks, "\xD2\x83"), "\xD2\x83");
}

TEST(StripNonASCIITest, DropsEverythingAbove127) {
  EXPECT_EQ(RunRule(Rule::kStripNonASCII, "a\xE4\xB8\xAD" "b\xF0\x9F\x98\x80" "c"), "abc");
  EXPECT_EQ(RunRule(Rule::kStripNonASCII, "\xC2\xA0"), "");
  EXPECT_EQ(RunRule(Rule::kStripNonASCII, std::string("\x7F\x00x", 3)),
            std::string("\x7F\x00x", 3));
}

TEST(StripNonASCIITest, DropsLoneSurrogates) {
  const char16_t units[] = {u'a', 0xD800, u'b', 0xDC00};
  icu::UnicodeString text(units, 4);
  StripNonASCII(text);
  EXPECT_EQ(ToUTF8(text), "ab");
}

// =============================================================================
// Whitespace Rule Tests
// =============================================================================

TEST(CollapseBlanksTest, SpacesAndTabs) {
  EXPECT_EQ(RunRule(Rule::kCollapseBlanks, "a   b\tc"), "a b c");
  EXPECT_EQ(RunRule(Rule::kCollapseBlanks, "a \t \t b"), "a b");
  EXPECT_EQ(RunRule(Rule::kCollapseBlanks, "  lead"), " lead");
}

TEST(CollapseBlanksTest, LeavesLineBreaksAlone) {
  EXPECT_EQ(RunRule(Rule::kCollapseBlanks, "a\n\nb"), "a\n\nb");
  EXPECT_EQ(RunRule(Rule::kCollapseBlanks, "a \n b"), "a \n b");
  EXPECT_EQ(RunRule(Rule::kCollapseBlanks, "a\v\vb"), "a\v\vb");
}

TEST(NormalizeLineEndingsTest, CRLFAndCR) {
  EXPECT_EQ(RunRule(Rule::kNormalizeLineEndings, "a\r\nb\rc\n"), "a\nb\nc\n");
  EXPECT_EQ(RunRule(Rule::kNormalizeLineEndings, "\r\r\n"), "\n\n");
  EXPECT_EQ(RunRule(Rule::kNormalizeLineEndings, "\n\r"), "\n\n");
  EXPECT_EQ(RunRule(Rule::kNormalizeLineEndings, "x\r"), "x\n");
}

TEST(TrimLineEndsTest, TrailingWhitespacePerLine) {
  EXPECT_EQ(RunRule(Rule::kTrimLineEnds, "a  \nb\t\n c "), "a\nb\n c");
  EXPECT_EQ(RunRule(Rule::kTrimLineEnds, "x \f\v\n\n"), "x\n\n");
  EXPECT_EQ(RunRule(Rule::kTrimLineEnds, "   "), "");
  EXPECT_EQ(RunRule(Rule::kTrimLineEnds, ""), "");
}

TEST(TrimTest, BothEnds) {
  EXPECT_EQ(RunRule(Rule::kTrim, "  \n a \n "), "a");
  EXPECT_EQ(RunRule(Rule::kTrim, "\r\t\v\fx y\f"), "x y");
  EXPECT_EQ(RunRule(Rule::kTrim, "a\n\nb"), "a\n\nb");
  EXPECT_EQ(RunRule(Rule::kTrim, " \n "), "");
}

// =============================================================================
// ApplyRules Tests
// =============================================================================

TEST(ApplyRulesTest, ZeroRulesIsIdentityOnValidUTF8) {
  const std::string input = "Caf\xC3\xA9 \xE2\x80\x9Cok\xE2\x80\x9D  \r\n";
  EXPECT_EQ(ApplyRules(input, 0), input);
}

TEST(ApplyRulesTest, AllRulesMatchConvert) {
  const std::string input = " \xC3\x80 la carte\xE2\x80\xA6\r\n\t\xE4\xB8\xAD  ";
  EXPECT_EQ(ApplyRules(input, kRuleCount), ToASCII(input));
  EXPECT_EQ(ApplyRules(input, kRuleCount), "A la carte...");
}

TEST(ApplyRulesTest, CountIsClamped) {
  const std::string input = "na\xC3\xAFve";
  EXPECT_EQ(ApplyRules(input, kRuleCount + 10), ApplyRules(input, kRuleCount));
}

TEST(ApplyRulesTest, RangeComposes) {
  const std::string input = "\xE2\x80\x9C" "Fa\xC3\xA7" "ade\xE2\x80\x9D \t x";
  icu::UnicodeString text = FromUTF8(input);
  ApplyRules(text, 0, 3);
  ApplyRules(text, 3, kRuleCount);
  EXPECT_EQ(ToUTF8(text), ApplyRules(input, kRuleCount));
}

TEST(ApplyRulesTest, SubstitutionRunsBeforeNonASCIIDrop) {
  // Typographic quotes survive as ASCII quotes
  EXPECT_EQ(ApplyRules("\xE2\x80\x98hi\xE2\x80\x99", kRuleCount), "'hi'");
  // Running the drop alone loses them
  EXPECT_EQ(RunRule(Rule::kStripNonASCII, "\xE2\x80\x98hi\xE2\x80\x99"), "hi");
}

// =============================================================================
// UTF-8 Helper Tests
// =============================================================================

TEST(UTF8HelperTest, RoundTripsValidText) {
  const std::string input = "a\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x98\x80";
  icu::UnicodeString text = FromUTF8(input);
  EXPECT_EQ(text.length(), 5);  // a, é, 中, and a surrogate pair
  EXPECT_EQ(ToUTF8(text), input);
}

TEST(UTF8HelperTest, MalformedBecomesReplacementChar) {
  icu::UnicodeString text = FromUTF8("a\xFF" "b");
  ASSERT_EQ(text.length(), 3);
  EXPECT_EQ(text.charAt(1), 0xFFFD);
}

}  // namespace
}  // namespace asciify::internal
