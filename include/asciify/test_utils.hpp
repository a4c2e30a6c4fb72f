#pragma once

#include <asciify/replacement_table.hpp>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace asciify::testing {

// =============================================================================
// Deterministic Unicode Text Generator
// =============================================================================

/**
 * Reproducible random text for property tests.
 *
 * Draws codepoints from pools that exercise every pipeline rule: plain
 * ASCII, blanks and line breaks, precomposed Latin-1/Latin Extended
 * letters, bare combining marks, replacement table symbols, CJK and
 * astral-plane characters. The same seed always yields the same text.
 */
class UnicodeTextGenerator {
 public:
  explicit UnicodeTextGenerator(uint64_t seed = 0x5eed) : state_(seed) {}

  /** UTF-8 text of `codepoints` codepoints. */
  std::string Next(size_t codepoints) {
    std::string out;
    for (size_t i = 0; i < codepoints; ++i) {
      AppendUTF8(NextCodepoint(), &out);
    }
    return out;
  }

  /** Arbitrary bytes, including malformed UTF-8. */
  std::string NextBytes(size_t length) {
    std::string out(length, '\0');
    for (size_t i = 0; i < length; ++i) {
      out[i] = static_cast<char>(NextRandom() & 0xFF);
    }
    return out;
  }

  char32_t NextCodepoint() {
    switch (NextRandom() % 8) {
      case 0:
      case 1:
        return static_cast<char32_t>(0x21 + NextRandom() % 0x5E);  // printable ASCII
      case 2: {
        static const char32_t kBlanks[] = {' ', ' ', '\t', '\n', '\r', '\v', '\f'};
        return kBlanks[NextRandom() % (sizeof(kBlanks) / sizeof(kBlanks[0]))];
      }
      case 3:
        return static_cast<char32_t>(0xC0 + NextRandom() % 0x1C0);  // U+00C0..U+027F
      case 4:
        return static_cast<char32_t>(kCombiningMarkFirst +
                                     NextRandom() % (kCombiningMarkLast - kCombiningMarkFirst + 1));
      case 5:
        return ReplacementTable()[NextRandom() % ReplacementTableSize()].codepoint;
      case 6:
        return static_cast<char32_t>(0x4E00 + NextRandom() % 0x5000);  // CJK
      default:
        return static_cast<char32_t>(0x1F300 + NextRandom() % 0x300);  // emoji
    }
  }

  static void AppendUTF8(char32_t cp, std::string* out) {
    if (cp < 0x80) {
      out->push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

 private:
  uint64_t NextRandom() {
    // LCG (Knuth MMIX constants)
    state_ = state_ * 6364136223846793005ULL + 1442695040888963407ULL;
    return state_ >> 33;
  }

  uint64_t state_;
};

// =============================================================================
// Test Result Aggregation (for thread-safe assertions)
// =============================================================================

/**
 * Thread-safe result collector for concurrent tests.
 * Collects results from multiple threads for assertion on main thread.
 */
class TestResultCollector {
 public:
  void RecordSuccess() {
    success_count_.fetch_add(1);
  }

  void RecordFailure(const std::string& message = "") {
    failure_count_.fetch_add(1);
    if (!message.empty()) {
      std::lock_guard<std::mutex> lock(mutex_);
      failure_messages_.push_back(message);
    }
  }

  uint64_t SuccessCount() const { return success_count_.load(); }
  uint64_t FailureCount() const { return failure_count_.load(); }

  bool AllSucceeded() const { return FailureCount() == 0; }

  std::vector<std::string> GetFailureMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_messages_;
  }

 private:
  std::atomic<uint64_t> success_count_{0};
  std::atomic<uint64_t> failure_count_{0};
  mutable std::mutex mutex_;
  std::vector<std::string> failure_messages_;
};

// Use instead of ASSERT_*/EXPECT_* inside threads
#define ASCIIFY_CHECK_AND_RECORD(collector, condition, fail_msg) \
  do { \
    if (condition) { \
      (collector).RecordSuccess(); \
    } else { \
      (collector).RecordFailure(fail_msg); \
    } \
  } while (0)

}  // namespace asciify::testing
