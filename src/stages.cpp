#include <asciify/stages.hpp>
#include <asciify/internal.hpp>

#include <stdexcept>
#include <string>

namespace asciify {

namespace {

using internal::kRuleCount;

std::vector<Stage> BuildStages() {
  return {
      {0, "Original",
       "Original text with accents, special punctuation and non-Latin characters.",
       0},
      {1, "1. Normalize",
       "NFD normalization: letters and diacritics are split (\xC3\xA9 -> e + accent).",
       1},
      {2, "2. Substitute",
       "Special punctuation replaced with ASCII.",
       2},
      {3, "3. Strip accents",
       "Diacritics removed: only base letters remain.",
       3},
      {4, "4. Strip non-ASCII",
       "Non-ASCII characters removed (e.g. \xE4\xB8\xAD\xE6\x96\x87).",
       kRuleCount},
      {5, "5. Normalize spaces",
       "Multiple spaces collapsed.",
       kRuleCount},
      {6, "6. Clean up",
       "Final clean, ASCII-compatible result.",
       kRuleCount},
  };
}

}  // namespace

const std::vector<Stage>& Stages() {
  static const std::vector<Stage> stages = BuildStages();
  return stages;
}

StepResult ApplyStage(int ordinal, std::string_view sample) {
  const auto& stages = Stages();
  if (ordinal < 0 || ordinal >= static_cast<int>(stages.size())) {
    throw std::out_of_range("stage ordinal out of range: " + std::to_string(ordinal));
  }

  const Stage& stage = stages[static_cast<size_t>(ordinal)];
  StepResult result;
  result.description = stage.description;
  if (stage.rule_count == 0) {
    result.text = std::string(sample);
  } else {
    result.text = internal::ApplyRules(sample, stage.rule_count);
  }
  return result;
}

StepResult SelectStage(int ordinal) {
  return ApplyStage(ordinal, kDemoSample);
}

}  // namespace asciify
