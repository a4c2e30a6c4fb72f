#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace asciify {

/**
 * One step of the explainer: a label, a description, and how many rules
 * of the conversion pipeline it applies (always a prefix of the rule order).
 */
struct Stage {
  int ordinal;
  const char* label;
  const char* description;
  size_t rule_count;
};

/** Output of one stage applied to a sample. */
struct StepResult {
  std::string text;
  std::string description;
};

constexpr int kStageCount = 7;

/** Sample shown by the explainer when the caller supplies none. */
inline constexpr char kDemoSample[] =
    "Fran\xC3\xA7" "ais na\xC3\xAF" "ve \xE2\x80\x93 \xE2\x80\x9C" "Ciao mondo!\xE2\x80\x9D"
    " \xE2\x80\x94 25\xC2\xB0...\nAltri simboli: \xC2\xA9 \xE4\xB8\xAD\xE6\x96\x87";

/**
 * The seven stages, ordinal 0..6, built once.
 *
 * Stage 0 is the untouched input; 1 decomposes; 2 adds symbol substitution;
 * 3 adds combining mark removal; 4 adds the non-ASCII drop and all
 * whitespace/line normalization, i.e. the full conversion. Stages 5 and 6
 * produce the same text as 4 and only differ in label and description.
 */
const std::vector<Stage>& Stages();

/**
 * Apply stage `ordinal` to `sample`.
 * @throws std::out_of_range if ordinal is not in [0, kStageCount).
 */
StepResult ApplyStage(int ordinal, std::string_view sample);

/** ApplyStage(ordinal, kDemoSample). */
StepResult SelectStage(int ordinal);

}  // namespace asciify
