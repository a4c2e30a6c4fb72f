// Performance benchmarks for asciify conversion
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Organization:
// 1. RULE BENCHMARKS: one pipeline rule over pre-decoded UTF-16 text
// 2. END-TO-END BENCHMARKS: Convert / ApplyStage over UTF-8 input
//
// Benchmark hygiene:
// - Pre-generate all test data outside timing loops
// - Use a fixed generator seed for reproducible inputs

#include <benchmark/benchmark.h>

#include <asciify/internal.hpp>
#include <asciify/stages.hpp>
#include <asciify/test_utils.hpp>
#include <asciify/transliterate.hpp>

#include <string>

namespace {

std::string MixedText(size_t codepoints) {
  asciify::testing::UnicodeTextGenerator gen(42);
  return gen.Next(codepoints);
}

std::string LatinText(size_t bytes) {
  // Mostly ASCII prose with the occasional accent and typographic quote
  static const std::string kChunk =
      "Le caf\xC3\xA9 \xE2\x80\x9C" "cr\xC3\xA8me br\xC3\xBBl\xC3\xA9" "e\xE2\x80\x9D co\xC3\xBBte 5\xE2\x82\xAC. ";
  std::string out;
  while (out.size() < bytes) out += kChunk;
  return out;
}

}  // namespace

// =============================================================================
// PART 1: RULE BENCHMARKS
// =============================================================================

static void BM_Rule_Decompose(benchmark::State& state) {
  icu::UnicodeString input = asciify::internal::FromUTF8(MixedText(state.range(0)));
  for (auto _ : state) {
    icu::UnicodeString text(input);
    asciify::internal::Decompose(text);
    benchmark::DoNotOptimize(text);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Rule_Decompose)->Range(64, 1 << 16);

static void BM_Rule_SubstituteSymbols(benchmark::State& state) {
  icu::UnicodeString input = asciify::internal::FromUTF8(MixedText(state.range(0)));
  for (auto _ : state) {
    icu::UnicodeString text(input);
    asciify::internal::SubstituteSymbols(text);
    benchmark::DoNotOptimize(text);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Rule_SubstituteSymbols)->Range(64, 1 << 16);

static void BM_Rule_CollapseBlanks(benchmark::State& state) {
  icu::UnicodeString input =
      asciify::internal::FromUTF8(std::string(state.range(0), ' ') + "x\t\t y");
  for (auto _ : state) {
    icu::UnicodeString text(input);
    asciify::internal::CollapseBlanks(text);
    benchmark::DoNotOptimize(text);
  }
}
BENCHMARK(BM_Rule_CollapseBlanks)->Range(64, 1 << 16);

// =============================================================================
// PART 2: END-TO-END BENCHMARKS
// =============================================================================

static void BM_Convert_ASCII(benchmark::State& state) {
  std::string input(state.range(0), 'x');
  for (auto _ : state) {
    auto result = asciify::Convert(input);
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Convert_ASCII)->Range(64, 1 << 20);

static void BM_Convert_Latin(benchmark::State& state) {
  std::string input = LatinText(state.range(0));
  for (auto _ : state) {
    auto result = asciify::Convert(input);
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_Convert_Latin)->Range(64, 1 << 20);

static void BM_Convert_Mixed(benchmark::State& state) {
  std::string input = MixedText(state.range(0));
  for (auto _ : state) {
    auto result = asciify::Convert(input);
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_Convert_Mixed)->Range(64, 1 << 16);

static void BM_SelectStage(benchmark::State& state) {
  const int ordinal = static_cast<int>(state.range(0));
  for (auto _ : state) {
    auto step = asciify::SelectStage(ordinal);
    benchmark::DoNotOptimize(step);
  }
}
BENCHMARK(BM_SelectStage)->DenseRange(0, asciify::kStageCount - 1);

static void BM_AllStages(benchmark::State& state) {
  std::string input = LatinText(4096);
  for (auto _ : state) {
    for (const auto& stage : asciify::Stages()) {
      auto step = asciify::ApplyStage(stage.ordinal, input);
      benchmark::DoNotOptimize(step);
    }
  }
}
BENCHMARK(BM_AllStages);

BENCHMARK_MAIN();
