#include <asciify/stages.hpp>

#include <iostream>
#include <string>

// Walk the demo sample (or argv[1]) through every explainer stage.
int main(int argc, char** argv) {
  std::string sample = argc > 1 ? argv[1] : asciify::kDemoSample;

  for (const auto& stage : asciify::Stages()) {
    auto step = asciify::ApplyStage(stage.ordinal, sample);
    std::cout << "== " << stage.label << " ==\n"
              << step.text << "\n"
              << "   (" << step.description << ")\n\n";
  }
  return 0;
}
