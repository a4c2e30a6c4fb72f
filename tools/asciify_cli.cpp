#include <asciify/json.hpp>
#include <asciify/stages.hpp>
#include <asciify/transliterate.hpp>
#include <asciify/version.hpp>

#include <unistd.h>

#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

static void usage(const char* argv0) {
  std::cerr
      << "usage:\n"
      << "  " << argv0 << " [--stats] [--json] [FILE]     convert FILE (or stdin) to ASCII\n"
      << "  " << argv0 << " stages [--json]               list the explainer stages\n"
      << "  " << argv0 << " stage <n> [--json] [FILE]     apply stage n to FILE or stdin\n"
      << "      (the demo sample is used when stdin is a terminal)\n"
      << "  " << argv0 << " --version | --help\n";
}

static bool ReadAll(std::istream& in, std::string* out) {
  std::ostringstream buf;
  buf << in.rdbuf();
  if (in.bad()) return false;
  *out = buf.str();
  return true;
}

// Reads `path`, or stdin when path is empty.
static bool ReadInput(const std::string& path, std::string* out) {
  if (path.empty()) {
    return ReadAll(std::cin, out);
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) return false;
  return ReadAll(file, out);
}

static bool ParseOrdinal(const std::string& text, int* ordinal) {
  if (text.empty() || text.size() > 3) return false;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
  }
  int value = std::stoi(text);
  if (value >= asciify::kStageCount) return false;
  *ordinal = value;
  return true;
}

static int Run(int argc, char** argv) {
  bool stats = false;
  bool json = false;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      usage(argv[0]);
      return 0;
    } else if (arg == "--version") {
      std::cout << "asciify " << asciify::Version() << "\n";
      return 0;
    } else if (arg == "--stats") {
      stats = true;
    } else if (arg == "--json") {
      json = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      usage(argv[0]);
      return 2;
    } else {
      positional.push_back(arg);
    }
  }

  if (!positional.empty() && positional[0] == "stages") {
    if (positional.size() != 1 || stats) { usage(argv[0]); return 2; }
    if (json) {
      std::cout << asciify::WritePretty(asciify::StagesToJson()) << "\n";
      return 0;
    }
    for (const auto& stage : asciify::Stages()) {
      std::cout << stage.ordinal << "  " << stage.label << "\n"
                << "   " << stage.description << "\n";
    }
    return 0;
  }

  if (!positional.empty() && positional[0] == "stage") {
    if (positional.size() < 2 || positional.size() > 3 || stats) {
      usage(argv[0]);
      return 2;
    }
    int ordinal = 0;
    if (!ParseOrdinal(positional[1], &ordinal)) {
      std::cerr << "Invalid stage: " << positional[1] << " (expected 0-"
                << (asciify::kStageCount - 1) << ")\n";
      return 2;
    }

    std::string sample;
    if (positional.size() == 3) {
      if (!ReadInput(positional[2], &sample)) {
        std::cerr << "Read failed: " << positional[2] << "\n";
        return 1;
      }
    } else if (isatty(fileno(stdin))) {
      sample = asciify::kDemoSample;
    } else if (!ReadInput("", &sample)) {
      std::cerr << "Read failed: <stdin>\n";
      return 1;
    }

    auto step = asciify::ApplyStage(ordinal, sample);
    if (json) {
      std::cout << asciify::WritePretty(asciify::StepResultToJson(ordinal, step)) << "\n";
      return 0;
    }
    std::cout << step.text << "\n";
    std::cerr << asciify::Stages()[static_cast<size_t>(ordinal)].label << ": "
              << step.description << "\n";
    return 0;
  }

  // convert [FILE]
  if (positional.size() > 1) { usage(argv[0]); return 2; }
  const std::string path = positional.empty() ? std::string() : positional[0];

  std::string input;
  if (!ReadInput(path, &input)) {
    std::cerr << "Read failed: " << (path.empty() ? "<stdin>" : path) << "\n";
    return 1;
  }

  auto result = asciify::Convert(input);
  if (json) {
    std::cout << asciify::WritePretty(asciify::ToJson(result)) << "\n";
  } else {
    std::cout << result.ascii << "\n";
  }
  if (stats) {
    std::cerr << "in_chars=" << result.stats.in_chars
              << " out_chars=" << result.stats.out_chars
              << " removed=" << result.stats.Removed() << "\n";
  }
  return std::cout.good() ? 0 : 1;
}

int main(int argc, char** argv) {
  try {
    return Run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
