#include <asciify/server/config.hpp>
#include <asciify/stages.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace asciify::server {

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options]\n"
            << "\nOptions:\n"
            << "  --config, -c <path>        Path to YAML config file\n"
            << "  --host <addr>              Bind address (default: 0.0.0.0)\n"
            << "  --port, -p <port>          Listen port (default: 8080)\n"
            << "  --threads <n>              Worker threads (default: auto)\n"
            << "  --max-input-bytes <n>      Request body limit, 0 = none (default: 1048576)\n"
            << "  --no-metrics               Disable the metrics endpoint\n"
            << "  --log-level <level>        Log level: debug, info, warn, error\n"
            << "  --help, -h                 Show this help\n"
            << "\nExamples:\n"
            << "  " << argv0 << " --port 8080\n"
            << "  " << argv0 << " --config /etc/asciify/server.yaml\n";
}

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string Unquote(const std::string& value) {
  if (value.size() >= 2 &&
      ((value.front() == '"' && value.back() == '"') ||
       (value.front() == '\'' && value.back() == '\''))) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

// \n and \t escapes, so a multi-line sample fits on one line
std::string Unescape(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '\\' && i + 1 < value.size()) {
      char next = value[i + 1];
      if (next == 'n') { out += '\n'; ++i; continue; }
      if (next == 't') { out += '\t'; ++i; continue; }
      if (next == '\\') { out += '\\'; ++i; continue; }
    }
    out += value[i];
  }
  return out;
}

uint64_t ParseUnsigned(const std::string& name, const std::string& value, uint64_t max) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::runtime_error("Invalid value for " + name + ": '" + value + "'");
  }
  uint64_t parsed = 0;
  try {
    parsed = std::stoull(value);
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid value for " + name + ": '" + value + "'");
  }
  if (parsed > max) {
    throw std::runtime_error("Value for " + name + " out of range: " + value);
  }
  return parsed;
}

bool ParseBool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

const char* RequireValue(int argc, char** argv, int* i, const std::string& what) {
  if (++(*i) >= argc) {
    throw std::runtime_error(std::string(argv[*i - 1]) + " requires " + what);
  }
  return argv[*i];
}

}  // namespace

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;

  while (std::getline(file, line)) {
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      continue;
    }

    value = Unquote(value);

    if (current_section == "server") {
      if (key == "host") {
        config.server.host = value;
      } else if (key == "port") {
        config.server.port = static_cast<uint16_t>(
            ParseUnsigned("server.port", value, std::numeric_limits<uint16_t>::max()));
      } else if (key == "threads") {
        config.server.threads = static_cast<uint32_t>(
            ParseUnsigned("server.threads", value, std::numeric_limits<uint32_t>::max()));
      } else if (key == "log_level") {
        config.server.log_level = value;
      }
    } else if (current_section == "limits") {
      if (key == "max_input_bytes") {
        config.limits.max_input_bytes = static_cast<size_t>(ParseUnsigned(
            "limits.max_input_bytes", value, std::numeric_limits<size_t>::max()));
      }
    } else if (current_section == "demo") {
      if (key == "sample") {
        config.demo.sample = Unescape(value);
      }
    } else if (current_section == "metrics") {
      if (key == "enabled") {
        config.metrics.enabled = ParseBool(value);
      } else if (key == "path") {
        config.metrics.path = value;
      }
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  // First pass: a config file provides the base values
  Config config;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      config = LoadFromFile(RequireValue(argc, argv, &i, "a path argument"));
    }
  }

  // Second pass: explicit flags override the file
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" || arg == "-c") {
      ++i;
    } else if (arg == "--host") {
      config.server.host = RequireValue(argc, argv, &i, "an address argument");
    } else if (arg == "--port" || arg == "-p") {
      config.server.port = static_cast<uint16_t>(
          ParseUnsigned("--port", RequireValue(argc, argv, &i, "a port number"),
                        std::numeric_limits<uint16_t>::max()));
    } else if (arg == "--threads") {
      config.server.threads = static_cast<uint32_t>(
          ParseUnsigned("--threads", RequireValue(argc, argv, &i, "a number"),
                        std::numeric_limits<uint32_t>::max()));
    } else if (arg == "--max-input-bytes") {
      config.limits.max_input_bytes = static_cast<size_t>(
          ParseUnsigned("--max-input-bytes", RequireValue(argc, argv, &i, "a number"),
                        std::numeric_limits<size_t>::max()));
    } else if (arg == "--no-metrics") {
      config.metrics.enabled = false;
    } else if (arg == "--log-level") {
      config.server.log_level = RequireValue(argc, argv, &i, "a level");
    } else {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }

  return config;
}

void Config::Validate() const {
  if (server.port == 0) {
    throw std::runtime_error("Invalid port number: " + std::to_string(server.port));
  }

  if (server.host.empty()) {
    throw std::runtime_error("server.host must not be empty");
  }

  if (metrics.enabled && (metrics.path.empty() || metrics.path[0] != '/')) {
    throw std::runtime_error("metrics.path must start with '/': " + metrics.path);
  }

  if (server.log_level != "debug" && server.log_level != "info" &&
      server.log_level != "warn" && server.log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + server.log_level +
                             " (must be debug, info, warn, or error)");
  }
}

std::string Config::DemoSample() const {
  return demo.sample.empty() ? std::string(kDemoSample) : demo.sample;
}

}  // namespace asciify::server
