#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace asciify::server {

/**
 * Listener configuration.
 */
struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 8080;
  uint32_t threads = 0;  // 0 = auto-detect CPU cores
  std::string log_level = "info";
};

/**
 * Request limits.
 */
struct LimitsConfig {
  size_t max_input_bytes = 1 << 20;  // 0 = unlimited
};

/**
 * Stage explainer configuration.
 */
struct DemoConfig {
  std::string sample;  // empty = built-in demo sample
};

/**
 * Metrics configuration.
 */
struct MetricsConfig {
  bool enabled = true;
  std::string path = "/metrics";
};

/**
 * Complete server configuration.
 */
struct Config {
  ServerConfig server;
  LimitsConfig limits;
  DemoConfig demo;
  MetricsConfig metrics;

  /**
   * Load configuration from a YAML file.
   * @throws std::runtime_error if file cannot be read or a value is malformed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments.
   * A --config file is loaded first; explicit flags override it.
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;

  /** The sample used by GET /api/v1/stages/{n}. */
  std::string DemoSample() const;
};

}  // namespace asciify::server
