#pragma once

#include <asciify/server/config.hpp>
#include <asciify/server/metrics.hpp>

#include <memory>
#include <string>

namespace asciify::server {

/**
 * Asciify HTTP Server.
 *
 * Exposes the transliteration engine and the stage explainer as a JSON
 * REST API using Drogon, plus health and Prometheus metrics endpoints.
 */
class Server {
 public:
  /**
   * Create a server with the given configuration.
   * @throws std::runtime_error if the configuration is invalid.
   */
  explicit Server(const Config& config);

  ~Server();

  // Non-copyable, non-movable
  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /**
   * Start the server (blocking).
   * Returns when the server shuts down (SIGINT/SIGTERM or Shutdown()).
   */
  void Run();

  /**
   * Request shutdown (async).
   * The server will stop accepting new connections and drain existing ones.
   */
  void Shutdown();

  const Config& GetConfig() const { return config_; }

  /** Null when metrics are disabled. */
  std::shared_ptr<PrometheusMetrics> GetMetrics() const { return metrics_; }

 private:
  void SetupRoutes();

  Config config_;
  std::shared_ptr<PrometheusMetrics> metrics_;
  bool running_ = false;
};

}  // namespace asciify::server
