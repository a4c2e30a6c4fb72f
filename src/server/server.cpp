#include <asciify/server/server.hpp>
#include <asciify/server/handlers.hpp>
#include <asciify/version.hpp>

#include <drogon/drogon.h>

#include <iostream>
#include <limits>
#include <thread>

namespace asciify::server {

namespace {

trantor::Logger::LogLevel ToTrantorLevel(const std::string& level) {
  if (level == "debug") return trantor::Logger::kDebug;
  if (level == "warn") return trantor::Logger::kWarn;
  if (level == "error") return trantor::Logger::kError;
  return trantor::Logger::kInfo;
}

}  // namespace

Server::Server(const Config& config) : config_(config) {
  config_.Validate();

  if (config_.metrics.enabled) {
    metrics_ = std::make_shared<PrometheusMetrics>();
  }
}

Server::~Server() {
  if (running_) {
    Shutdown();
  }
}

void Server::SetupRoutes() {
  RegisterHandlers(config_, metrics_);

  if (metrics_) {
    RegisterMetricsHandler(metrics_, config_.metrics.path);
  }
}

void Server::Run() {
  running_ = true;

  auto& app = drogon::app();

  app.addListener(config_.server.host, config_.server.port);

  uint32_t threads = config_.server.threads;
  if (threads == 0) {
    threads = std::thread::hardware_concurrency();
    if (threads == 0) threads = 4;  // Fallback
  }
  app.setThreadNum(threads);
  app.setLogLevel(ToTrantorLevel(config_.server.log_level));

  // Configure timeouts and limits
  app.setMaxConnectionNum(10000);
  app.setMaxConnectionNumPerIP(100);
  app.setIdleConnectionTimeout(60);
  app.setKeepaliveRequestsNumber(100);
  const size_t max_input = config_.limits.max_input_bytes;
  if (max_input != 0 && max_input < (std::numeric_limits<size_t>::max() - 1024) / 2) {
    // Leave room for JSON framing; handlers enforce the exact limit
    app.setClientMaxBodySize(max_input * 2 + 1024);
  }

  // Disable session support (not needed for API server)
  app.disableSession();

  SetupRoutes();

  auto quit = []() {
    std::cout << "Shutting down HTTP server..." << std::endl;
    drogon::app().quit();
  };
  app.setTermSignalHandler(quit);
  app.setIntSignalHandler(quit);

  std::cout << "asciify server " << Version() << " starting on "
            << config_.server.host << ":" << config_.server.port << " with "
            << threads << " threads" << std::endl;
  if (metrics_) {
    std::cout << "Metrics at " << config_.metrics.path << std::endl;
  }

  // Run Drogon (blocking)
  app.run();

  running_ = false;
  std::cout << "Server stopped." << std::endl;
}

void Server::Shutdown() {
  if (running_) {
    drogon::app().quit();
  }
}

}  // namespace asciify::server
