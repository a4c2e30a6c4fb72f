#pragma once

#include <asciify/server/config.hpp>
#include <asciify/server/metrics.hpp>

#include <drogon/HttpAppFramework.h>
#include <drogon/HttpResponse.h>

#include <memory>
#include <string>

namespace asciify::server {

/** Error categories surfaced by the HTTP API. */
enum class ErrorKind {
  kInvalidArgument,  // 400
  kNotFound,         // 404
  kPayloadTooLarge,  // 413
  kInternal          // 500
};

/**
 * Create a JSON error response: {"error", "message", "code"}.
 */
drogon::HttpResponsePtr MakeErrorResponse(ErrorKind kind, const std::string& message);

/**
 * Parse a stage ordinal from a path segment.
 * @return false unless `text` is a decimal integer in [0, kStageCount).
 */
bool ParseStageOrdinal(const std::string& text, int* ordinal);

/**
 * Register the convert, stages and health handlers with the Drogon app.
 * `metrics` may be null when metrics are disabled.
 */
void RegisterHandlers(const Config& config, std::shared_ptr<PrometheusMetrics> metrics);

}  // namespace asciify::server
