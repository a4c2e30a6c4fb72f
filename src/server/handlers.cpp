#include <asciify/server/handlers.hpp>
#include <asciify/json.hpp>
#include <asciify/stages.hpp>
#include <asciify/transliterate.hpp>
#include <asciify/version.hpp>

#include <drogon/drogon.h>
#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace asciify::server {

namespace {

using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

drogon::HttpResponsePtr MakeJsonResponse(const Json::Value& json,
                                         drogon::HttpStatusCode code) {
  auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
  resp->setStatusCode(code);
  return resp;
}

bool IsJsonRequest(const drogon::HttpRequestPtr& req) {
  std::string content_type = req->getHeader("content-type");
  std::transform(content_type.begin(), content_type.end(), content_type.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return content_type.find("application/json") != std::string::npos;
}

/**
 * Pull the text to convert out of a request body.
 * JSON bodies must carry a string "text" field; anything else is raw text.
 * On failure *error holds a ready-to-send response.
 */
bool ExtractText(const drogon::HttpRequestPtr& req, size_t max_input_bytes,
                 std::string* text, drogon::HttpResponsePtr* error) {
  if (max_input_bytes != 0 && req->body().size() > max_input_bytes) {
    *error = MakeErrorResponse(
        ErrorKind::kPayloadTooLarge,
        "Request body exceeds " + std::to_string(max_input_bytes) + " bytes");
    return false;
  }

  if (!IsJsonRequest(req)) {
    *text = std::string(req->body());
    return true;
  }

  // Try getJsonObject first, then manual parse
  auto json = req->getJsonObject();
  if (!json) {
    Json::Value parsed;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream{std::string(req->body())};
    if (Json::parseFromStream(builder, stream, &parsed, &errors)) {
      json = std::make_shared<Json::Value>(parsed);
    }
  }

  if (!json || !json->isObject() || !json->isMember("text") ||
      !(*json)["text"].isString()) {
    *error = MakeErrorResponse(ErrorKind::kInvalidArgument,
                               "JSON body must contain a string 'text' field");
    return false;
  }

  *text = (*json)["text"].asString();
  return true;
}

// Returns the HTTP status sent
int RespondStep(const std::string& ordinal_text, const std::string& sample,
                const std::shared_ptr<PrometheusMetrics>& metrics,
                const Callback& callback) {
  int ordinal = 0;
  if (!ParseStageOrdinal(ordinal_text, &ordinal)) {
    LOG_WARN << "Rejected stage ordinal '" << ordinal_text << "'";
    callback(MakeErrorResponse(
        ErrorKind::kInvalidArgument,
        "Stage ordinal must be an integer in [0, " + std::to_string(kStageCount - 1) +
            "], got '" + ordinal_text + "'"));
    return 400;
  }

  auto step = ApplyStage(ordinal, sample);
  if (metrics) {
    metrics->RecordStageRequest(ordinal);
  }
  callback(MakeJsonResponse(StepResultToJson(ordinal, step), drogon::k200OK));
  return 200;
}

}  // namespace

// --- Error Response Helper ---

drogon::HttpResponsePtr MakeErrorResponse(ErrorKind kind, const std::string& message) {
  Json::Value json;
  drogon::HttpStatusCode http_code = drogon::k500InternalServerError;

  switch (kind) {
    case ErrorKind::kInvalidArgument:
      json["error"] = "invalid_argument";
      http_code = drogon::k400BadRequest;
      break;
    case ErrorKind::kNotFound:
      json["error"] = "not_found";
      http_code = drogon::k404NotFound;
      break;
    case ErrorKind::kPayloadTooLarge:
      json["error"] = "payload_too_large";
      http_code = drogon::k413RequestEntityTooLarge;
      break;
    case ErrorKind::kInternal:
      json["error"] = "internal_error";
      http_code = drogon::k500InternalServerError;
      break;
  }

  json["code"] = static_cast<int>(http_code);
  json["message"] = message;
  return MakeJsonResponse(json, http_code);
}

bool ParseStageOrdinal(const std::string& text, int* ordinal) {
  if (text.empty() || text.size() > 3 ||
      !std::all_of(text.begin(), text.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return false;
  }
  int value = std::stoi(text);
  if (value < 0 || value >= kStageCount) {
    return false;
  }
  *ordinal = value;
  return true;
}

// --- Handler Registration ---

void RegisterHandlers(const Config& config, std::shared_ptr<PrometheusMetrics> metrics) {
  auto& app = drogon::app();
  const size_t max_input_bytes = config.limits.max_input_bytes;
  const std::string demo_sample = config.DemoSample();

  // ==========================================================================
  // Conversion
  // ==========================================================================

  // POST /api/v1/convert - Transliterate the body to ASCII
  app.registerHandler(
      "/api/v1/convert",
      [metrics, max_input_bytes](const drogon::HttpRequestPtr& req, Callback&& callback) {
        RequestTimer timer(metrics, "POST", "/api/v1/convert");

        std::string text;
        drogon::HttpResponsePtr error;
        if (!ExtractText(req, max_input_bytes, &text, &error)) {
          timer.SetStatusCode(static_cast<int>(error->statusCode()));
          callback(error);
          return;
        }

        ConversionResult result;
        try {
          result = Convert(text);
        } catch (const std::exception& e) {
          LOG_ERROR << "Conversion failed: " << e.what();
          timer.SetStatusCode(500);
          callback(MakeErrorResponse(ErrorKind::kInternal, e.what()));
          return;
        }

        if (metrics) {
          metrics->RecordConversion(result.stats);
        }
        LOG_DEBUG << "Converted " << result.stats.in_chars << " chars -> "
                  << result.stats.out_chars;
        callback(MakeJsonResponse(ToJson(result), drogon::k200OK));
      },
      {drogon::Post});

  // ==========================================================================
  // Stage Explainer
  // ==========================================================================

  // GET /api/v1/stages - List stages
  app.registerHandler(
      "/api/v1/stages",
      [metrics](const drogon::HttpRequestPtr& req, Callback&& callback) {
        RequestTimer timer(metrics, "GET", "/api/v1/stages");
        callback(MakeJsonResponse(StagesToJson(), drogon::k200OK));
      },
      {drogon::Get});

  // GET /api/v1/stages/{ordinal} - Apply a stage to the demo sample
  app.registerHandler(
      "/api/v1/stages/{ordinal}",
      [metrics, demo_sample](const drogon::HttpRequestPtr& req, Callback&& callback,
                             const std::string& ordinal) {
        RequestTimer timer(metrics, "GET", "/api/v1/stages/{ordinal}");
        try {
          timer.SetStatusCode(RespondStep(ordinal, demo_sample, metrics, callback));
        } catch (const std::exception& e) {
          LOG_ERROR << "Stage " << ordinal << " failed: " << e.what();
          timer.SetStatusCode(500);
          callback(MakeErrorResponse(ErrorKind::kInternal, e.what()));
        }
      },
      {drogon::Get});

  // POST /api/v1/stages/{ordinal} - Apply a stage to the request body
  app.registerHandler(
      "/api/v1/stages/{ordinal}",
      [metrics, max_input_bytes](const drogon::HttpRequestPtr& req, Callback&& callback,
                                 const std::string& ordinal) {
        RequestTimer timer(metrics, "POST", "/api/v1/stages/{ordinal}");

        std::string sample;
        drogon::HttpResponsePtr error;
        if (!ExtractText(req, max_input_bytes, &sample, &error)) {
          timer.SetStatusCode(static_cast<int>(error->statusCode()));
          callback(error);
          return;
        }

        try {
          timer.SetStatusCode(RespondStep(ordinal, sample, metrics, callback));
        } catch (const std::exception& e) {
          LOG_ERROR << "Stage " << ordinal << " failed: " << e.what();
          timer.SetStatusCode(500);
          callback(MakeErrorResponse(ErrorKind::kInternal, e.what()));
        }
      },
      {drogon::Post});

  // ==========================================================================
  // Health Endpoints
  // ==========================================================================

  // GET /health - Liveness check
  app.registerHandler(
      "/health",
      [](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Json::Value json;
        json["status"] = "healthy";
        json["version"] = Version();
        callback(MakeJsonResponse(json, drogon::k200OK));
      },
      {drogon::Get});

  LOG_INFO << "Registered API handlers, max input " << max_input_bytes << " bytes";
}

}  // namespace asciify::server
