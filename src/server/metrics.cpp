#include <asciify/server/metrics.hpp>
#include <asciify/stages.hpp>

#include <drogon/drogon.h>

#include <iomanip>
#include <sstream>

namespace asciify::server {

namespace {

// Histogram buckets for latency (in milliseconds)
const std::vector<double> kLatencyBuckets = {
    0.5, 1, 2.5, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000};

// Histogram buckets for text sizes (in characters)
const std::vector<double> kSizeBuckets = {
    16, 64, 256, 1024, 4096, 16384, 65536, 262144, 1048576};

size_t FindBucket(double value, const std::vector<double>& buckets) {
  for (size_t i = 0; i < buckets.size(); ++i) {
    if (value <= buckets[i]) {
      return i;
    }
  }
  return buckets.size();  // +Inf bucket
}

}  // namespace

// --- PrometheusMetrics ---

void PrometheusMetrics::Observe(HistogramData& h, const std::vector<double>& bounds,
                                double value) {
  if (h.buckets.empty()) {
    h.bounds = &bounds;
    h.buckets.resize(bounds.size() + 1, 0);
  }
  size_t bucket = FindBucket(value, *h.bounds);
  for (size_t i = bucket; i < h.buckets.size(); ++i) {
    h.buckets[i]++;
  }
  h.count++;
  h.sum += value;
}

void PrometheusMetrics::ExportHistogram(std::ostream& out, const std::string& name,
                                        const HistogramData& h) {
  out << "# TYPE " << name << " histogram\n";
  for (size_t i = 0; i < h.bounds->size(); ++i) {
    out << name << "_bucket{le=\"" << (*h.bounds)[i] << "\"} " << h.buckets[i] << "\n";
  }
  out << name << "_bucket{le=\"+Inf\"} " << h.buckets.back() << "\n";
  out << name << "_sum " << h.sum << "\n";
  out << name << "_count " << h.count << "\n";
}

void PrometheusMetrics::Counter(std::string_view name, uint64_t delta) {
  std::lock_guard<std::mutex> lock(mu_);
  counters_[std::string(name)] += delta;
}

void PrometheusMetrics::Histogram(std::string_view name, uint64_t value) {
  std::lock_guard<std::mutex> lock(mu_);
  Observe(histograms_[std::string(name)], kLatencyBuckets, static_cast<double>(value));
}

void PrometheusMetrics::Gauge(std::string_view name, double value) {
  std::lock_guard<std::mutex> lock(mu_);
  gauges_[std::string(name)] = value;
}

void PrometheusMetrics::RecordHttpRequest(const std::string& method,
                                          const std::string& path,
                                          int status_code,
                                          double latency_ms) {
  std::lock_guard<std::mutex> lock(mu_);

  HttpMetricKey key{method, path, status_code};
  http_requests_[key]++;

  Observe(http_latency_, kLatencyBuckets, latency_ms);
}

void PrometheusMetrics::RecordConversion(const ConversionStats& stats) {
  std::lock_guard<std::mutex> lock(mu_);
  counters_["asciify_conversions_total"]++;
  counters_["asciify_input_chars_total"] += stats.in_chars;
  counters_["asciify_output_chars_total"] += stats.out_chars;
  if (stats.Removed() < 0) {
    counters_["asciify_expanding_conversions_total"]++;
  }
  Observe(histograms_["asciify_input_chars"], kSizeBuckets,
          static_cast<double>(stats.in_chars));
}

void PrometheusMetrics::RecordStageRequest(int ordinal) {
  if (ordinal < 0 || ordinal >= kStageCount) return;

  std::lock_guard<std::mutex> lock(mu_);
  if (stage_requests_.empty()) {
    stage_requests_.resize(kStageCount, 0);
  }
  stage_requests_[static_cast<size_t>(ordinal)]++;
}

std::string PrometheusMetrics::Export() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream out;
  out << std::fixed << std::setprecision(6);

  for (const auto& [name, value] : counters_) {
    out << "# TYPE " << name << " counter\n";
    out << name << " " << value << "\n";
  }

  for (const auto& [name, value] : gauges_) {
    out << "# TYPE " << name << " gauge\n";
    out << name << " " << value << "\n";
  }

  for (const auto& [name, data] : histograms_) {
    ExportHistogram(out, name, data);
  }

  if (!stage_requests_.empty()) {
    out << "# TYPE asciify_stage_requests_total counter\n";
    for (size_t i = 0; i < stage_requests_.size(); ++i) {
      out << "asciify_stage_requests_total{stage=\"" << i << "\"} "
          << stage_requests_[i] << "\n";
    }
  }

  if (!http_requests_.empty()) {
    out << "# TYPE asciify_http_requests_total counter\n";
    for (const auto& [key, count] : http_requests_) {
      out << "asciify_http_requests_total{method=\"" << key.method
          << "\",path=\"" << key.path << "\",status=\"" << key.status_code
          << "\"} " << count << "\n";
    }
  }

  if (http_latency_.count > 0) {
    ExportHistogram(out, "asciify_http_request_duration_ms", http_latency_);
  }

  return out.str();
}

// --- Metrics Handler Registration ---

void RegisterMetricsHandler(std::shared_ptr<PrometheusMetrics> metrics,
                            const std::string& path) {
  drogon::app().registerHandler(
      path,
      [metrics](const drogon::HttpRequestPtr& req,
                std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setBody(metrics->Export());
        resp->setContentTypeString("text/plain; version=0.0.4; charset=utf-8");
        resp->setStatusCode(drogon::k200OK);
        callback(resp);
      },
      {drogon::Get});
}

// --- RequestTimer ---

RequestTimer::RequestTimer(std::shared_ptr<PrometheusMetrics> metrics,
                           std::string method,
                           std::string path)
    : metrics_(std::move(metrics)),
      method_(std::move(method)),
      path_(std::move(path)),
      start_(std::chrono::steady_clock::now()) {}

RequestTimer::~RequestTimer() {
  if (metrics_) {
    auto end = std::chrono::steady_clock::now();
    auto duration =
        std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
    double latency_ms = static_cast<double>(duration.count()) / 1000.0;
    metrics_->RecordHttpRequest(method_, path_, status_code_, latency_ms);
  }
}

}  // namespace asciify::server
