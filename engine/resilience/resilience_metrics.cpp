#include "resilience_metrics.hpp"
#include "batch_summary.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace voxguard {

namespace {

constexpr const char* kMetricPrefix = "voxguard_";

void WriteMetric(std::ostringstream& oss, const std::string& name, const char* type,
                 const char* help, double value) {
  oss << "# HELP " << kMetricPrefix << name << " " << help << "\n";
  oss << "# TYPE " << kMetricPrefix << name << " " << type << "\n";
  oss << kMetricPrefix << name << " " << value << "\n\n";
}

int BreakerStateValue(CircuitBreaker::State state) {
  switch (state) {
    case CircuitBreaker::State::Closed: return 0;
    case CircuitBreaker::State::HalfOpen: return 1;
    case CircuitBreaker::State::Open: return 2;
  }
  return -1;
}

}  // namespace

void ResilienceMetrics::RecordAttempt() {
  transport_attempts_.fetch_add(1, std::memory_order_relaxed);
}

void ResilienceMetrics::RecordRetry() {
  retry_count_.fetch_add(1, std::memory_order_relaxed);
}

void ResilienceMetrics::RecordOutcome(const RequestOutcome& outcome) {
  switch (outcome.terminal_reason) {
    case TerminalReason::Success: {
      files_processed_.fetch_add(1, std::memory_order_relaxed);
      files_succeeded_.fetch_add(1, std::memory_order_relaxed);
      auto us = std::chrono::duration_cast<std::chrono::microseconds>(outcome.total_latency).count();
      success_latency_us_.fetch_add(static_cast<uint64_t>(us > 0 ? us : 0), std::memory_order_relaxed);
      break;
    }
    case TerminalReason::MaxRetriesExceeded:
    case TerminalReason::FatalClientError:
      files_processed_.fetch_add(1, std::memory_order_relaxed);
      files_failed_.fetch_add(1, std::memory_order_relaxed);
      break;
    case TerminalReason::BreakerOpen:
      breaker_trips_.fetch_add(1, std::memory_order_relaxed);
      break;
    case TerminalReason::RateLimited:
      rate_limited_.fetch_add(1, std::memory_order_relaxed);
      break;
    case TerminalReason::Cancelled:
      cancelled_.fetch_add(1, std::memory_order_relaxed);
      break;
  }
}

void ResilienceMetrics::RecordScore(double score) {
  switch (ClassifyRisk(score)) {
    case RiskLevel::High: high_risk_.fetch_add(1, std::memory_order_relaxed); break;
    case RiskLevel::Medium: medium_risk_.fetch_add(1, std::memory_order_relaxed); break;
    case RiskLevel::Low: low_risk_.fetch_add(1, std::memory_order_relaxed); break;
  }
  double clamped = std::max(0.0, score);
  score_sum_micros_.fetch_add(static_cast<uint64_t>(std::llround(clamped * 1e6)), std::memory_order_relaxed);
  scored_.fetch_add(1, std::memory_order_relaxed);
}

MetricsSnapshot ResilienceMetrics::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.files_processed = files_processed_.load(std::memory_order_relaxed);
  snapshot.files_succeeded = files_succeeded_.load(std::memory_order_relaxed);
  snapshot.files_failed = files_failed_.load(std::memory_order_relaxed);
  snapshot.retry_count = retry_count_.load(std::memory_order_relaxed);
  snapshot.breaker_trips = breaker_trips_.load(std::memory_order_relaxed);
  snapshot.rate_limited = rate_limited_.load(std::memory_order_relaxed);
  snapshot.cancelled = cancelled_.load(std::memory_order_relaxed);
  snapshot.transport_attempts = transport_attempts_.load(std::memory_order_relaxed);
  snapshot.high_risk = high_risk_.load(std::memory_order_relaxed);
  snapshot.medium_risk = medium_risk_.load(std::memory_order_relaxed);
  snapshot.low_risk = low_risk_.load(std::memory_order_relaxed);

  uint64_t latency_us = success_latency_us_.load(std::memory_order_relaxed);
  if (snapshot.files_succeeded > 0) {
    snapshot.avg_latency_ms = static_cast<double>(latency_us) / 1000.0 /
                              static_cast<double>(snapshot.files_succeeded);
  }
  uint64_t scored = scored_.load(std::memory_order_relaxed);
  if (scored > 0) {
    snapshot.avg_score = static_cast<double>(score_sum_micros_.load(std::memory_order_relaxed)) /
                         1e6 / static_cast<double>(scored);
  }
  return snapshot;
}

void ResilienceMetrics::Reset() {
  files_processed_ = 0;
  files_succeeded_ = 0;
  files_failed_ = 0;
  retry_count_ = 0;
  breaker_trips_ = 0;
  rate_limited_ = 0;
  cancelled_ = 0;
  transport_attempts_ = 0;
  success_latency_us_ = 0;
  high_risk_ = 0;
  medium_risk_ = 0;
  low_risk_ = 0;
  scored_ = 0;
  score_sum_micros_ = 0;
}

std::string FormatPrometheus(const MetricsSnapshot& snapshot, const BreakerStates& breakers) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3);
  WriteMetric(oss, "files_processed_total", "counter", "Total number of files processed",
              static_cast<double>(snapshot.files_processed));
  WriteMetric(oss, "files_succeeded_total", "counter", "Total number of successfully processed files",
              static_cast<double>(snapshot.files_succeeded));
  WriteMetric(oss, "files_failed_total", "counter", "Total number of failed files",
              static_cast<double>(snapshot.files_failed));
  WriteMetric(oss, "retries_total", "counter", "Total number of retries",
              static_cast<double>(snapshot.retry_count));
  WriteMetric(oss, "circuit_breaker_trips_total", "counter", "Requests rejected by an open circuit breaker",
              static_cast<double>(snapshot.breaker_trips));
  WriteMetric(oss, "rate_limited_total", "counter", "Requests rejected by the rate limiter",
              static_cast<double>(snapshot.rate_limited));
  WriteMetric(oss, "cancelled_total", "counter", "Requests abandoned due to cancellation",
              static_cast<double>(snapshot.cancelled));
  WriteMetric(oss, "transport_attempts_total", "counter", "HTTP calls issued to the API",
              static_cast<double>(snapshot.transport_attempts));
  WriteMetric(oss, "avg_latency_ms", "gauge", "Average API latency in milliseconds",
              snapshot.avg_latency_ms);
  WriteMetric(oss, "avg_score", "gauge", "Average deepfake score", snapshot.avg_score);
  WriteMetric(oss, "high_risk_count", "gauge", "Number of high-risk files",
              static_cast<double>(snapshot.high_risk));
  WriteMetric(oss, "medium_risk_count", "gauge", "Number of medium-risk files",
              static_cast<double>(snapshot.medium_risk));
  WriteMetric(oss, "low_risk_count", "gauge", "Number of low-risk files",
              static_cast<double>(snapshot.low_risk));

  if (!breakers.empty()) {
    oss << "# HELP " << kMetricPrefix << "circuit_breaker_state Breaker state (0=closed, 1=half_open, 2=open)\n";
    oss << "# TYPE " << kMetricPrefix << "circuit_breaker_state gauge\n";
    for (const auto& [name, state] : breakers) {
      oss << kMetricPrefix << "circuit_breaker_state{endpoint=\"" << name << "\"} "
          << BreakerStateValue(state) << "\n";
    }
  }
  return oss.str();
}

nlohmann::json BuildHealthJson(const MetricsSnapshot& snapshot, const BreakerStates& breakers) {
  nlohmann::json health;
  bool any_open = false;
  nlohmann::json breaker_json = nlohmann::json::object();
  for (const auto& [name, state] : breakers) {
    breaker_json[name] = ToString(state);
    if (state == CircuitBreaker::State::Open) {
      any_open = true;
    }
  }
  health["status"] = any_open ? "degraded" : "healthy";
  health["circuit_breaker"] = breaker_json;
  health["metrics"] = {
    {"files_processed", snapshot.files_processed},
    {"files_succeeded", snapshot.files_succeeded},
    {"files_failed", snapshot.files_failed},
    {"retry_count", snapshot.retry_count},
    {"breaker_trips", snapshot.breaker_trips},
    {"rate_limited", snapshot.rate_limited},
    {"avg_latency_ms", snapshot.avg_latency_ms}
  };
  return health;
}

}  // namespace voxguard
