#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "circuit_breaker.hpp"
#include "request_outcome.hpp"

namespace voxguard {

// Point-in-time copy of the counters
struct MetricsSnapshot {
  uint64_t files_processed = 0;
  uint64_t files_succeeded = 0;
  uint64_t files_failed = 0;
  uint64_t retry_count = 0;
  uint64_t breaker_trips = 0;   ///< BreakerOpen outcomes
  uint64_t rate_limited = 0;
  uint64_t cancelled = 0;
  uint64_t transport_attempts = 0;
  uint64_t high_risk = 0;
  uint64_t medium_risk = 0;
  uint64_t low_risk = 0;
  double avg_latency_ms = 0.0;
  double avg_score = 0.0;
};

using BreakerStates = std::vector<std::pair<std::string, CircuitBreaker::State>>;

/**
 * @brief Lock-free counters fed by the executor and the batch coordinator
 *
 * The executor records attempts, retries and terminal outcomes; the
 * coordinator adds deepfake scores. Readers take a Snapshot().
 */
class ResilienceMetrics {
 public:
  ResilienceMetrics() = default;

  ResilienceMetrics(const ResilienceMetrics&) = delete;
  ResilienceMetrics& operator=(const ResilienceMetrics&) = delete;

  void RecordAttempt();
  void RecordRetry();
  void RecordOutcome(const RequestOutcome& outcome);
  void RecordScore(double score);

  MetricsSnapshot Snapshot() const;

  void Reset();

 private:
  std::atomic<uint64_t> files_processed_{0};
  std::atomic<uint64_t> files_succeeded_{0};
  std::atomic<uint64_t> files_failed_{0};
  std::atomic<uint64_t> retry_count_{0};
  std::atomic<uint64_t> breaker_trips_{0};
  std::atomic<uint64_t> rate_limited_{0};
  std::atomic<uint64_t> cancelled_{0};
  std::atomic<uint64_t> transport_attempts_{0};
  std::atomic<uint64_t> success_latency_us_{0};
  std::atomic<uint64_t> high_risk_{0};
  std::atomic<uint64_t> medium_risk_{0};
  std::atomic<uint64_t> low_risk_{0};
  std::atomic<uint64_t> scored_{0};
  std::atomic<uint64_t> score_sum_micros_{0};  ///< Scores in millionths
};

// Prometheus text exposition (version 0.0.4)
std::string FormatPrometheus(const MetricsSnapshot& snapshot, const BreakerStates& breakers);

// Health document: overall status plus per-endpoint breaker state.
// Status is "degraded" while any breaker is open.
nlohmann::json BuildHealthJson(const MetricsSnapshot& snapshot, const BreakerStates& breakers);

}  // namespace voxguard
