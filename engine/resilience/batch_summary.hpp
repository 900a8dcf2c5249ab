#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "request_outcome.hpp"

namespace voxguard {

// Deepfake score bands used for the batch risk distribution
enum class RiskLevel {
  Low,
  Medium,
  High
};

// High above 0.7, medium above 0.4, low otherwise
RiskLevel ClassifyRisk(double score);

const char* ToString(RiskLevel level);

// Input of the batch coordinator
struct BatchItem {
  std::string id;      ///< Stable identifier (e.g. file name)
  std::string source;  ///< Payload location (e.g. audio file path)
};

// Per-item result. `score` is set for successful deepfake responses.
struct ItemResult {
  std::string item_id;
  RequestOutcome outcome;
  std::optional<double> score;
  std::string label;
};

/**
 * @brief Aggregated result of a batch run
 *
 * `failed` counts terminal failures (fatal client error, retries exhausted).
 * Breaker and limiter rejections, and cancelled items, are counted separately.
 */
struct BatchSummary {
  uint64_t total = 0;
  uint64_t succeeded = 0;
  uint64_t failed = 0;
  uint64_t retried = 0;        ///< Items that needed at least one retry
  uint64_t retry_count = 0;    ///< Retries across all items
  uint64_t breaker_trips = 0;  ///< BreakerOpen outcomes
  uint64_t rate_limited = 0;
  uint64_t cancelled = 0;
  uint64_t high_risk = 0;
  uint64_t medium_risk = 0;
  uint64_t low_risk = 0;
  double success_latency_ms_sum = 0.0;
  double score_sum = 0.0;
  uint64_t scored = 0;
  double duration_ms = 0.0;

  std::vector<ItemResult> results;  ///< Input order

  // Fold one item result into the counters (does not store it)
  void Add(const ItemResult& result);

  double GetAverageLatencyMs() const;
  double GetAverageScore() const;

  nlohmann::json ToJson() const;
};

}  // namespace voxguard
