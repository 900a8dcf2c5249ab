#include "batch_summary.hpp"

namespace voxguard {

RiskLevel ClassifyRisk(double score) {
  if (score > 0.7) {
    return RiskLevel::High;
  }
  if (score > 0.4) {
    return RiskLevel::Medium;
  }
  return RiskLevel::Low;
}

const char* ToString(RiskLevel level) {
  switch (level) {
    case RiskLevel::Low: return "low";
    case RiskLevel::Medium: return "medium";
    case RiskLevel::High: return "high";
  }
  return "unknown";
}

void BatchSummary::Add(const ItemResult& result) {
  const RequestOutcome& outcome = result.outcome;
  total++;
  retry_count += static_cast<uint64_t>(outcome.retries);
  if (outcome.retries > 0) {
    retried++;
  }

  switch (outcome.terminal_reason) {
    case TerminalReason::Success:
      succeeded++;
      success_latency_ms_sum += outcome.GetLatencyMs();
      if (result.score) {
        scored++;
        score_sum += *result.score;
        switch (ClassifyRisk(*result.score)) {
          case RiskLevel::High: high_risk++; break;
          case RiskLevel::Medium: medium_risk++; break;
          case RiskLevel::Low: low_risk++; break;
        }
      }
      break;
    case TerminalReason::MaxRetriesExceeded:
    case TerminalReason::FatalClientError:
      failed++;
      break;
    case TerminalReason::BreakerOpen:
      breaker_trips++;
      break;
    case TerminalReason::RateLimited:
      rate_limited++;
      break;
    case TerminalReason::Cancelled:
      cancelled++;
      break;
  }
}

double BatchSummary::GetAverageLatencyMs() const {
  return succeeded > 0 ? success_latency_ms_sum / static_cast<double>(succeeded) : 0.0;
}

double BatchSummary::GetAverageScore() const {
  return scored > 0 ? score_sum / static_cast<double>(scored) : 0.0;
}

nlohmann::json BatchSummary::ToJson() const {
  nlohmann::json json;
  json["total"] = total;
  json["succeeded"] = succeeded;
  json["failed"] = failed;
  json["retried"] = retried;
  json["retry_count"] = retry_count;
  json["breaker_trips"] = breaker_trips;
  json["rate_limited"] = rate_limited;
  json["cancelled"] = cancelled;
  json["avg_latency_ms"] = GetAverageLatencyMs();
  json["avg_score"] = GetAverageScore();
  json["duration_ms"] = duration_ms;
  json["risk_distribution"] = {
    {"high", high_risk},
    {"medium", medium_risk},
    {"low", low_risk}
  };
  return json;
}

}  // namespace voxguard
