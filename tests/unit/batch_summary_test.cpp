#include <gtest/gtest.h>
#include <chrono>
#include "batch_summary.hpp"

using namespace voxguard;

namespace {

ItemResult MakeResult(TerminalReason reason, int retries = 0) {
  ItemResult result;
  result.item_id = "item";
  result.outcome.terminal_reason = reason;
  result.outcome.succeeded = reason == TerminalReason::Success;
  result.outcome.retries = retries;
  result.outcome.attempts_used = retries + 1;
  return result;
}

}  // namespace

class BatchSummaryTest : public ::testing::Test {
 protected:
  BatchSummary summary_;
};

TEST_F(BatchSummaryTest, ClassifyRisk_Bands) {
  EXPECT_EQ(ClassifyRisk(0.95), RiskLevel::High);
  EXPECT_EQ(ClassifyRisk(0.71), RiskLevel::High);
  EXPECT_EQ(ClassifyRisk(0.7), RiskLevel::Medium);
  EXPECT_EQ(ClassifyRisk(0.41), RiskLevel::Medium);
  EXPECT_EQ(ClassifyRisk(0.4), RiskLevel::Low);
  EXPECT_EQ(ClassifyRisk(0.0), RiskLevel::Low);
  EXPECT_STREQ(ToString(RiskLevel::High), "high");
}

TEST_F(BatchSummaryTest, Add_CountsEveryReason) {
  summary_.Add(MakeResult(TerminalReason::Success));
  summary_.Add(MakeResult(TerminalReason::Success, 2));
  summary_.Add(MakeResult(TerminalReason::MaxRetriesExceeded, 3));
  summary_.Add(MakeResult(TerminalReason::FatalClientError));
  summary_.Add(MakeResult(TerminalReason::BreakerOpen));
  summary_.Add(MakeResult(TerminalReason::RateLimited));
  summary_.Add(MakeResult(TerminalReason::Cancelled));

  EXPECT_EQ(summary_.total, 7u);
  EXPECT_EQ(summary_.succeeded, 2u);
  EXPECT_EQ(summary_.failed, 2u);
  EXPECT_EQ(summary_.breaker_trips, 1u);
  EXPECT_EQ(summary_.rate_limited, 1u);
  EXPECT_EQ(summary_.cancelled, 1u);
  EXPECT_EQ(summary_.retried, 2u);
  EXPECT_EQ(summary_.retry_count, 5u);
  EXPECT_TRUE(summary_.results.empty());
}

TEST_F(BatchSummaryTest, AverageLatency_OnlySuccesses) {
  ItemResult fast = MakeResult(TerminalReason::Success);
  fast.outcome.total_latency = std::chrono::milliseconds(100);
  ItemResult slow = MakeResult(TerminalReason::Success);
  slow.outcome.total_latency = std::chrono::milliseconds(300);
  ItemResult failed = MakeResult(TerminalReason::MaxRetriesExceeded);
  failed.outcome.total_latency = std::chrono::seconds(10);

  summary_.Add(fast);
  summary_.Add(slow);
  summary_.Add(failed);
  EXPECT_DOUBLE_EQ(summary_.GetAverageLatencyMs(), 200.0);
}

TEST_F(BatchSummaryTest, Averages_EmptyAreZero) {
  EXPECT_DOUBLE_EQ(summary_.GetAverageLatencyMs(), 0.0);
  EXPECT_DOUBLE_EQ(summary_.GetAverageScore(), 0.0);
}

TEST_F(BatchSummaryTest, ScoreOnlyCountedForSuccess) {
  ItemResult scored = MakeResult(TerminalReason::Success);
  scored.score = 0.8;
  ItemResult failed = MakeResult(TerminalReason::FatalClientError);
  failed.score = 0.1;

  summary_.Add(scored);
  summary_.Add(failed);
  EXPECT_EQ(summary_.high_risk, 1u);
  EXPECT_EQ(summary_.low_risk, 0u);
  EXPECT_DOUBLE_EQ(summary_.GetAverageScore(), 0.8);
}

TEST_F(BatchSummaryTest, ToJson) {
  ItemResult scored = MakeResult(TerminalReason::Success, 1);
  scored.score = 0.5;
  summary_.Add(scored);
  summary_.Add(MakeResult(TerminalReason::FatalClientError));
  summary_.duration_ms = 1234.5;

  nlohmann::json json = summary_.ToJson();
  EXPECT_EQ(json["total"], 2);
  EXPECT_EQ(json["succeeded"], 1);
  EXPECT_EQ(json["failed"], 1);
  EXPECT_EQ(json["retry_count"], 1);
  EXPECT_DOUBLE_EQ(json["duration_ms"].get<double>(), 1234.5);
  EXPECT_EQ(json["risk_distribution"]["medium"], 1);
  EXPECT_EQ(json["risk_distribution"]["high"], 0);
}
