#include <gtest/gtest.h>
#include <stdexcept>
#include "resilience_config.hpp"
#include "config_manager.hpp"

using namespace voxguard;
using voxguard::engine::common::ConfigManager;

class ResilienceConfigTest : public ::testing::Test {
 protected:
  ConfigManager config_;
};

TEST_F(ResilienceConfigTest, Defaults) {
  ResilienceConfig defaults;
  EXPECT_NO_THROW(defaults.Validate());
  EXPECT_DOUBLE_EQ(defaults.rate_per_second, 10.0);
  EXPECT_DOUBLE_EQ(defaults.burst_capacity, 10.0);
  EXPECT_EQ(defaults.failure_threshold, 5);
  EXPECT_EQ(defaults.success_threshold, 2);
  EXPECT_EQ(defaults.recovery_timeout, std::chrono::milliseconds(60000));
  EXPECT_EQ(defaults.max_attempts, 4);
  EXPECT_EQ(defaults.base_delay, std::chrono::milliseconds(1000));
  EXPECT_EQ(defaults.max_delay, std::chrono::milliseconds(30000));
  EXPECT_EQ(defaults.concurrency, 5);
  EXPECT_EQ(defaults.admission_mode, AdmissionMode::Wait);
}

TEST_F(ResilienceConfigTest, FromConfig_MissingBlockUsesDefaults) {
  ASSERT_TRUE(config_.LoadFromString(R"({"app": {}})"));
  ResilienceConfig result = ResilienceConfig::FromConfig(config_);
  EXPECT_EQ(result.max_attempts, 4);
  EXPECT_EQ(result.concurrency, 5);
}

TEST_F(ResilienceConfigTest, FromConfig_ReadsAllKeys) {
  ASSERT_TRUE(config_.LoadFromString(R"({
    "resilience": {
      "rate_per_second": 2.5, "burst_capacity": 4,
      "failure_threshold": 3, "success_threshold": 1, "recovery_timeout_ms": 500,
      "max_attempts": 6, "base_delay_ms": 50, "max_delay_ms": 800,
      "concurrency": 12, "request_timeout_ms": 1500, "admission_mode": "Reject"
    }
  })"));

  ResilienceConfig result = ResilienceConfig::FromConfig(config_);
  EXPECT_DOUBLE_EQ(result.rate_per_second, 2.5);
  EXPECT_DOUBLE_EQ(result.burst_capacity, 4.0);
  EXPECT_EQ(result.failure_threshold, 3);
  EXPECT_EQ(result.success_threshold, 1);
  EXPECT_EQ(result.recovery_timeout, std::chrono::milliseconds(500));
  EXPECT_EQ(result.max_attempts, 6);
  EXPECT_EQ(result.base_delay, std::chrono::milliseconds(50));
  EXPECT_EQ(result.max_delay, std::chrono::milliseconds(800));
  EXPECT_EQ(result.concurrency, 12);
  EXPECT_EQ(result.request_timeout, std::chrono::milliseconds(1500));
  EXPECT_EQ(result.admission_mode, AdmissionMode::Reject);

  EXPECT_EQ(result.GetCircuitBreakerConfig().failure_threshold, 3);
  EXPECT_EQ(result.GetRetryPolicy().max_delay, std::chrono::milliseconds(800));
  EXPECT_EQ(result.GetExecutorOptions().request_timeout, std::chrono::milliseconds(1500));
}

TEST_F(ResilienceConfigTest, FromConfig_CustomPrefix) {
  ASSERT_TRUE(config_.LoadFromString(R"({"sar_client": {"max_attempts": 2}})"));
  EXPECT_EQ(ResilienceConfig::FromConfig(config_, "sar_client").max_attempts, 2);
}

TEST_F(ResilienceConfigTest, FromConfig_EnvironmentOverride) {
  ASSERT_TRUE(config_.LoadFromString(R"({"resilience": {"concurrency": 3}})"));
  config_.SetInt("resilience.concurrency", 8);
  EXPECT_EQ(ResilienceConfig::FromConfig(config_).concurrency, 8);
}

TEST_F(ResilienceConfigTest, FromConfig_InvalidValueThrows) {
  ASSERT_TRUE(config_.LoadFromString(R"({"resilience": {"max_attempts": 0}})"));
  EXPECT_THROW(ResilienceConfig::FromConfig(config_), std::invalid_argument);

  ASSERT_TRUE(config_.LoadFromString(R"({"resilience": {"admission_mode": "queue"}})"));
  EXPECT_THROW(ResilienceConfig::FromConfig(config_), std::invalid_argument);
}

TEST_F(ResilienceConfigTest, Validate_NamesField) {
  ResilienceConfig config;
  config.max_delay = std::chrono::milliseconds(10);
  try {
    config.Validate();
    FAIL() << "Expected std::invalid_argument";
  } catch (const std::invalid_argument& e) {
    EXPECT_NE(std::string(e.what()).find("max_delay_ms"), std::string::npos);
  }

  config = ResilienceConfig{};
  config.concurrency = 0;
  EXPECT_THROW(config.Validate(), std::invalid_argument);

  config = ResilienceConfig{};
  config.rate_per_second = 0.0;
  EXPECT_THROW(config.Validate(), std::invalid_argument);

  config = ResilienceConfig{};
  config.request_timeout = std::chrono::milliseconds(0);
  EXPECT_THROW(config.Validate(), std::invalid_argument);
}

TEST_F(ResilienceConfigTest, ParseAdmissionMode) {
  EXPECT_EQ(ParseAdmissionMode("reject"), AdmissionMode::Reject);
  EXPECT_EQ(ParseAdmissionMode("WAIT"), AdmissionMode::Wait);
  EXPECT_THROW(ParseAdmissionMode(""), std::invalid_argument);
  EXPECT_STREQ(ToString(AdmissionMode::Reject), "reject");
}
