#include "resilience_config.hpp"
#include "engine/common/config_manager.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace voxguard {

AdmissionMode ParseAdmissionMode(const std::string& value) {
  std::string lower = value;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "reject") {
    return AdmissionMode::Reject;
  }
  if (lower == "wait") {
    return AdmissionMode::Wait;
  }
  throw std::invalid_argument("admission_mode must be 'reject' or 'wait', got '" + value + "'");
}

void ResilienceConfig::Validate() const {
  if (!(rate_per_second > 0.0)) {
    throw std::invalid_argument("rate_per_second must be > 0");
  }
  if (burst_capacity < 1.0) {
    throw std::invalid_argument("burst_capacity must be >= 1");
  }
  if (failure_threshold < 1) {
    throw std::invalid_argument("failure_threshold must be >= 1");
  }
  if (success_threshold < 1) {
    throw std::invalid_argument("success_threshold must be >= 1");
  }
  if (recovery_timeout.count() < 0) {
    throw std::invalid_argument("recovery_timeout_ms must be >= 0");
  }
  if (max_attempts < 1) {
    throw std::invalid_argument("max_attempts must be >= 1");
  }
  if (base_delay.count() < 0) {
    throw std::invalid_argument("base_delay_ms must be >= 0");
  }
  if (max_delay < base_delay) {
    throw std::invalid_argument("max_delay_ms must be >= base_delay_ms");
  }
  if (concurrency < 1) {
    throw std::invalid_argument("concurrency must be >= 1");
  }
  if (request_timeout.count() <= 0) {
    throw std::invalid_argument("request_timeout_ms must be > 0");
  }
}

CircuitBreakerConfig ResilienceConfig::GetCircuitBreakerConfig() const {
  CircuitBreakerConfig config;
  config.failure_threshold = failure_threshold;
  config.success_threshold = success_threshold;
  config.recovery_timeout = recovery_timeout;
  return config;
}

RetryPolicy ResilienceConfig::GetRetryPolicy() const {
  RetryPolicy policy;
  policy.max_attempts = max_attempts;
  policy.base_delay = base_delay;
  policy.max_delay = max_delay;
  return policy;
}

ExecutorOptions ResilienceConfig::GetExecutorOptions() const {
  ExecutorOptions options;
  options.admission_mode = admission_mode;
  options.request_timeout = request_timeout;
  return options;
}

ResilienceConfig ResilienceConfig::FromConfig(const engine::common::ConfigManager& config,
                                              const std::string& prefix) {
  ResilienceConfig result;
  auto key = [&prefix](const char* name) { return prefix + "." + name; };

  result.rate_per_second = config.GetDouble(key("rate_per_second"), result.rate_per_second);
  result.burst_capacity = config.GetDouble(key("burst_capacity"), result.burst_capacity);
  result.failure_threshold = config.GetInt(key("failure_threshold"), result.failure_threshold);
  result.success_threshold = config.GetInt(key("success_threshold"), result.success_threshold);
  result.recovery_timeout = std::chrono::milliseconds(
      config.GetInt(key("recovery_timeout_ms"), static_cast<int>(result.recovery_timeout.count())));
  result.max_attempts = config.GetInt(key("max_attempts"), result.max_attempts);
  result.base_delay = std::chrono::milliseconds(
      config.GetInt(key("base_delay_ms"), static_cast<int>(result.base_delay.count())));
  result.max_delay = std::chrono::milliseconds(
      config.GetInt(key("max_delay_ms"), static_cast<int>(result.max_delay.count())));
  result.concurrency = config.GetInt(key("concurrency"), result.concurrency);
  result.request_timeout = std::chrono::milliseconds(
      config.GetInt(key("request_timeout_ms"), static_cast<int>(result.request_timeout.count())));
  result.admission_mode = ParseAdmissionMode(
      config.GetString(key("admission_mode"), ToString(result.admission_mode)));

  result.Validate();

  SPDLOG_INFO("Resilience config: rate={}/s burst={} breaker={}/{}/{}ms retry={}x{}..{}ms "
              "concurrency={} timeout={}ms admission={}",
              result.rate_per_second, result.burst_capacity, result.failure_threshold,
              result.success_threshold, result.recovery_timeout.count(), result.max_attempts,
              result.base_delay.count(), result.max_delay.count(), result.concurrency,
              result.request_timeout.count(), ToString(result.admission_mode));
  return result;
}

}  // namespace voxguard
