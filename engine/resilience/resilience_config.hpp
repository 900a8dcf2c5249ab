#pragma once

#include <chrono>
#include <string>
#include "circuit_breaker.hpp"
#include "request_executor.hpp"
#include "retry_orchestrator.hpp"

namespace voxguard {

namespace engine {
namespace common {
class ConfigManager;
}  // namespace common
}  // namespace engine

// Parse "reject" / "wait"; throws std::invalid_argument otherwise
AdmissionMode ParseAdmissionMode(const std::string& value);

/**
 * @brief Resilience settings for one client
 *
 * Read from the `resilience` block of the application config:
 * @code
 * "resilience": {
 *   "rate_per_second": 10, "burst_capacity": 10,
 *   "failure_threshold": 5, "success_threshold": 2, "recovery_timeout_ms": 60000,
 *   "max_attempts": 4, "base_delay_ms": 1000, "max_delay_ms": 30000,
 *   "concurrency": 5, "request_timeout_ms": 30000, "admission_mode": "wait"
 * }
 * @endcode
 */
struct ResilienceConfig {
  double rate_per_second = 10.0;
  double burst_capacity = 10.0;
  int failure_threshold = 5;
  int success_threshold = 2;
  std::chrono::milliseconds recovery_timeout{60000};
  int max_attempts = 4;
  std::chrono::milliseconds base_delay{1000};
  std::chrono::milliseconds max_delay{30000};
  int concurrency = 5;
  std::chrono::milliseconds request_timeout{30000};
  AdmissionMode admission_mode = AdmissionMode::Wait;

  // Throws std::invalid_argument naming the first bad field
  void Validate() const;

  CircuitBreakerConfig GetCircuitBreakerConfig() const;
  RetryPolicy GetRetryPolicy() const;
  ExecutorOptions GetExecutorOptions() const;

  // Missing keys keep their defaults. The result is validated.
  static ResilienceConfig FromConfig(const engine::common::ConfigManager& config,
                                     const std::string& prefix = "resilience");
};

}  // namespace voxguard
