#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include "engine/transport/http_types.hpp"

namespace voxguard {

// Classification of the most recent failure of a logical request
enum class FailureClass {
  Retryable,    ///< 5xx, 429, timeouts, connection errors
  Fatal,        ///< Other 4xx and unexpected statuses
  BreakerOpen,  ///< Rejected by the circuit breaker
  RateLimited   ///< Rejected by the rate limiter
};

const char* ToString(FailureClass failure);

struct RetryPolicy {
  int max_attempts = 4;                          ///< Total transport attempts, including the first
  std::chrono::milliseconds base_delay{1000};
  std::chrono::milliseconds max_delay{30000};
};

// Per logical request retry bookkeeping
struct RetryContext {
  int attempt = 1;  ///< 1-indexed attempt that just failed
  int max_attempts = 1;
  FailureClass last_error = FailureClass::Retryable;
};

/**
 * @brief Retry decisions and exponential backoff with full jitter
 *
 * Cap for attempt n: min(base_delay * 2^(n-1), max_delay).
 * Actual delay: uniform in [0, cap].
 *
 * BackoffDelay() may be called concurrently by many workers.
 */
class RetryOrchestrator {
 public:
  // Throws std::invalid_argument for an invalid policy
  explicit RetryOrchestrator(const RetryPolicy& policy);
  RetryOrchestrator(const RetryPolicy& policy, uint64_t seed);

  RetryOrchestrator(const RetryOrchestrator&) = delete;
  RetryOrchestrator& operator=(const RetryOrchestrator&) = delete;

  /** @brief Classify a failed transport result */
  static FailureClass Classify(const HttpResponse& response);

  /** @brief True if the failure is retryable and attempts remain */
  bool ShouldRetry(const RetryContext& context) const;

  /** @brief Un-jittered backoff ceiling for the given attempt */
  std::chrono::microseconds GetBackoffCap(int attempt) const;

  /** @brief Jittered delay before the attempt following `attempt` */
  std::chrono::microseconds BackoffDelay(int attempt);

  /**
   * @brief Jittered delay that also honors a server Retry-After hint
   *
   * A Retry-After value (seconds) raises the delay, still capped at max_delay.
   */
  std::chrono::microseconds BackoffDelay(int attempt, const HttpResponse& response);

  const RetryPolicy& GetPolicy() const { return policy_; }

 private:
  RetryPolicy policy_;
  std::mt19937_64 rng_;
  std::mutex rng_mutex_;
};

}  // namespace voxguard
