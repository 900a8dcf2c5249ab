#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "circuit_breaker.hpp"
#include "clock.hpp"
#include "rate_limiter.hpp"
#include "request_outcome.hpp"
#include "retry_orchestrator.hpp"
#include "engine/transport/transport.hpp"

namespace voxguard {

class CancellationToken;
class ResilienceMetrics;

// What to do when the rate limiter has no token
enum class AdmissionMode {
  Reject,  ///< Return RateLimited immediately
  Wait     ///< Block the worker until a token is available
};

const char* ToString(AdmissionMode mode);

struct ExecutorOptions {
  AdmissionMode admission_mode = AdmissionMode::Wait;
  std::chrono::milliseconds request_timeout{30000};
};

/**
 * @brief Runs one logical request through limiter, breaker, transport and
 * retry policy
 *
 * Loop per attempt:
 * 1. Rate limiter admission (RateLimited in Reject mode)
 * 2. Circuit breaker Allow() (BreakerOpen, no transport call)
 * 3. Transport call with the per-request timeout
 * 4. Success -> RecordSuccess(), done
 * 5. Failure -> RecordFailure(), classify, back off and loop while
 *    retryable attempts remain
 *
 * Limiter and breaker may be shared with other executors; no lock is held
 * across the transport call or the backoff sleep. Execute() never throws
 * for request failures.
 */
class RequestExecutor {
 public:
  /**
   * @param transport Outbound transport
   * @param limiter Shared rate limiter (nullptr disables admission control)
   * @param breaker Circuit breaker of the target endpoint
   * @param retry Retry orchestrator
   * @param options Admission mode and per-request timeout
   * @param clock Time source for latency and backoff sleeps
   * @param metrics Optional sink for attempt counters
   */
  RequestExecutor(std::shared_ptr<Transport> transport,
                  std::shared_ptr<RateLimiter> limiter,
                  std::shared_ptr<CircuitBreaker> breaker,
                  std::shared_ptr<RetryOrchestrator> retry,
                  const ExecutorOptions& options,
                  std::shared_ptr<Clock> clock = std::make_shared<SteadyClock>(),
                  std::shared_ptr<ResilienceMetrics> metrics = nullptr);

  RequestExecutor(const RequestExecutor&) = delete;
  RequestExecutor& operator=(const RequestExecutor&) = delete;

  /**
   * @brief Execute a request with the full resilience policy
   *
   * @param request Request to send (re-sent unchanged on retry)
   * @param token Optional cancellation; observed before each attempt and
   *              during limiter waits and backoff sleeps
   */
  RequestOutcome Execute(const HttpRequest& request, const CancellationToken* token = nullptr);

  const CircuitBreaker& GetCircuitBreaker() const { return *breaker_; }
  const ExecutorOptions& GetOptions() const { return options_; }

 private:
  HttpResponse SendOnce(const HttpRequest& request);
  RequestOutcome& Finish(RequestOutcome& outcome, TerminalReason reason,
                         Clock::TimePoint start, const std::string& message);

  std::shared_ptr<Transport> transport_;
  std::shared_ptr<RateLimiter> limiter_;
  std::shared_ptr<CircuitBreaker> breaker_;
  std::shared_ptr<RetryOrchestrator> retry_;
  ExecutorOptions options_;
  std::shared_ptr<Clock> clock_;
  std::shared_ptr<ResilienceMetrics> metrics_;
};

}  // namespace voxguard
