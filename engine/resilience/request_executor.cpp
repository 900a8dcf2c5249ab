#include "request_executor.hpp"
#include "cancellation_token.hpp"
#include "resilience_metrics.hpp"
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>

namespace voxguard {

const char* ToString(TerminalReason reason) {
  switch (reason) {
    case TerminalReason::Success: return "success";
    case TerminalReason::MaxRetriesExceeded: return "max_retries_exceeded";
    case TerminalReason::FatalClientError: return "fatal_client_error";
    case TerminalReason::BreakerOpen: return "breaker_open";
    case TerminalReason::RateLimited: return "rate_limited";
    case TerminalReason::Cancelled: return "cancelled";
  }
  return "unknown";
}

const char* ToString(AdmissionMode mode) {
  switch (mode) {
    case AdmissionMode::Reject: return "reject";
    case AdmissionMode::Wait: return "wait";
  }
  return "unknown";
}

RequestExecutor::RequestExecutor(std::shared_ptr<Transport> transport,
                                 std::shared_ptr<RateLimiter> limiter,
                                 std::shared_ptr<CircuitBreaker> breaker,
                                 std::shared_ptr<RetryOrchestrator> retry,
                                 const ExecutorOptions& options,
                                 std::shared_ptr<Clock> clock,
                                 std::shared_ptr<ResilienceMetrics> metrics)
    : transport_(std::move(transport)),
      limiter_(std::move(limiter)),
      breaker_(std::move(breaker)),
      retry_(std::move(retry)),
      options_(options),
      clock_(std::move(clock)),
      metrics_(std::move(metrics)) {
  if (!transport_ || !breaker_ || !retry_ || !clock_) {
    throw std::invalid_argument("RequestExecutor requires transport, breaker, retry policy and clock");
  }
  if (options_.request_timeout <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("Per-request timeout must be > 0");
  }
}

RequestOutcome RequestExecutor::Execute(const HttpRequest& request, const CancellationToken* token) {
  const auto start = clock_->Now();
  RequestOutcome outcome;
  RetryContext context;
  context.max_attempts = retry_->GetPolicy().max_attempts;

  while (true) {
    if (token != nullptr && token->IsCancelled()) {
      return Finish(outcome, TerminalReason::Cancelled, start, "cancelled before attempt");
    }

    // 1. Admission
    if (limiter_) {
      if (options_.admission_mode == AdmissionMode::Wait) {
        if (token != nullptr) {
          if (!limiter_->Acquire(*token)) {
            return Finish(outcome, TerminalReason::Cancelled, start, "cancelled waiting for rate limiter");
          }
        } else {
          limiter_->Acquire();
        }
      } else if (!limiter_->TryAcquire()) {
        context.last_error = FailureClass::RateLimited;
        return Finish(outcome, TerminalReason::RateLimited, start, "rate limit exceeded");
      }
    }

    // 2. Availability
    if (!breaker_->Allow()) {
      context.last_error = FailureClass::BreakerOpen;
      return Finish(outcome, TerminalReason::BreakerOpen, start,
                    "circuit breaker " + breaker_->GetName() + " is open");
    }

    // 3. Transport
    outcome.attempts_used = context.attempt;
    HttpResponse response = SendOnce(request);

    if (response.IsSuccess()) {
      breaker_->RecordSuccess();
      outcome.last_response = std::move(response);
      return Finish(outcome, TerminalReason::Success, start, "");
    }

    // 4. Failure feedback and retry decision
    breaker_->RecordFailure();
    context.last_error = RetryOrchestrator::Classify(response);
    std::string description = response.Describe();

    if (context.last_error == FailureClass::Fatal) {
      outcome.last_response = std::move(response);
      return Finish(outcome, TerminalReason::FatalClientError, start, description);
    }
    if (!retry_->ShouldRetry(context)) {
      outcome.last_response = std::move(response);
      return Finish(outcome, TerminalReason::MaxRetriesExceeded, start,
                    description + " after " + std::to_string(context.attempt) + " attempts");
    }

    auto delay = retry_->BackoffDelay(context.attempt, response);
    SPDLOG_WARN("RequestExecutor: {} {} failed ({}), retry {}/{} in {}ms",
                request.method, request.url, description, context.attempt,
                context.max_attempts - 1,
                std::chrono::duration_cast<std::chrono::milliseconds>(delay).count());
    outcome.last_response = std::move(response);
    outcome.retries++;
    if (metrics_) {
      metrics_->RecordRetry();
    }
    if (!clock_->SleepFor(delay, token)) {
      return Finish(outcome, TerminalReason::Cancelled, start, "cancelled during backoff");
    }
    context.attempt++;
  }
}

HttpResponse RequestExecutor::SendOnce(const HttpRequest& request) {
  if (metrics_) {
    metrics_->RecordAttempt();
  }
  try {
    HttpResponse response = transport_->Send(request, options_.request_timeout);
    SPDLOG_DEBUG("RequestExecutor: {} {} -> {}", request.method, request.url, response.Describe());
    return response;
  } catch (const std::exception& e) {
    SPDLOG_ERROR("RequestExecutor: transport threw for {}: {}", request.url, e.what());
    return HttpResponse::FromError(TransportError::ProtocolError, e.what());
  }
}

RequestOutcome& RequestExecutor::Finish(RequestOutcome& outcome, TerminalReason reason,
                                        Clock::TimePoint start, const std::string& message) {
  outcome.terminal_reason = reason;
  outcome.succeeded = reason == TerminalReason::Success;
  outcome.total_latency = clock_->Now() - start;
  outcome.error_message = message;
  if (metrics_) {
    metrics_->RecordOutcome(outcome);
  }
  if (reason == TerminalReason::MaxRetriesExceeded || reason == TerminalReason::FatalClientError) {
    SPDLOG_ERROR("RequestExecutor: request failed ({}): {}", ToString(reason), message);
  } else if (!outcome.succeeded) {
    SPDLOG_DEBUG("RequestExecutor: request not sent ({}): {}", ToString(reason), message);
  }
  return outcome;
}

}  // namespace voxguard
