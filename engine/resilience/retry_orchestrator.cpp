#include "retry_orchestrator.hpp"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace voxguard {

namespace {

void ValidatePolicy(const RetryPolicy& policy) {
  if (policy.max_attempts < 1) {
    throw std::invalid_argument("Max attempts must be >= 1");
  }
  if (policy.base_delay < std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("Base delay must be >= zero");
  }
  if (policy.max_delay < policy.base_delay) {
    throw std::invalid_argument("Max delay must be >= base delay");
  }
}

// Parses the delta-seconds form of Retry-After; HTTP-date values are ignored
std::chrono::microseconds ParseRetryAfter(const std::string& value) {
  if (value.empty()) {
    return std::chrono::microseconds::zero();
  }
  char* end = nullptr;
  long seconds = std::strtol(value.c_str(), &end, 10);
  if (end == value.c_str() || *end != '\0' || seconds <= 0) {
    return std::chrono::microseconds::zero();
  }
  return std::chrono::seconds(seconds);
}

}  // namespace

const char* ToString(FailureClass failure) {
  switch (failure) {
    case FailureClass::Retryable: return "retryable";
    case FailureClass::Fatal: return "fatal";
    case FailureClass::BreakerOpen: return "breaker_open";
    case FailureClass::RateLimited: return "rate_limited";
  }
  return "unknown";
}

RetryOrchestrator::RetryOrchestrator(const RetryPolicy& policy)
    : RetryOrchestrator(policy, std::random_device{}()) {}

RetryOrchestrator::RetryOrchestrator(const RetryPolicy& policy, uint64_t seed)
    : policy_(policy),
      rng_(seed) {
  ValidatePolicy(policy_);
}

FailureClass RetryOrchestrator::Classify(const HttpResponse& response) {
  if (response.HasTransportError()) {
    // A malformed request fails the same way every time
    return response.error == TransportError::InvalidRequest ? FailureClass::Fatal
                                                            : FailureClass::Retryable;
  }
  int status = response.status_code;
  if (status == 429 || (status >= 500 && status < 600)) {
    return FailureClass::Retryable;
  }
  return FailureClass::Fatal;
}

bool RetryOrchestrator::ShouldRetry(const RetryContext& context) const {
  if (context.last_error != FailureClass::Retryable) {
    return false;
  }
  return context.attempt < std::min(context.max_attempts, policy_.max_attempts);
}

std::chrono::microseconds RetryOrchestrator::GetBackoffCap(int attempt) const {
  std::chrono::microseconds base = policy_.base_delay;
  std::chrono::microseconds max = policy_.max_delay;
  if (attempt < 1) {
    attempt = 1;
  }
  // Doubling past 2^40 always exceeds any sane max_delay
  int exponent = std::min(attempt - 1, 40);
  auto base_count = static_cast<uint64_t>(base.count());
  uint64_t limit = static_cast<uint64_t>(max.count());
  uint64_t delay = base_count;
  for (int i = 0; i < exponent && delay < limit; ++i) {
    delay *= 2;
  }
  return std::chrono::microseconds(static_cast<std::chrono::microseconds::rep>(std::min(delay, limit)));
}

std::chrono::microseconds RetryOrchestrator::BackoffDelay(int attempt) {
  auto cap = GetBackoffCap(attempt);
  std::uniform_int_distribution<std::chrono::microseconds::rep> dist(0, cap.count());
  std::lock_guard<std::mutex> lock(rng_mutex_);
  return std::chrono::microseconds(dist(rng_));
}

std::chrono::microseconds RetryOrchestrator::BackoffDelay(int attempt, const HttpResponse& response) {
  auto delay = BackoffDelay(attempt);
  auto retry_after = ParseRetryAfter(response.GetHeader("Retry-After"));
  if (retry_after > delay) {
    std::chrono::microseconds max = policy_.max_delay;
    delay = std::min(retry_after, max);
    SPDLOG_DEBUG("RetryOrchestrator: honoring Retry-After, delay {}ms",
                 std::chrono::duration_cast<std::chrono::milliseconds>(delay).count());
  }
  return delay;
}

}  // namespace voxguard
