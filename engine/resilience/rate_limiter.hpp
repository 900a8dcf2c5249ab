#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include "clock.hpp"

namespace voxguard {

class CancellationToken;

// Token bucket rate limiter for outbound API calls.
// One instance is shared by every worker talking to the same API.
class RateLimiter {
 public:
  // Throws std::invalid_argument if max_tokens < 1 or refill rate <= 0
  RateLimiter(double max_tokens, double refill_rate_per_second,
              std::shared_ptr<Clock> clock = std::make_shared<SteadyClock>());
  ~RateLimiter() = default;

  // Non-copyable, non-movable (mutex member)
  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  // Try to acquire a token (non-blocking)
  // Returns true if token acquired, false otherwise
  bool TryAcquire();

  // Acquire a token (blocking until token available)
  void Acquire();

  // Acquire a token, giving up when `token` is cancelled.
  // Returns false if cancelled before a token was obtained.
  bool Acquire(const CancellationToken& token);

  // Tokens currently in the bucket after applying any pending refill
  double GetAvailableTokens();

  double GetMaxTokens() const { return max_tokens_; }
  double GetRefillRate() const { return refill_rate_per_second_; }

 private:
  // Both require mutex_ to be held
  void RefillTokens();
  Clock::Duration CalculateWaitTime() const;

  // Refill/check/decrement under the lock; on failure stores the wait time
  bool TryAcquireLocked(Clock::Duration& wait_time);

  double tokens_;
  double max_tokens_;
  double refill_rate_per_second_;
  std::shared_ptr<Clock> clock_;
  Clock::TimePoint last_refill_;
  mutable std::mutex mutex_;
};

}  // namespace voxguard
