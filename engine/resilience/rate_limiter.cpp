#include "rate_limiter.hpp"
#include "cancellation_token.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>

namespace voxguard {

RateLimiter::RateLimiter(double max_tokens, double refill_rate_per_second,
                         std::shared_ptr<Clock> clock)
    : tokens_(max_tokens),
      max_tokens_(max_tokens),
      refill_rate_per_second_(refill_rate_per_second),
      clock_(std::move(clock)) {
  if (!clock_) {
    throw std::invalid_argument("RateLimiter requires a clock");
  }
  if (!(refill_rate_per_second > 0.0)) {
    throw std::invalid_argument("Rate limiter refill rate must be > 0");
  }
  if (!(max_tokens >= 1.0)) {
    throw std::invalid_argument("Rate limiter burst capacity must be >= 1");
  }
  last_refill_ = clock_->Now();
}

bool RateLimiter::TryAcquire() {
  Clock::Duration unused;
  return TryAcquireLocked(unused);
}

void RateLimiter::Acquire() {
  Clock::Duration wait_time;
  while (!TryAcquireLocked(wait_time)) {
    // Lock is released here; only this caller sleeps
    clock_->SleepFor(wait_time);
  }
}

bool RateLimiter::Acquire(const CancellationToken& token) {
  Clock::Duration wait_time;
  while (!TryAcquireLocked(wait_time)) {
    if (token.IsCancelled()) {
      return false;
    }
    SPDLOG_TRACE("RateLimiter: bucket empty, waiting {}us",
                 std::chrono::duration_cast<std::chrono::microseconds>(wait_time).count());
    if (!clock_->SleepFor(wait_time, &token)) {
      return false;
    }
  }
  return true;
}

double RateLimiter::GetAvailableTokens() {
  std::lock_guard<std::mutex> lock(mutex_);
  RefillTokens();
  return tokens_;
}

bool RateLimiter::TryAcquireLocked(Clock::Duration& wait_time) {
  std::lock_guard<std::mutex> lock(mutex_);
  RefillTokens();
  if (tokens_ >= 1.0) {
    tokens_ -= 1.0;
    return true;
  }
  wait_time = CalculateWaitTime();
  return false;
}

void RateLimiter::RefillTokens() {
  auto now = clock_->Now();
  if (now <= last_refill_) {
    return;
  }
  std::chrono::duration<double> elapsed = now - last_refill_;
  tokens_ = std::min(max_tokens_, tokens_ + elapsed.count() * refill_rate_per_second_);
  last_refill_ = now;
}

Clock::Duration RateLimiter::CalculateWaitTime() const {
  if (tokens_ >= 1.0) {
    return Clock::Duration::zero();
  }
  // Time until the bucket holds one whole token
  std::chrono::duration<double> seconds((1.0 - tokens_) / refill_rate_per_second_);
  auto wait = std::chrono::duration_cast<Clock::Duration>(seconds);
  return std::max(wait, Clock::Duration(1));
}

}  // namespace voxguard
