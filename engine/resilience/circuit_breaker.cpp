#include "circuit_breaker.hpp"
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>

namespace voxguard {

const char* ToString(CircuitBreaker::State state) {
  switch (state) {
    case CircuitBreaker::State::Closed: return "closed";
    case CircuitBreaker::State::Open: return "open";
    case CircuitBreaker::State::HalfOpen: return "half_open";
  }
  return "unknown";
}

CircuitBreaker::CircuitBreaker(const std::string& name, const CircuitBreakerConfig& config,
                               std::shared_ptr<Clock> clock)
    : name_(name),
      config_(config),
      clock_(std::move(clock)) {
  if (!clock_) {
    throw std::invalid_argument("CircuitBreaker requires a clock");
  }
  if (config.failure_threshold < 1) {
    throw std::invalid_argument("Failure threshold must be >= 1");
  }
  if (config.success_threshold < 1) {
    throw std::invalid_argument("Success threshold must be >= 1");
  }
  if (config.recovery_timeout < std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("Recovery timeout must be >= zero");
  }
}

bool CircuitBreaker::Allow() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return EffectiveStateLocked() != State::Open;
}

void CircuitBreaker::RecordSuccess() {
  std::lock_guard<std::mutex> lock(mutex_);
  MaterializeLocked();

  switch (state_) {
    case State::Closed:
      consecutive_failures_ = 0;
      break;
    case State::HalfOpen:
      consecutive_successes_++;
      if (consecutive_successes_ >= config_.success_threshold) {
        SPDLOG_INFO("CircuitBreaker[{}]: closing after {} successful probes",
                    name_, consecutive_successes_);
        state_ = State::Closed;
        consecutive_failures_ = 0;
        consecutive_successes_ = 0;
      }
      break;
    case State::Open:
      // Late report from a call admitted before the circuit opened
      SPDLOG_DEBUG("CircuitBreaker[{}]: ignoring success reported while open", name_);
      break;
  }
}

void CircuitBreaker::RecordFailure() {
  std::lock_guard<std::mutex> lock(mutex_);
  MaterializeLocked();

  switch (state_) {
    case State::Closed:
      consecutive_failures_++;
      if (consecutive_failures_ >= config_.failure_threshold) {
        SPDLOG_ERROR("CircuitBreaker[{}]: opening after {} consecutive failures",
                     name_, consecutive_failures_);
        OpenLocked();
      }
      break;
    case State::HalfOpen:
      SPDLOG_WARN("CircuitBreaker[{}]: reopening due to failure during recovery", name_);
      OpenLocked();
      break;
    case State::Open:
      SPDLOG_DEBUG("CircuitBreaker[{}]: ignoring failure reported while open", name_);
      break;
  }
}

CircuitBreaker::State CircuitBreaker::GetState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return EffectiveStateLocked();
}

int CircuitBreaker::GetConsecutiveFailures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return consecutive_failures_;
}

int CircuitBreaker::GetConsecutiveSuccesses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return EffectiveStateLocked() == State::HalfOpen && state_ == State::HalfOpen
             ? consecutive_successes_ : 0;
}

uint64_t CircuitBreaker::GetTripCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return trip_count_;
}

CircuitBreaker::State CircuitBreaker::EffectiveStateLocked() const {
  if (state_ == State::Open && clock_->Now() - opened_at_ >= config_.recovery_timeout) {
    return State::HalfOpen;
  }
  return state_;
}

void CircuitBreaker::MaterializeLocked() {
  if (state_ == State::Open && EffectiveStateLocked() == State::HalfOpen) {
    SPDLOG_INFO("CircuitBreaker[{}]: entering half-open state", name_);
    state_ = State::HalfOpen;
    consecutive_successes_ = 0;
  }
}

void CircuitBreaker::OpenLocked() {
  state_ = State::Open;
  opened_at_ = clock_->Now();
  consecutive_failures_ = 0;
  consecutive_successes_ = 0;
  trip_count_++;
}

}  // namespace voxguard
