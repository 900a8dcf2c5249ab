#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include "clock.hpp"

namespace voxguard {

/**
 * @brief Circuit breaker thresholds
 *
 * Validated by the CircuitBreaker constructor.
 */
struct CircuitBreakerConfig {
  int failure_threshold = 5;                           ///< Consecutive failures that open the circuit
  int success_threshold = 2;                           ///< Consecutive half-open successes that close it
  std::chrono::milliseconds recovery_timeout{60000};   ///< Open time before probing
};

/**
 * @brief Three-state availability guard for one remote endpoint
 *
 * Closed: calls pass; failure_threshold consecutive failures open the circuit.
 * Open: calls are rejected until recovery_timeout has elapsed.
 * HalfOpen: calls pass as probes; success_threshold consecutive successes
 * close the circuit, any failure reopens it.
 *
 * The Open -> HalfOpen transition is evaluated lazily from the stored
 * timestamps, so no background timer is needed. Allow() and GetState() never
 * mutate state; the pending transition is materialized by the next
 * RecordSuccess()/RecordFailure().
 *
 * Thread-safe. Each attempt must be reported exactly once.
 */
class CircuitBreaker {
 public:
  enum class State : char {
    Closed,
    Open,
    HalfOpen
  };

  CircuitBreaker(const std::string& name, const CircuitBreakerConfig& config,
                 std::shared_ptr<Clock> clock = std::make_shared<SteadyClock>());
  ~CircuitBreaker() = default;

  // Non-copyable, non-movable (mutex member)
  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;

  /** @brief True if a call may be attempted now (pure check) */
  bool Allow() const;

  /** @brief Report a successful call */
  void RecordSuccess();

  /** @brief Report a failed call */
  void RecordFailure();

  /** @brief Effective state, with an expired Open reported as HalfOpen */
  State GetState() const;

  int GetConsecutiveFailures() const;
  int GetConsecutiveSuccesses() const;

  /** @brief Number of transitions into Open since construction */
  uint64_t GetTripCount() const;

  const std::string& GetName() const { return name_; }
  const CircuitBreakerConfig& GetConfig() const { return config_; }

 private:
  // Require mutex_ held
  State EffectiveStateLocked() const;
  void MaterializeLocked();
  void OpenLocked();

  std::string name_;
  CircuitBreakerConfig config_;
  std::shared_ptr<Clock> clock_;

  State state_{State::Closed};
  int consecutive_failures_{0};
  int consecutive_successes_{0};
  Clock::TimePoint opened_at_{};
  uint64_t trip_count_{0};
  mutable std::mutex mutex_;
};

const char* ToString(CircuitBreaker::State state);

}  // namespace voxguard
