#pragma once

#include <chrono>
#include <mutex>

namespace voxguard {

class CancellationToken;

/**
 * @brief Injectable time source used by the rate limiter, circuit breaker
 * and retry loop.
 *
 * Production code uses SteadyClock; tests use ManualClock so refill windows,
 * recovery timeouts and backoff sleeps are deterministic.
 */
class Clock {
 public:
  using Duration = std::chrono::nanoseconds;
  using TimePoint = std::chrono::steady_clock::time_point;

  virtual ~Clock() = default;

  /** @brief Current time */
  virtual TimePoint Now() const = 0;

  /**
   * @brief Suspend the calling thread for `duration`
   *
   * @param duration Time to sleep
   * @param token Optional cancellation token; the sleep ends early when it fires
   * @return false if the sleep was cut short by cancellation
   */
  virtual bool SleepFor(Duration duration, const CancellationToken* token = nullptr) = 0;
};

// Wall-clock implementation backed by std::chrono::steady_clock
class SteadyClock : public Clock {
 public:
  TimePoint Now() const override;
  bool SleepFor(Duration duration, const CancellationToken* token = nullptr) override;
};

// Test clock. Time only moves when Advance() is called or, with auto-advance
// enabled (the default), when a caller sleeps.
class ManualClock : public Clock {
 public:
  ManualClock() = default;
  explicit ManualClock(TimePoint start) : now_(start) {}

  TimePoint Now() const override;
  bool SleepFor(Duration duration, const CancellationToken* token = nullptr) override;

  void Advance(Duration duration);

  // When false, SleepFor() returns immediately without moving time
  void SetAutoAdvance(bool enabled);

  Duration GetTotalSlept() const;
  int GetSleepCount() const;

 private:
  mutable std::mutex mutex_;
  TimePoint now_{};
  bool auto_advance_{true};
  Duration total_slept_{0};
  int sleep_count_{0};
};

}  // namespace voxguard
