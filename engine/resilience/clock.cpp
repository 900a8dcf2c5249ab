#include "clock.hpp"
#include "cancellation_token.hpp"
#include <thread>

namespace voxguard {

//==============================================================================
// SteadyClock
//==============================================================================

Clock::TimePoint SteadyClock::Now() const {
  return std::chrono::steady_clock::now();
}

bool SteadyClock::SleepFor(Duration duration, const CancellationToken* token) {
  if (token == nullptr) {
    if (duration > Duration::zero()) {
      std::this_thread::sleep_for(duration);
    }
    return true;
  }
  return !token->WaitFor(duration);
}

//==============================================================================
// ManualClock
//==============================================================================

Clock::TimePoint ManualClock::Now() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return now_;
}

bool ManualClock::SleepFor(Duration duration, const CancellationToken* token) {
  if (token != nullptr && token->IsCancelled()) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  sleep_count_++;
  total_slept_ += duration;
  if (auto_advance_ && duration > Duration::zero()) {
    now_ += duration;
  }
  return true;
}

void ManualClock::Advance(Duration duration) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ += duration;
}

void ManualClock::SetAutoAdvance(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto_advance_ = enabled;
}

Clock::Duration ManualClock::GetTotalSlept() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_slept_;
}

int ManualClock::GetSleepCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sleep_count_;
}

}  // namespace voxguard
