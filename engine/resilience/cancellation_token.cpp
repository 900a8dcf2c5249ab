#include "cancellation_token.hpp"

namespace voxguard {

void CancellationToken::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_.store(true, std::memory_order_release);
  }
  cv_.notify_all();
}

bool CancellationToken::WaitFor(std::chrono::nanoseconds duration) const {
  if (duration <= std::chrono::nanoseconds::zero()) {
    return IsCancelled();
  }
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, duration, [this] { return IsCancelled(); });
}

}  // namespace voxguard
