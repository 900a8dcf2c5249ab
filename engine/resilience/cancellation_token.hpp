#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace voxguard {

// Externally triggered stop flag shared by a batch run.
// Waiters blocked in WaitFor() are woken as soon as Cancel() is called.
class CancellationToken {
 public:
  CancellationToken() = default;
  ~CancellationToken() = default;

  // Non-copyable, non-movable (shared by reference between workers)
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void Cancel();

  bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }

  // Block for up to `duration`. Returns true if the token was cancelled
  // before or during the wait.
  bool WaitFor(std::chrono::nanoseconds duration) const;

 private:
  std::atomic<bool> cancelled_{false};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
};

}  // namespace voxguard
