#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <set>
#include <thread>
#include <vector>

namespace voxguard {
namespace engine {
namespace common {

/**
 * @brief Single-threaded event loop for asynchronous task processing
 *
 * Supports immediate, delayed, and periodic task execution.
 * Thread-safe task posting from any thread. Tasks that throw are logged
 * and do not stop the loop.
 */
class EventThread {
 public:
  EventThread();
  virtual ~EventThread();

  EventThread(const EventThread&) = delete;
  EventThread& operator=(const EventThread&) = delete;

  /** @brief Start event loop thread */
  void Start();

  /** @brief Stop event loop; queued immediate tasks still run */
  void Stop();

  bool IsRunning() const { return running_.load(); }

  /** @brief Post task for immediate execution */
  void Post(std::function<void()> task);

  /** @brief Post task with delay */
  void PostDelayed(std::function<void()> task, std::chrono::milliseconds delay);

  /** @brief Schedule periodic task, returns task ID (-1 if not running) */
  int SchedulePeriodic(std::function<void()> task, std::chrono::milliseconds interval);

  /** @brief Cancel periodic task by ID */
  void CancelPeriodic(int task_id);

  /** @brief Pending tasks of all kinds */
  size_t GetQueueDepth() const;

 protected:
  // One-shot (interval == 0) or periodic timer
  struct TimerTask {
    int id;
    std::function<void()> task;
    std::chrono::steady_clock::time_point execute_at;
    std::chrono::milliseconds interval{0};

    bool operator<(const TimerTask& other) const {
      return execute_at > other.execute_at;  // Min-heap
    }
  };

  virtual void Run();

  void ProcessTasks();

  // Runs `task`, logging any exception with `kind`
  static void RunGuarded(const std::function<void()>& task, const char* kind);

  std::atomic<bool> running_{false};
  std::thread thread_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  int next_task_id_{1};
  std::queue<std::function<void()>> task_queue_;
  std::priority_queue<TimerTask> timers_;
  std::set<int> cancelled_timers_;
};

}  // namespace common
}  // namespace engine
}  // namespace voxguard
