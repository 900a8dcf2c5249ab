#include "event_thread.hpp"
#include <spdlog/spdlog.h>

namespace voxguard {
namespace engine {
namespace common {

EventThread::EventThread() {
}

EventThread::~EventThread() {
  Stop();
}

void EventThread::Start() {
  if (running_.exchange(true)) {
    return;  // Already running
  }
  thread_ = std::thread(&EventThread::Run, this);
}

void EventThread::Stop() {
  if (!running_.exchange(false)) {
    return;  // Already stopped
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  SPDLOG_DEBUG("EventThread stopped");
}

void EventThread::Post(std::function<void()> task) {
  if (!running_.load()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    task_queue_.push(std::move(task));
  }
  cv_.notify_one();
}

void EventThread::PostDelayed(std::function<void()> task, std::chrono::milliseconds delay) {
  if (!running_.load()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.push(TimerTask{next_task_id_++, std::move(task),
                           std::chrono::steady_clock::now() + delay,
                           std::chrono::milliseconds::zero()});
  }
  cv_.notify_one();
}

int EventThread::SchedulePeriodic(std::function<void()> task, std::chrono::milliseconds interval) {
  if (!running_.load() || interval <= std::chrono::milliseconds::zero()) {
    return -1;
  }
  int id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_task_id_++;
    timers_.push(TimerTask{id, std::move(task), std::chrono::steady_clock::now() + interval, interval});
  }
  cv_.notify_one();
  return id;
}

void EventThread::CancelPeriodic(int task_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_timers_.insert(task_id);
}

size_t EventThread::GetQueueDepth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return task_queue_.size() + timers_.size();
}

void EventThread::Run() {
  while (running_.load()) {
    ProcessTasks();

    std::unique_lock<std::mutex> lock(mutex_);
    if (!task_queue_.empty()) {
      continue;
    }
    if (timers_.empty()) {
      cv_.wait(lock, [this] {
        return !running_.load() || !task_queue_.empty() || !timers_.empty();
      });
    } else {
      auto next_wake = timers_.top().execute_at;
      cv_.wait_until(lock, next_wake, [this, next_wake] {
        return !running_.load() || !task_queue_.empty() ||
               (!timers_.empty() && timers_.top().execute_at < next_wake);
      });
    }
  }

  // Drain immediate tasks posted before Stop()
  ProcessTasks();
}

void EventThread::ProcessTasks() {
  while (true) {
    std::function<void()> task;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (task_queue_.empty()) {
        break;
      }
      task = std::move(task_queue_.front());
      task_queue_.pop();
    }
    RunGuarded(task, "task");
  }

  auto now = std::chrono::steady_clock::now();
  while (true) {
    std::function<void()> task;
    bool periodic = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (timers_.empty() || timers_.top().execute_at > now) {
        break;
      }
      TimerTask timer = timers_.top();
      timers_.pop();

      if (cancelled_timers_.erase(timer.id) > 0) {
        continue;
      }
      task = timer.task;
      periodic = timer.interval > std::chrono::milliseconds::zero();
      if (periodic) {
        timer.execute_at = now + timer.interval;
        timers_.push(std::move(timer));
      }
    }
    RunGuarded(task, periodic ? "periodic task" : "delayed task");
  }
}

void EventThread::RunGuarded(const std::function<void()>& task, const char* kind) {
  try {
    task();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("EventThread {} exception: {}", kind, e.what());
  }
}

}  // namespace common
}  // namespace engine
}  // namespace voxguard
