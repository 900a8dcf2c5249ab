#include "batch_coordinator.hpp"
#include "resilience_metrics.hpp"
#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <spdlog/spdlog.h>

namespace voxguard {

BatchCoordinator::BatchCoordinator(ItemHandler handler,
                                   std::shared_ptr<ResilienceMetrics> metrics,
                                   std::shared_ptr<Clock> clock)
    : handler_(std::move(handler)),
      metrics_(std::move(metrics)),
      clock_(std::move(clock)) {
  if (!handler_) {
    throw std::invalid_argument("BatchCoordinator requires an item handler");
  }
  if (!clock_) {
    throw std::invalid_argument("BatchCoordinator requires a clock");
  }
}

BatchSummary BatchCoordinator::RunBatch(const std::vector<BatchItem>& items, int concurrency) {
  CancellationToken token;
  return RunBatch(items, concurrency, token);
}

BatchSummary BatchCoordinator::RunBatch(const std::vector<BatchItem>& items, int concurrency,
                                        const CancellationToken& token) {
  if (concurrency < 1) {
    throw std::invalid_argument("Batch concurrency must be >= 1, got " + std::to_string(concurrency));
  }

  const auto start = clock_->Now();
  completed_ = 0;

  BatchSummary summary;
  summary.results.resize(items.size());
  std::mutex summary_mutex;
  std::atomic<std::size_t> cursor{0};

  auto worker = [&]() {
    while (true) {
      std::size_t index = cursor.fetch_add(1, std::memory_order_relaxed);
      if (index >= items.size()) {
        return;
      }

      ItemResult result = RunItem(items[index], token);
      std::size_t completed = 0;
      {
        std::lock_guard<std::mutex> lock(summary_mutex);
        summary.Add(result);
        summary.results[index] = result;
        completed = ++completed_;
      }
      if (progress_callback_) {
        progress_callback_(completed, items.size(), result);
      }
    }
  };

  const std::size_t worker_count = std::min<std::size_t>(static_cast<std::size_t>(concurrency),
                                                         items.size());
  SPDLOG_INFO("BatchCoordinator: running {} items with {} workers", items.size(), worker_count);

  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  try {
    for (std::size_t i = 0; i < worker_count; ++i) {
      workers.push_back(StartWorker(worker));
    }
  } catch (const std::system_error& e) {
    if (workers.empty()) {
      SPDLOG_ERROR("BatchCoordinator: cannot start any worker: {}", e.what());
      throw;
    }
    SPDLOG_WARN("BatchCoordinator: started {} of {} workers: {}", workers.size(), worker_count, e.what());
  }
  for (auto& thread : workers) {
    thread.join();
  }

  summary.duration_ms = std::chrono::duration<double, std::milli>(clock_->Now() - start).count();
  SPDLOG_INFO("BatchCoordinator: done in {:.1f}ms, {} succeeded, {} failed, {} breaker-open, "
              "{} rate-limited, {} cancelled",
              summary.duration_ms, summary.succeeded, summary.failed, summary.breaker_trips,
              summary.rate_limited, summary.cancelled);
  return summary;
}

std::thread BatchCoordinator::StartWorker(std::function<void()> body) {
  return std::thread(std::move(body));
}

ItemResult BatchCoordinator::RunItem(const BatchItem& item, const CancellationToken& token) {
  ItemResult result;
  result.item_id = item.id;

  if (token.IsCancelled()) {
    result.outcome.terminal_reason = TerminalReason::Cancelled;
    result.outcome.error_message = "batch cancelled before item started";
    if (metrics_) {
      metrics_->RecordOutcome(result.outcome);
    }
    return result;
  }

  try {
    result = handler_(item, token);
    result.item_id = item.id;
  } catch (const std::exception& e) {
    SPDLOG_ERROR("BatchCoordinator: handler failed for {}: {}", item.id, e.what());
    result = ItemResult{};
    result.item_id = item.id;
    result.outcome.terminal_reason = TerminalReason::FatalClientError;
    result.outcome.error_message = e.what();
    if (metrics_) {
      metrics_->RecordOutcome(result.outcome);
    }
    return result;
  }

  if (metrics_ && result.outcome.succeeded && result.score) {
    metrics_->RecordScore(*result.score);
  }
  return result;
}

}  // namespace voxguard
