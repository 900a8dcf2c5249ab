#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <thread>
#include <vector>
#include "batch_summary.hpp"
#include "cancellation_token.hpp"
#include "clock.hpp"

namespace voxguard {

class ResilienceMetrics;

/**
 * @brief Bounded worker pool that runs many logical requests and aggregates
 * their outcomes
 *
 * Workers pull items from a shared cursor over the input list until it is
 * exhausted. The handler is expected to run the request through a
 * RequestExecutor and must be safe to call from several threads at once.
 * Items are never retried here.
 */
class BatchCoordinator {
 public:
  static constexpr int kDefaultConcurrency = 5;

  // Runs one item. Must not throw for request failures. An exception is
  // recorded as a FatalClientError outcome for the item, so a handler may
  // only throw before it has run the request through a RequestExecutor
  // (which records its own outcome).
  using ItemHandler = std::function<ItemResult(const BatchItem&, const CancellationToken&)>;

  // Called from worker threads after each item completes
  using ProgressCallback = std::function<void(std::size_t completed, std::size_t total,
                                              const ItemResult& result)>;

  explicit BatchCoordinator(ItemHandler handler,
                            std::shared_ptr<ResilienceMetrics> metrics = nullptr,
                            std::shared_ptr<Clock> clock = std::make_shared<SteadyClock>());

  virtual ~BatchCoordinator() = default;

  BatchCoordinator(const BatchCoordinator&) = delete;
  BatchCoordinator& operator=(const BatchCoordinator&) = delete;

  /**
   * @brief Run all items with at most `concurrency` in flight
   *
   * Returns after every worker has joined. Items not started when the token
   * fires are reported as Cancelled. Results keep input order.
   *
   * If only some workers could be started the batch runs on those.
   *
   * @throws std::invalid_argument if concurrency < 1
   * @throws std::system_error if no worker thread could be started
   */
  BatchSummary RunBatch(const std::vector<BatchItem>& items, int concurrency,
                        const CancellationToken& token);

  BatchSummary RunBatch(const std::vector<BatchItem>& items,
                        int concurrency = kDefaultConcurrency);

  void SetProgressCallback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

  // Items finished in the current (or last) run
  std::size_t GetCompletedCount() const { return completed_.load(std::memory_order_relaxed); }

 protected:
  // Start one worker thread running `body`
  virtual std::thread StartWorker(std::function<void()> body);

 private:
  ItemResult RunItem(const BatchItem& item, const CancellationToken& token);

  ItemHandler handler_;
  std::shared_ptr<ResilienceMetrics> metrics_;
  std::shared_ptr<Clock> clock_;
  ProgressCallback progress_callback_;
  std::atomic<std::size_t> completed_{0};
};

}  // namespace voxguard
