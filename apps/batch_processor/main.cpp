#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>
#include "application_kernel.hpp"
#include "batch_coordinator.hpp"
#include "http_transport.hpp"
#include "resilience_metrics.hpp"
#include "voice_api_client.hpp"

using namespace voxguard::engine::common;
namespace fs = std::filesystem;

// Scores a set of audio files against the deepfake endpoint with the full
// resilience stack, serving /metrics and /health while it runs.
class BatchProcessorApp : public ApplicationKernel {
 public:
  BatchProcessorApp() : ApplicationKernel("batch_processor") {}

 protected:
  void OnInitialize() override {
    metrics_ = std::make_shared<voxguard::ResilienceMetrics>();

    voxguard::HttpTransportOptions transport_options;
    transport_options.verify_peer = GetConfig().GetBool("api.tls_verify", true);
    transport_options.ca_file = GetConfig().GetString("api.ca_file", "");
    auto transport = std::make_shared<voxguard::HttpTransport>(transport_options);

    voxguard::VoiceApiConfig api_config = voxguard::VoiceApiConfig::FromConfig(GetConfig());
    concurrency_ = api_config.resilience.concurrency;
    client_ = std::make_shared<voxguard::VoiceApiClient>(
        api_config, transport, std::make_shared<voxguard::SteadyClock>(), metrics_);

    GetRestServer().SetMetricsCallback([this]() {
      return voxguard::FormatPrometheus(metrics_->Snapshot(), client_->GetBreakerStates());
    }, "text/plain; version=0.0.4");
    GetRestServer().SetHealthCallback([this]() {
      return voxguard::BuildHealthJson(metrics_->Snapshot(), client_->GetBreakerStates());
    });
  }

  void OnStart() override {
    std::vector<std::string> inputs = GetPositionalArgs();
    if (inputs.empty()) {
      inputs = GetConfig().GetStringArray("batch.inputs");
    }
    items_ = CollectItems(inputs, GetConfig().GetBool("batch.recursive", false));
    if (items_.empty()) {
      SPDLOG_ERROR("BatchProcessor: no .wav or .opus files found in inputs");
      SetExitCode(1);
      RequestStop();
      return;
    }

    SPDLOG_INFO("BatchProcessor: {} files, concurrency {}", items_.size(), concurrency_);

    coordinator_ = std::make_unique<voxguard::BatchCoordinator>(
        [this](const voxguard::BatchItem& item, const voxguard::CancellationToken& token) {
          return ProcessItem(item, token);
        },
        metrics_);

    int progress_interval = GetConfig().GetInt("batch.progress_interval_ms", 2000);
    progress_task_ = SchedulePeriodic([this]() { LogProgress(); },
                                      std::chrono::milliseconds(progress_interval));

    worker_ = std::thread([this]() { RunBatch(); });
  }

  void OnStop() override {
    token_.Cancel();
    if (worker_.joinable()) {
      worker_.join();
    }
  }

 private:
  static std::vector<voxguard::BatchItem> CollectItems(const std::vector<std::string>& inputs, bool recursive) {
    std::vector<std::string> paths;
    auto accept = [&paths](const fs::path& path) {
      std::string ext = path.extension().string();
      std::transform(ext.begin(), ext.end(), ext.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      if (ext == ".wav" || ext == ".opus") {
        paths.push_back(path.string());
      }
    };

    for (const auto& input : inputs) {
      std::error_code ec;
      if (fs::is_directory(input, ec)) {
        if (recursive) {
          for (const auto& entry : fs::recursive_directory_iterator(input, ec)) {
            if (entry.is_regular_file()) {
              accept(entry.path());
            }
          }
        } else {
          for (const auto& entry : fs::directory_iterator(input, ec)) {
            if (entry.is_regular_file()) {
              accept(entry.path());
            }
          }
        }
      } else if (fs::exists(input, ec)) {
        accept(fs::path(input));
      } else {
        SPDLOG_WARN("BatchProcessor: input not found: {}", input);
      }
    }

    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());

    std::vector<voxguard::BatchItem> items;
    items.reserve(paths.size());
    for (const auto& path : paths) {
      items.push_back({fs::path(path).filename().string(), path});
    }
    return items;
  }

  voxguard::ItemResult ProcessItem(const voxguard::BatchItem& item, const voxguard::CancellationToken& token) {
    nlohmann::json metadata = {{"session_id", item.id}, {"channel", "batch"}};
    voxguard::ApiResult api_result = client_->DetectDeepfake(item.source, metadata, &token);

    voxguard::ItemResult result;
    result.item_id = item.id;
    result.outcome = api_result.outcome;
    if (api_result.Ok()) {
      result.score = api_result.GetScore();
      result.label = api_result.GetLabel();
    }
    return result;
  }

  void RunBatch() {
    voxguard::BatchSummary summary = coordinator_->RunBatch(items_, concurrency_, token_);
    CancelPeriodic(progress_task_);

    PrintSummary(summary);
    WriteResults(summary);

    if (summary.succeeded < summary.total) {
      SetExitCode(1);
    }

    int linger_seconds = GetConfig().GetInt("batch.linger_seconds", 0);
    if (linger_seconds > 0 && !token_.IsCancelled()) {
      SPDLOG_INFO("BatchProcessor: serving /metrics and /health for {}s", linger_seconds);
      token_.WaitFor(std::chrono::seconds(linger_seconds));
    }
    RequestStop();
  }

  void LogProgress() {
    if (!coordinator_) {
      return;
    }
    voxguard::MetricsSnapshot snapshot = metrics_->Snapshot();
    SPDLOG_INFO("BatchProcessor: progress {}/{} (ok={} failed={} retries={} breaker_open={})",
                coordinator_->GetCompletedCount(), items_.size(), snapshot.files_succeeded,
                snapshot.files_failed, snapshot.retry_count, snapshot.breaker_trips);
  }

  void PrintSummary(const voxguard::BatchSummary& summary) const {
    SPDLOG_INFO("BatchProcessor: batch complete {}", summary.ToJson().dump());

    std::printf("\n=== BATCH PROCESSING RESULTS ===\n\n");
    std::printf("Total files:           %llu\n", static_cast<unsigned long long>(summary.total));
    std::printf("Successful:            %llu\n", static_cast<unsigned long long>(summary.succeeded));
    std::printf("Failed:                %llu\n", static_cast<unsigned long long>(summary.failed));
    std::printf("Rate limited:          %llu\n", static_cast<unsigned long long>(summary.rate_limited));
    std::printf("Cancelled:             %llu\n", static_cast<unsigned long long>(summary.cancelled));
    std::printf("Average score:         %.3f\n", summary.GetAverageScore());
    std::printf("Average latency:       %.1fms\n", summary.GetAverageLatencyMs());
    std::printf("Total retries:         %llu\n", static_cast<unsigned long long>(summary.retry_count));
    std::printf("Circuit breaker trips: %llu\n", static_cast<unsigned long long>(summary.breaker_trips));
    std::printf("\nRisk distribution:\n");
    std::printf("  High (>0.7):         %llu\n", static_cast<unsigned long long>(summary.high_risk));
    std::printf("  Medium (0.4-0.7):    %llu\n", static_cast<unsigned long long>(summary.medium_risk));
    std::printf("  Low (<0.4):          %llu\n", static_cast<unsigned long long>(summary.low_risk));
    std::printf("\nTotal duration:        %.2fs\n", summary.duration_ms / 1000.0);

    for (const auto& result : summary.results) {
      if (!result.outcome.succeeded) {
        std::printf("  FAILED %s: %s (%s)\n", result.item_id.c_str(),
                    voxguard::ToString(result.outcome.terminal_reason),
                    result.outcome.error_message.c_str());
      }
    }
    std::fflush(stdout);
  }

  void WriteResults(const voxguard::BatchSummary& summary) const {
    std::string output_file = GetConfig().GetString("batch.output_file", "");
    if (output_file.empty()) {
      return;
    }

    nlohmann::json doc = summary.ToJson();
    nlohmann::json results = nlohmann::json::array();
    for (const auto& result : summary.results) {
      nlohmann::json entry = {
        {"file", result.item_id},
        {"success", result.outcome.succeeded},
        {"terminal_reason", voxguard::ToString(result.outcome.terminal_reason)},
        {"attempts", result.outcome.attempts_used},
        {"retries", result.outcome.retries},
        {"latency_ms", result.outcome.GetLatencyMs()}
      };
      if (result.score) {
        entry["score"] = *result.score;
        entry["label"] = result.label;
        entry["risk"] = voxguard::ToString(voxguard::ClassifyRisk(*result.score));
      }
      if (!result.outcome.succeeded) {
        entry["error"] = result.outcome.error_message;
      }
      results.push_back(entry);
    }
    doc["results"] = results;

    std::ofstream out(output_file);
    if (!out.is_open()) {
      SPDLOG_ERROR("BatchProcessor: cannot write results to {}", output_file);
      return;
    }
    out << doc.dump(2) << "\n";
    SPDLOG_INFO("BatchProcessor: results written to {}", output_file);
  }

  std::shared_ptr<voxguard::ResilienceMetrics> metrics_;
  std::shared_ptr<voxguard::VoiceApiClient> client_;
  std::unique_ptr<voxguard::BatchCoordinator> coordinator_;
  std::vector<voxguard::BatchItem> items_;
  voxguard::CancellationToken token_;
  std::thread worker_;
  int concurrency_ = voxguard::BatchCoordinator::kDefaultConcurrency;
  int progress_task_ = -1;
};

int main(int argc, char** argv) {
  BatchProcessorApp app;
  return app.Run(argc, argv);
}
