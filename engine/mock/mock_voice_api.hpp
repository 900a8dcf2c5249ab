#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <nlohmann/json.hpp>
#include "engine/common/rest_server.hpp"
#include "engine/resilience/clock.hpp"

namespace voxguard {

namespace engine {
namespace common {
class ConfigManager;
}  // namespace common
}  // namespace engine

struct MockVoiceApiConfig {
  std::string api_key = "mock_api_key_12345";

  // Simulated processing time
  std::chrono::milliseconds deepfake_latency{500};
  std::chrono::milliseconds mfa_latency{400};
  std::chrono::milliseconds sar_latency{200};

  // Requests per client (X-Client-ID) per minute
  int rate_limit_per_minute = 100;

  // Random 500/503/400 responses at error_rate
  bool simulate_errors = true;
  double error_rate = 0.05;

  // Fail the first N requests for each uploaded file name with 500
  int fail_first_n = 0;

  uint64_t seed = 0;  ///< 0 seeds from std::random_device

  // Read the `mock` block of the config
  static MockVoiceApiConfig FromConfig(const engine::common::ConfigManager& config);
};

/**
 * @brief In-process imitation of the voice fraud API
 *
 * Handlers run on RestServer connection threads; all state lives behind one
 * mutex. Scores are derived from the uploaded file name so integration runs
 * are predictable: "fake"/"synthetic" score high, "real"/"authentic" low.
 *
 * Per-client request counters are keyed by minute and evicted lazily when a
 * later minute is seen.
 */
class MockVoiceApi {
 public:
  explicit MockVoiceApi(const MockVoiceApiConfig& config,
                        std::shared_ptr<Clock> clock = std::make_shared<SteadyClock>());

  MockVoiceApi(const MockVoiceApi&) = delete;
  MockVoiceApi& operator=(const MockVoiceApi&) = delete;

  // Register the API and /mock/* endpoints
  void RegisterEndpoints(engine::common::RestServer& server);

  void Reset();

  nlohmann::json GetStats() const;
  MockVoiceApiConfig GetConfig() const;

  // Handlers (public for direct use in tests)
  void HandleDeepfake(const engine::common::http::request<engine::common::http::string_body>& req,
                      engine::common::http::response<engine::common::http::string_body>& resp);
  void HandleMfaVerify(const engine::common::http::request<engine::common::http::string_body>& req,
                       engine::common::http::response<engine::common::http::string_body>& resp);
  void HandleSar(const engine::common::http::request<engine::common::http::string_body>& req,
                 engine::common::http::response<engine::common::http::string_body>& resp);
  void HandleEnrollment(const engine::common::http::request<engine::common::http::string_body>& req,
                        engine::common::http::response<engine::common::http::string_body>& resp);
  void HandleGetConfig(const engine::common::http::request<engine::common::http::string_body>& req,
                       engine::common::http::response<engine::common::http::string_body>& resp);
  void HandleUpdateConfig(const engine::common::http::request<engine::common::http::string_body>& req,
                          engine::common::http::response<engine::common::http::string_body>& resp);

 private:
  using Request = engine::common::http::request<engine::common::http::string_body>;
  using Response = engine::common::http::response<engine::common::http::string_body>;

  struct RateDecision {
    bool allowed = true;
    int limit = 0;
    int remaining = 0;
    int64_t reset_seconds = 0;
  };

  // Auth and rate limit. Returns false after writing the error response.
  bool Admit(const Request& req, Response& resp, RateDecision& rate);
  bool CheckApiKey(const Request& req, Response& resp) const;
  RateDecision CheckRateLimit(const std::string& client_id);
  static void ApplyRateHeaders(const RateDecision& rate, Response& resp);

  // Writes an injected failure for `filename` and returns true, if any
  bool InjectFault(const std::string& filename, Response& resp);

  double Uniform(double low, double high);
  std::string NewId(const std::string& prefix);
  void SimulateLatency(std::chrono::milliseconds latency);

  std::shared_ptr<Clock> clock_;

  mutable std::mutex mutex_;
  MockVoiceApiConfig config_;
  std::mt19937_64 rng_;
  std::map<std::string, int> request_counts_;   ///< "client:minute" -> count
  int64_t current_minute_ = -1;
  std::map<std::string, nlohmann::json> sessions_;
  std::map<std::string, nlohmann::json> enrollments_;
  std::map<std::string, nlohmann::json> sar_cases_;
  std::map<std::string, int> failures_by_file_;
  uint64_t total_requests_ = 0;
};

}  // namespace voxguard
