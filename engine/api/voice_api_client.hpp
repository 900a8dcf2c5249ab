#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "engine/resilience/circuit_breaker.hpp"
#include "engine/resilience/clock.hpp"
#include "engine/resilience/rate_limiter.hpp"
#include "engine/resilience/request_executor.hpp"
#include "engine/resilience/resilience_config.hpp"
#include "engine/resilience/resilience_metrics.hpp"
#include "engine/resilience/retry_orchestrator.hpp"
#include "engine/transport/transport.hpp"

namespace voxguard {

namespace engine {
namespace common {
class ConfigManager;
}  // namespace common
}  // namespace engine

class CancellationToken;

struct VoiceApiConfig {
  std::string base_url = "https://api.sonotheia.com";
  std::string api_key;
  std::string client_id;  ///< Sent as X-Client-ID when set
  std::string deepfake_path = "/v1/voice/deepfake";
  std::string mfa_path = "/v1/mfa/voice/verify";
  std::string sar_path = "/v1/reports/sar";
  ResilienceConfig resilience;

  // Read the `api` and `resilience` blocks. Throws std::invalid_argument on
  // invalid resilience settings.
  static VoiceApiConfig FromConfig(const engine::common::ConfigManager& config);
};

// Result of one API call: the resilience outcome plus the parsed body
struct ApiResult {
  RequestOutcome outcome;
  nlohmann::json body;  ///< Parsed JSON body (null if absent or not JSON)

  bool Ok() const { return outcome.succeeded; }

  // Deepfake "score" field, if present and numeric
  std::optional<double> GetScore() const;
  std::string GetLabel() const;
};

/**
 * @brief Client for the voice fraud API (deepfake, voice MFA, SAR)
 *
 * All endpoints share one rate limiter; each endpoint has its own circuit
 * breaker so a failing endpoint does not block the others. Calls never
 * throw for request failures; check ApiResult::outcome.
 */
class VoiceApiClient {
 public:
  static constexpr const char* kDeepfakeEndpoint = "deepfake";
  static constexpr const char* kMfaEndpoint = "mfa";
  static constexpr const char* kSarEndpoint = "sar";

  /**
   * @throws std::invalid_argument if the API key is missing, the transport is
   *         null or the resilience settings are invalid
   */
  VoiceApiClient(const VoiceApiConfig& config,
                 std::shared_ptr<Transport> transport,
                 std::shared_ptr<Clock> clock = std::make_shared<SteadyClock>(),
                 std::shared_ptr<ResilienceMetrics> metrics = nullptr);

  VoiceApiClient(const VoiceApiClient&) = delete;
  VoiceApiClient& operator=(const VoiceApiClient&) = delete;

  // Score an audio file. Invalid files fail as FatalClientError without
  // any network activity.
  ApiResult DetectDeepfake(const std::string& audio_path,
                           const nlohmann::json& metadata = nlohmann::json::object(),
                           const CancellationToken* token = nullptr);

  ApiResult VerifyMfa(const std::string& audio_path,
                      const std::string& enrollment_id,
                      const nlohmann::json& context = nlohmann::json::object(),
                      const CancellationToken* token = nullptr);

  // Submit a suspicious activity report. A decision other than allow, deny
  // or review fails as FatalClientError without any network activity.
  ApiResult SubmitSar(const std::string& session_id,
                      const std::string& decision,
                      const std::string& reason,
                      const nlohmann::json& metadata = nlohmann::json::object(),
                      const CancellationToken* token = nullptr);

  // Breaker state per endpoint name
  BreakerStates GetBreakerStates() const;

  const CircuitBreaker& GetCircuitBreaker(const std::string& endpoint) const;
  const RateLimiter& GetRateLimiter() const { return *limiter_; }
  const VoiceApiConfig& GetConfig() const { return config_; }

 private:
  HttpRequest NewRequest(const std::string& path) const;
  ApiResult UploadAudio(const std::string& endpoint, const std::string& path,
                        const std::string& audio_path,
                        const std::map<std::string, std::string>& fields,
                        const CancellationToken* token);
  ApiResult Execute(const std::string& endpoint, const HttpRequest& request,
                    const CancellationToken* token);
  RequestExecutor& GetExecutor(const std::string& endpoint) const;

  ApiResult FailBeforeSend(const std::string& message) const;

  VoiceApiConfig config_;
  std::shared_ptr<Clock> clock_;
  std::shared_ptr<ResilienceMetrics> metrics_;
  std::shared_ptr<RateLimiter> limiter_;
  std::shared_ptr<RetryOrchestrator> retry_;
  std::map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
  std::map<std::string, std::unique_ptr<RequestExecutor>> executors_;
};

}  // namespace voxguard
