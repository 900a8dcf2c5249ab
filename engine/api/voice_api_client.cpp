#include "voice_api_client.hpp"
#include "audio_validator.hpp"
#include "engine/common/config_manager.hpp"
#include "engine/common/util.hpp"
#include "engine/transport/multipart_form.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace voxguard {

VoiceApiConfig VoiceApiConfig::FromConfig(const engine::common::ConfigManager& config) {
  VoiceApiConfig result;
  result.base_url = config.GetString("api.url", result.base_url);
  result.api_key = config.GetString("api.key", result.api_key);
  result.client_id = config.GetString("api.client_id", result.client_id);
  result.deepfake_path = config.GetString("api.deepfake_path", result.deepfake_path);
  result.mfa_path = config.GetString("api.mfa_path", result.mfa_path);
  result.sar_path = config.GetString("api.sar_path", result.sar_path);
  result.resilience = ResilienceConfig::FromConfig(config);
  return result;
}

std::optional<double> ApiResult::GetScore() const {
  if (body.is_object() && body.contains("score") && body["score"].is_number()) {
    return body["score"].get<double>();
  }
  return std::nullopt;
}

std::string ApiResult::GetLabel() const {
  if (body.is_object() && body.contains("label") && body["label"].is_string()) {
    return body["label"].get<std::string>();
  }
  return "";
}

VoiceApiClient::VoiceApiClient(const VoiceApiConfig& config,
                               std::shared_ptr<Transport> transport,
                               std::shared_ptr<Clock> clock,
                               std::shared_ptr<ResilienceMetrics> metrics)
    : config_(config), clock_(std::move(clock)), metrics_(std::move(metrics)) {
  if (config_.api_key.empty()) {
    throw std::invalid_argument("API key is required (set api.key or VOXGUARD_API_KEY)");
  }
  if (!transport) {
    throw std::invalid_argument("VoiceApiClient requires a transport");
  }
  if (!engine::common::ParseUrl(config_.base_url).IsValid()) {
    throw std::invalid_argument("Invalid API base URL: " + config_.base_url);
  }
  config_.resilience.Validate();

  const ResilienceConfig& resilience = config_.resilience;
  limiter_ = std::make_shared<RateLimiter>(resilience.burst_capacity, resilience.rate_per_second, clock_);
  retry_ = std::make_shared<RetryOrchestrator>(resilience.GetRetryPolicy());

  for (const char* endpoint : {kDeepfakeEndpoint, kMfaEndpoint, kSarEndpoint}) {
    auto breaker = std::make_shared<CircuitBreaker>(endpoint, resilience.GetCircuitBreakerConfig(), clock_);
    breakers_[endpoint] = breaker;
    executors_[endpoint] = std::make_unique<RequestExecutor>(
        transport, limiter_, breaker, retry_, resilience.GetExecutorOptions(), clock_, metrics_);
  }

  SPDLOG_INFO("VoiceApiClient: base_url={} rate={}/s burst={} admission={}",
              config_.base_url, resilience.rate_per_second, resilience.burst_capacity,
              ToString(resilience.admission_mode));
}

ApiResult VoiceApiClient::DetectDeepfake(const std::string& audio_path,
                                         const nlohmann::json& metadata,
                                         const CancellationToken* token) {
  return UploadAudio(kDeepfakeEndpoint, config_.deepfake_path, audio_path,
                     {{"metadata", metadata.dump()}}, token);
}

ApiResult VoiceApiClient::VerifyMfa(const std::string& audio_path,
                                    const std::string& enrollment_id,
                                    const nlohmann::json& context,
                                    const CancellationToken* token) {
  if (enrollment_id.empty()) {
    return FailBeforeSend("enrollment_id is required");
  }
  return UploadAudio(kMfaEndpoint, config_.mfa_path, audio_path,
                     {{"enrollment_id", enrollment_id}, {"context", context.dump()}}, token);
}

ApiResult VoiceApiClient::SubmitSar(const std::string& session_id,
                                    const std::string& decision,
                                    const std::string& reason,
                                    const nlohmann::json& metadata,
                                    const CancellationToken* token) {
  if (decision != "allow" && decision != "deny" && decision != "review") {
    return FailBeforeSend("SAR decision must be allow, deny or review, got '" + decision + "'");
  }

  nlohmann::json payload = {
    {"session_id", session_id},
    {"decision", decision},
    {"reason", reason},
    {"metadata", metadata}
  };

  HttpRequest request = NewRequest(config_.sar_path);
  request.content_type = "application/json";
  request.body = payload.dump();
  return Execute(kSarEndpoint, request, token);
}

BreakerStates VoiceApiClient::GetBreakerStates() const {
  BreakerStates states;
  for (const auto& [name, breaker] : breakers_) {
    states.emplace_back(name, breaker->GetState());
  }
  return states;
}

const CircuitBreaker& VoiceApiClient::GetCircuitBreaker(const std::string& endpoint) const {
  auto it = breakers_.find(endpoint);
  if (it == breakers_.end()) {
    throw std::out_of_range("Unknown endpoint: " + endpoint);
  }
  return *it->second;
}

HttpRequest VoiceApiClient::NewRequest(const std::string& path) const {
  HttpRequest request;
  request.method = "POST";
  request.url = engine::common::JoinUrl(config_.base_url, path);
  request.headers["Authorization"] = "Bearer " + config_.api_key;
  request.headers["Accept"] = "application/json";
  if (!config_.client_id.empty()) {
    request.headers["X-Client-ID"] = config_.client_id;
  }
  return request;
}

ApiResult VoiceApiClient::UploadAudio(const std::string& endpoint, const std::string& path,
                                      const std::string& audio_path,
                                      const std::map<std::string, std::string>& fields,
                                      const CancellationToken* token) {
  AudioFileInfo info = ValidateAudioFile(audio_path);
  if (!info.valid) {
    SPDLOG_WARN("VoiceApiClient: rejecting {}: {}", audio_path, info.error);
    return FailBeforeSend(info.error);
  }

  MultipartForm form;
  try {
    form.AddFileFromPath("audio", audio_path, info.mime_type);
  } catch (const std::exception& e) {
    SPDLOG_WARN("VoiceApiClient: {}", e.what());
    return FailBeforeSend(e.what());
  }
  for (const auto& [name, value] : fields) {
    form.AddField(name, value);
  }

  HttpRequest request = NewRequest(path);
  request.content_type = form.GetContentType();
  request.body = form.Build();
  return Execute(endpoint, request, token);
}

ApiResult VoiceApiClient::Execute(const std::string& endpoint, const HttpRequest& request,
                                  const CancellationToken* token) {
  ApiResult result;
  result.outcome = GetExecutor(endpoint).Execute(request, token);

  const std::string& body = result.outcome.last_response.body;
  if (!body.empty()) {
    result.body = nlohmann::json::parse(body, nullptr, false);
    if (result.body.is_discarded()) {
      if (result.outcome.succeeded) {
        SPDLOG_WARN("VoiceApiClient: {} returned a non-JSON body", endpoint);
      }
      result.body = nullptr;
    }
  }
  return result;
}

RequestExecutor& VoiceApiClient::GetExecutor(const std::string& endpoint) const {
  auto it = executors_.find(endpoint);
  if (it == executors_.end()) {
    throw std::out_of_range("Unknown endpoint: " + endpoint);
  }
  return *it->second;
}

ApiResult VoiceApiClient::FailBeforeSend(const std::string& message) const {
  ApiResult result;
  result.outcome.terminal_reason = TerminalReason::FatalClientError;
  result.outcome.error_message = message;
  if (metrics_) {
    metrics_->RecordOutcome(result.outcome);
  }
  return result;
}

}  // namespace voxguard
