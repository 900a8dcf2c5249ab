#include "mock_voice_api.hpp"
#include "engine/common/config_manager.hpp"
#include "engine/transport/multipart_form.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace voxguard {

using engine::common::WriteJson;
namespace http = engine::common::http;

namespace {

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool Contains(const std::string& haystack, const char* needle) {
  return haystack.find(needle) != std::string::npos;
}

double Round3(double value) {
  return std::round(value * 1000.0) / 1000.0;
}

std::string UtcTimestamp() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

nlohmann::json ErrorBody(const std::string& error, const std::string& message) {
  return {{"error", error}, {"message", message}};
}

std::string GetHeader(const http::request<http::string_body>& req, const std::string& name) {
  auto it = req.find(name);
  return it == req.end() ? "" : std::string(it->value());
}

// Decoded form of an upload request, or nullopt after writing a 400
std::optional<std::vector<FormPart>> ParseUpload(const http::request<http::string_body>& req,
                                                 http::response<http::string_body>& resp) {
  auto parts = MultipartForm::Parse(GetHeader(req, "Content-Type"), req.body());
  if (!parts) {
    WriteJson(resp, http::status::bad_request, ErrorBody("Bad request", "Expected multipart/form-data body"));
  }
  return parts;
}

const FormPart* FindPart(const std::vector<FormPart>& parts, const std::string& name) {
  for (const auto& part : parts) {
    if (part.name == name) {
      return &part;
    }
  }
  return nullptr;
}

nlohmann::json ParseJsonField(const FormPart* part) {
  if (part == nullptr) {
    return nlohmann::json::object();
  }
  nlohmann::json value = nlohmann::json::parse(part->data, nullptr, false);
  return value.is_object() ? value : nlohmann::json::object();
}

}  // namespace

MockVoiceApiConfig MockVoiceApiConfig::FromConfig(const engine::common::ConfigManager& config) {
  MockVoiceApiConfig result;
  result.api_key = config.GetString("mock.api_key", result.api_key);
  result.deepfake_latency = std::chrono::milliseconds(
      config.GetInt("mock.deepfake_latency_ms", static_cast<int>(result.deepfake_latency.count())));
  result.mfa_latency = std::chrono::milliseconds(
      config.GetInt("mock.mfa_latency_ms", static_cast<int>(result.mfa_latency.count())));
  result.sar_latency = std::chrono::milliseconds(
      config.GetInt("mock.sar_latency_ms", static_cast<int>(result.sar_latency.count())));
  result.rate_limit_per_minute = config.GetInt("mock.rate_limit_per_minute", result.rate_limit_per_minute);
  result.simulate_errors = config.GetBool("mock.simulate_errors", result.simulate_errors);
  result.error_rate = config.GetDouble("mock.error_rate", result.error_rate);
  result.fail_first_n = config.GetInt("mock.fail_first_n", result.fail_first_n);
  result.seed = static_cast<uint64_t>(config.GetInt("mock.seed", 0));
  return result;
}

MockVoiceApi::MockVoiceApi(const MockVoiceApiConfig& config, std::shared_ptr<Clock> clock)
    : clock_(std::move(clock)),
      config_(config),
      rng_(config.seed != 0 ? config.seed : std::random_device{}()) {
  if (!clock_) {
    throw std::invalid_argument("MockVoiceApi requires a clock");
  }
  if (config_.rate_limit_per_minute < 1) {
    throw std::invalid_argument("mock rate_limit_per_minute must be >= 1");
  }
  if (config_.error_rate < 0.0 || config_.error_rate > 1.0) {
    throw std::invalid_argument("mock error_rate must be within [0, 1]");
  }
}

void MockVoiceApi::RegisterEndpoints(engine::common::RestServer& server) {
  server.RegisterHandler("POST", "/v1/voice/deepfake",
                         [this](const Request& req, Response& resp) { HandleDeepfake(req, resp); });
  server.RegisterHandler("POST", "/v1/mfa/voice/verify",
                         [this](const Request& req, Response& resp) { HandleMfaVerify(req, resp); });
  server.RegisterHandler("POST", "/v1/reports/sar",
                         [this](const Request& req, Response& resp) { HandleSar(req, resp); });
  server.RegisterHandler("POST", "/v1/enrollment",
                         [this](const Request& req, Response& resp) { HandleEnrollment(req, resp); });
  server.RegisterHandler("GET", "/mock/stats", [this](const Request&, Response& resp) {
    WriteJson(resp, http::status::ok, GetStats());
  });
  server.RegisterHandler("POST", "/mock/reset", [this](const Request&, Response& resp) {
    Reset();
    WriteJson(resp, http::status::ok, {{"status", "reset"}});
  });
  server.RegisterHandler("GET", "/mock/config",
                         [this](const Request& req, Response& resp) { HandleGetConfig(req, resp); });
  server.RegisterHandler("POST", "/mock/config",
                         [this](const Request& req, Response& resp) { HandleUpdateConfig(req, resp); });
}

void MockVoiceApi::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  request_counts_.clear();
  sessions_.clear();
  enrollments_.clear();
  sar_cases_.clear();
  failures_by_file_.clear();
  total_requests_ = 0;
  SPDLOG_INFO("MockVoiceApi: state reset");
}

nlohmann::json MockVoiceApi::GetStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json counts = nlohmann::json::object();
  for (const auto& [key, count] : request_counts_) {
    counts[key] = count;
  }
  return {
    {"total_requests", total_requests_},
    {"total_sessions", sessions_.size()},
    {"total_enrollments", enrollments_.size()},
    {"total_sar_cases", sar_cases_.size()},
    {"request_counts", counts}
  };
}

MockVoiceApiConfig MockVoiceApi::GetConfig() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_;
}

void MockVoiceApi::HandleDeepfake(const Request& req, Response& resp) {
  RateDecision rate;
  if (!Admit(req, resp, rate)) {
    return;
  }
  auto parts = ParseUpload(req, resp);
  if (!parts) {
    return;
  }
  const FormPart* audio = FindPart(*parts, "audio");
  if (audio == nullptr || !audio->IsFile()) {
    WriteJson(resp, http::status::bad_request, ErrorBody("Bad request", "Missing 'audio' file in request"));
    return;
  }
  if (audio->data.empty()) {
    WriteJson(resp, http::status::bad_request, ErrorBody("Bad request", "Audio file is empty"));
    return;
  }
  if (InjectFault(audio->filename, resp)) {
    return;
  }

  nlohmann::json metadata = ParseJsonField(FindPart(*parts, "metadata"));
  std::chrono::milliseconds latency = GetConfig().deepfake_latency;
  SimulateLatency(latency);

  std::string filename = ToLower(audio->filename);
  double score = 0.0;
  std::string label;
  if (Contains(filename, "synthetic") || Contains(filename, "fake")) {
    score = Uniform(0.70, 0.95);
    label = "likely_synthetic";
  } else if (Contains(filename, "real") || Contains(filename, "authentic")) {
    score = Uniform(0.05, 0.35);
    label = "likely_real";
  } else {
    score = Uniform(0.30, 0.70);
    label = "uncertain";
  }

  std::string session_id = metadata.value("session_id", "");
  if (session_id.empty()) {
    session_id = NewId("session-");
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[session_id] = {
      {"score", score}, {"label", label}, {"timestamp", UtcTimestamp()},
      {"filename", audio->filename}, {"metadata", metadata}
    };
  }

  WriteJson(resp, http::status::ok, {
    {"score", Round3(score)},
    {"label", label},
    {"latency_ms", latency.count()},
    {"session_id", session_id},
    {"model_version", "mock-v1.0"}
  });
  ApplyRateHeaders(rate, resp);
  SPDLOG_INFO("MockVoiceApi: deepfake score={:.3f} label={} session={}", score, label, session_id);
}

void MockVoiceApi::HandleMfaVerify(const Request& req, Response& resp) {
  RateDecision rate;
  if (!Admit(req, resp, rate)) {
    return;
  }
  auto parts = ParseUpload(req, resp);
  if (!parts) {
    return;
  }
  const FormPart* audio = FindPart(*parts, "audio");
  if (audio == nullptr || !audio->IsFile()) {
    WriteJson(resp, http::status::bad_request, ErrorBody("Bad request", "Missing 'audio' file in request"));
    return;
  }
  const FormPart* enrollment = FindPart(*parts, "enrollment_id");
  if (enrollment == nullptr || enrollment->data.empty()) {
    WriteJson(resp, http::status::bad_request, ErrorBody("Bad request", "Missing 'enrollment_id' in request"));
    return;
  }
  if (InjectFault(audio->filename, resp)) {
    return;
  }

  const std::string& enrollment_id = enrollment->data;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (enrollments_.find(enrollment_id) == enrollments_.end()) {
      SPDLOG_INFO("MockVoiceApi: creating mock enrollment {}", enrollment_id);
      enrollments_[enrollment_id] = {{"created_at", UtcTimestamp()}, {"samples", 3}};
    }
  }

  nlohmann::json context = ParseJsonField(FindPart(*parts, "context"));
  std::chrono::milliseconds latency = GetConfig().mfa_latency;
  SimulateLatency(latency);

  std::string filename = ToLower(audio->filename);
  double confidence = 0.0;
  bool verified = false;
  // "mismatch" and "invalid" contain "match" and "valid"; test them first
  if (Contains(filename, "mismatch") || Contains(filename, "invalid")) {
    confidence = Uniform(0.15, 0.45);
    verified = false;
  } else if (Contains(filename, "match") || Contains(filename, "valid")) {
    confidence = Uniform(0.85, 0.98);
    verified = true;
  } else {
    confidence = Uniform(0.50, 0.90);
    verified = confidence >= 0.70;
  }

  std::string session_id = context.value("session_id", "");
  if (session_id.empty()) {
    session_id = NewId("session-");
  }

  nlohmann::json body = {
    {"verified", verified},
    {"enrollment_id", enrollment_id},
    {"confidence", Round3(confidence)},
    {"session_id", session_id},
    {"latency_ms", latency.count()}
  };
  if (!verified) {
    body["recommended_action"] = confidence > 0.30 ? "defer_to_review" : "deny";
  }
  WriteJson(resp, http::status::ok, body);
  ApplyRateHeaders(rate, resp);
  SPDLOG_INFO("MockVoiceApi: mfa verified={} confidence={:.3f} enrollment={}", verified, confidence, enrollment_id);
}

void MockVoiceApi::HandleSar(const Request& req, Response& resp) {
  RateDecision rate;
  if (!Admit(req, resp, rate)) {
    return;
  }

  nlohmann::json data = nlohmann::json::parse(req.body(), nullptr, false);
  if (data.is_discarded() || !data.is_object()) {
    WriteJson(resp, http::status::bad_request, ErrorBody("Bad request", "Invalid JSON body"));
    return;
  }

  std::string session_id = data.value("session_id", "");
  std::string decision = data.value("decision", "");
  std::string reason = data.value("reason", "");
  if (session_id.empty() || decision.empty() || reason.empty()) {
    WriteJson(resp, http::status::bad_request,
              ErrorBody("Bad request", "Missing required fields: session_id, decision, reason"));
    return;
  }
  if (decision != "allow" && decision != "deny" && decision != "review") {
    WriteJson(resp, http::status::bad_request,
              ErrorBody("Bad request", "Invalid decision. Must be 'allow', 'deny', or 'review'"));
    return;
  }
  if (InjectFault(session_id, resp)) {
    return;
  }

  SimulateLatency(GetConfig().sar_latency);

  std::string case_id = NewId("sar-");
  std::string submitted_at = UtcTimestamp();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sar_cases_[case_id] = {
      {"session_id", session_id}, {"decision", decision}, {"reason", reason},
      {"metadata", data.value("metadata", nlohmann::json::object())},
      {"submitted_at", submitted_at}
    };
  }

  WriteJson(resp, http::status::ok, {
    {"status", "submitted"},
    {"case_id", case_id},
    {"session_id", session_id},
    {"submitted_at", submitted_at}
  });
  ApplyRateHeaders(rate, resp);
  SPDLOG_INFO("MockVoiceApi: SAR submitted case_id={} decision={} session={}", case_id, decision, session_id);
}

void MockVoiceApi::HandleEnrollment(const Request& req, Response& resp) {
  if (!CheckApiKey(req, resp)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    total_requests_++;
  }
  auto parts = ParseUpload(req, resp);
  if (!parts) {
    return;
  }
  const FormPart* audio = FindPart(*parts, "audio");
  if (audio == nullptr || !audio->IsFile()) {
    WriteJson(resp, http::status::bad_request, ErrorBody("Bad request", "Missing 'audio' file in request"));
    return;
  }

  nlohmann::json metadata = ParseJsonField(FindPart(*parts, "metadata"));
  std::string enrollment_id = NewId("enroll-");
  {
    std::lock_guard<std::mutex> lock(mutex_);
    enrollments_[enrollment_id] = {
      {"enrollment_id", enrollment_id}, {"created_at", UtcTimestamp()},
      {"samples", 1}, {"metadata", metadata}
    };
  }

  WriteJson(resp, http::status::created, {
    {"enrollment_id", enrollment_id},
    {"status", "active"},
    {"samples_required", 3},
    {"samples_collected", 1},
    {"message", "Enrollment created successfully. Submit 2 more samples to complete."}
  });
  SPDLOG_INFO("MockVoiceApi: enrollment created {}", enrollment_id);
}

void MockVoiceApi::HandleGetConfig(const Request&, Response& resp) {
  MockVoiceApiConfig config = GetConfig();
  WriteJson(resp, http::status::ok, {
    {"deepfake_latency_ms", config.deepfake_latency.count()},
    {"mfa_latency_ms", config.mfa_latency.count()},
    {"sar_latency_ms", config.sar_latency.count()},
    {"rate_limit_per_minute", config.rate_limit_per_minute},
    {"simulate_errors", config.simulate_errors},
    {"error_rate", config.error_rate},
    {"fail_first_n", config.fail_first_n}
  });
}

void MockVoiceApi::HandleUpdateConfig(const Request& req, Response& resp) {
  nlohmann::json data = nlohmann::json::parse(req.body(), nullptr, false);
  if (data.is_discarded() || !data.is_object()) {
    WriteJson(resp, http::status::bad_request, ErrorBody("Bad request", "Invalid JSON body"));
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  MockVoiceApiConfig updated = config_;
  try {
    if (data.contains("deepfake_latency_ms")) {
      updated.deepfake_latency = std::chrono::milliseconds(data["deepfake_latency_ms"].get<int>());
    }
    if (data.contains("mfa_latency_ms")) {
      updated.mfa_latency = std::chrono::milliseconds(data["mfa_latency_ms"].get<int>());
    }
    if (data.contains("sar_latency_ms")) {
      updated.sar_latency = std::chrono::milliseconds(data["sar_latency_ms"].get<int>());
    }
    if (data.contains("rate_limit_per_minute")) {
      updated.rate_limit_per_minute = data["rate_limit_per_minute"].get<int>();
    }
    if (data.contains("simulate_errors")) {
      updated.simulate_errors = data["simulate_errors"].get<bool>();
    }
    if (data.contains("error_rate")) {
      updated.error_rate = data["error_rate"].get<double>();
    }
    if (data.contains("fail_first_n")) {
      updated.fail_first_n = data["fail_first_n"].get<int>();
    }
  } catch (const nlohmann::json::exception& e) {
    WriteJson(resp, http::status::bad_request, ErrorBody("Bad request", e.what()));
    return;
  }
  if (updated.rate_limit_per_minute < 1 || updated.error_rate < 0.0 || updated.error_rate > 1.0) {
    WriteJson(resp, http::status::bad_request, ErrorBody("Bad request", "Invalid mock configuration"));
    return;
  }
  config_ = updated;
  SPDLOG_INFO("MockVoiceApi: configuration updated: {}", data.dump());
  WriteJson(resp, http::status::ok, {{"status", "updated"}, {"config", data}});
}

bool MockVoiceApi::Admit(const Request& req, Response& resp, RateDecision& rate) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    total_requests_++;
  }
  if (!CheckApiKey(req, resp)) {
    return false;
  }

  std::string client_id = GetHeader(req, "X-Client-ID");
  rate = CheckRateLimit(client_id.empty() ? "default" : client_id);
  if (!rate.allowed) {
    WriteJson(resp, http::status::too_many_requests,
              ErrorBody("Rate limit exceeded", "Too many requests. Please retry later"));
    ApplyRateHeaders(rate, resp);
    resp.set(http::field::retry_after, std::to_string(rate.reset_seconds));
    return false;
  }
  return true;
}

bool MockVoiceApi::CheckApiKey(const Request& req, Response& resp) const {
  std::string auth = GetHeader(req, "Authorization");
  const std::string prefix = "Bearer ";
  if (auth.compare(0, prefix.size(), prefix) != 0) {
    WriteJson(resp, http::status::unauthorized,
              ErrorBody("Unauthorized", "Missing or invalid Authorization header"));
    return false;
  }
  std::string expected;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    expected = config_.api_key;
  }
  if (auth.substr(prefix.size()) != expected) {
    WriteJson(resp, http::status::unauthorized, ErrorBody("Unauthorized", "Invalid API key"));
    return false;
  }
  return true;
}

MockVoiceApi::RateDecision MockVoiceApi::CheckRateLimit(const std::string& client_id) {
  auto since_epoch = std::chrono::duration_cast<std::chrono::seconds>(clock_->Now().time_since_epoch());
  int64_t now_seconds = since_epoch.count();
  int64_t minute = now_seconds / 60;

  std::lock_guard<std::mutex> lock(mutex_);
  if (minute != current_minute_) {
    // Every stored counter belongs to an earlier minute
    request_counts_.clear();
    current_minute_ = minute;
  }

  int& count = request_counts_[client_id + ":" + std::to_string(minute)];
  RateDecision decision;
  decision.limit = config_.rate_limit_per_minute;
  decision.reset_seconds = std::max<int64_t>(1, (minute + 1) * 60 - now_seconds);
  if (count >= config_.rate_limit_per_minute) {
    decision.allowed = false;
    decision.remaining = 0;
    return decision;
  }
  count++;
  decision.remaining = std::max(0, config_.rate_limit_per_minute - count);
  return decision;
}

void MockVoiceApi::ApplyRateHeaders(const RateDecision& rate, Response& resp) {
  resp.set("X-RateLimit-Limit", std::to_string(rate.limit));
  resp.set("X-RateLimit-Remaining", std::to_string(rate.remaining));
  resp.set("X-RateLimit-Reset", std::to_string(rate.reset_seconds));
}

bool MockVoiceApi::InjectFault(const std::string& filename, Response& resp) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (config_.fail_first_n > 0) {
    int& failures = failures_by_file_[filename];
    if (failures < config_.fail_first_n) {
      int attempt = ++failures;
      int n = config_.fail_first_n;
      lock.unlock();
      SPDLOG_DEBUG("MockVoiceApi: injected failure {}/{} for {}", attempt, n, filename);
      WriteJson(resp, http::status::internal_server_error,
                ErrorBody("Internal server error", "Injected failure for " + filename));
      return true;
    }
  }
  if (!config_.simulate_errors || config_.error_rate <= 0.0) {
    return false;
  }

  std::uniform_real_distribution<double> dist(0.0, 1.0);
  if (dist(rng_) >= config_.error_rate) {
    return false;
  }
  std::uniform_int_distribution<int> pick(0, 2);
  int choice = pick(rng_);
  lock.unlock();

  switch (choice) {
    case 0:
      WriteJson(resp, http::status::internal_server_error, ErrorBody("Internal server error", "Simulated error"));
      break;
    case 1:
      WriteJson(resp, http::status::service_unavailable,
                ErrorBody("Service unavailable", "Service temporarily unavailable"));
      break;
    default:
      WriteJson(resp, http::status::bad_request, ErrorBody("Bad request", "Invalid audio format"));
      break;
  }
  return true;
}

double MockVoiceApi::Uniform(double low, double high) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::uniform_real_distribution<double> dist(low, high);
  return dist(rng_);
}

std::string MockVoiceApi::NewId(const std::string& prefix) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::uniform_int_distribution<uint64_t> dist;
  std::ostringstream oss;
  oss << prefix << std::hex << std::setw(12) << std::setfill('0') << (dist(rng_) & 0xffffffffffffULL);
  return oss.str();
}

void MockVoiceApi::SimulateLatency(std::chrono::milliseconds latency) {
  if (latency > std::chrono::milliseconds::zero()) {
    clock_->SleepFor(latency);
  }
}

}  // namespace voxguard
