#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include "rest_server.hpp"
#include "http_transport.hpp"
#include "mock_voice_api.hpp"
#include "voice_api_client.hpp"
#include "audio_validator.hpp"

using namespace voxguard;
using namespace voxguard::engine::common;

class RestServerTest : public ::testing::Test {
 protected:
  http::response<http::string_body> Send(http::verb method, const std::string& target) {
    http::request<http::string_body> req{method, target, 11};
    http::response<http::string_body> resp{http::status::ok, 11};
    server_.HandleRequest(req, resp);
    return resp;
  }

  RestServer server_;
};

TEST_F(RestServerTest, Health_Default) {
  auto resp = Send(http::verb::get, "/health");
  EXPECT_EQ(resp.result(), http::status::ok);
  EXPECT_EQ(nlohmann::json::parse(resp.body())["status"], "ok");
}

TEST_F(RestServerTest, Health_UnhealthyIs503) {
  server_.SetHealthCallback([]() { return nlohmann::json{{"status", "degraded"}}; });
  EXPECT_EQ(Send(http::verb::get, "/health").result(), http::status::ok);

  server_.SetHealthCallback([]() { return nlohmann::json{{"status", "unhealthy"}}; });
  auto resp = Send(http::verb::get, "/health");
  EXPECT_EQ(resp.result(), http::status::service_unavailable);
  EXPECT_EQ(nlohmann::json::parse(resp.body())["status"], "unhealthy");
}

TEST_F(RestServerTest, Status_Default) {
  server_.SetAppName("batch_processor");
  auto body = nlohmann::json::parse(Send(http::verb::get, "/status").body());
  EXPECT_EQ(body["app_name"], "batch_processor");
  EXPECT_EQ(body["state"], "running");
  EXPECT_TRUE(body.contains("uptime_seconds"));
}

TEST_F(RestServerTest, Metrics_CallbackContentType) {
  server_.SetMetricsCallback([]() { return std::string("voxguard_retries_total 0\n"); },
                             "text/plain; version=0.0.4");
  auto resp = Send(http::verb::get, "/metrics");
  EXPECT_EQ(resp.result(), http::status::ok);
  EXPECT_EQ(resp[http::field::content_type], "text/plain; version=0.0.4");
  EXPECT_EQ(resp.body(), "voxguard_retries_total 0\n");
}

TEST_F(RestServerTest, AdminStop_InvokesCallback) {
  bool stopped = false;
  server_.SetStopCallback([&stopped]() { stopped = true; });
  EXPECT_EQ(Send(http::verb::post, "/admin/stop").result(), http::status::ok);
  EXPECT_TRUE(stopped);
}

TEST_F(RestServerTest, UnknownPathOrMethod_404) {
  EXPECT_EQ(Send(http::verb::get, "/nope").result(), http::status::not_found);
  EXPECT_EQ(Send(http::verb::post, "/health").result(), http::status::not_found);
}

TEST_F(RestServerTest, CustomHandler_ExactAndPrefix) {
  std::string seen;
  server_.RegisterHandler("GET", "/files", [&seen](const auto& req, auto& resp) {
    seen = GetRequestPath(req);
    WriteJson(resp, http::status::ok, {{"path", seen}});
  });

  EXPECT_EQ(Send(http::verb::get, "/files?limit=2").result(), http::status::ok);
  EXPECT_EQ(seen, "/files");
  EXPECT_EQ(Send(http::verb::get, "/files/abc").result(), http::status::ok);
  EXPECT_EQ(seen, "/files/abc");
  // Not a path segment boundary
  EXPECT_EQ(Send(http::verb::get, "/filesystem").result(), http::status::not_found);
}

TEST_F(RestServerTest, CustomHandler_OverridesBuiltin) {
  server_.RegisterHandler("GET", "/health", [](const auto&, auto& resp) {
    WriteJson(resp, http::status::ok, {{"status", "custom"}});
  });
  EXPECT_EQ(nlohmann::json::parse(Send(http::verb::get, "/health").body())["status"], "custom");
}

TEST_F(RestServerTest, HandlerException_500) {
  server_.RegisterHandler("POST", "/boom", [](const auto&, auto&) {
    throw std::runtime_error("kaput");
  });
  auto resp = Send(http::verb::post, "/boom");
  EXPECT_EQ(resp.result(), http::status::internal_server_error);
  EXPECT_EQ(nlohmann::json::parse(resp.body())["message"], "kaput");
}

TEST(RestServerHelpersTest, GetQueryParam) {
  EXPECT_EQ(GetQueryParam("/x?a=1&b=two", "b"), "two");
  EXPECT_EQ(GetQueryParam("/x?a=1&b=two", "a"), "1");
  EXPECT_EQ(GetQueryParam("/x?flag&b=2", "flag"), "");
  EXPECT_EQ(GetQueryParam("/x?a=1", "c"), "");
  EXPECT_EQ(GetQueryParam("/x", "a"), "");
}

TEST_F(RestServerTest, StartStop_EphemeralPort) {
  ASSERT_TRUE(server_.Start("127.0.0.1", 0));
  EXPECT_TRUE(server_.IsRunning());
  EXPECT_GT(server_.GetPort(), 0);
  EXPECT_FALSE(server_.Start("127.0.0.1", 0));

  server_.Stop();
  EXPECT_FALSE(server_.IsRunning());
  EXPECT_EQ(server_.GetPort(), 0);
}

TEST_F(RestServerTest, Start_InvalidAddress) {
  EXPECT_FALSE(server_.Start("not-an-address", 0));
  EXPECT_FALSE(server_.IsRunning());
}

TEST_F(RestServerTest, Loopback_HttpTransport) {
  ASSERT_TRUE(server_.Start("127.0.0.1", 0));
  HttpTransport transport;

  HttpRequest request;
  request.method = "GET";
  request.url = "http://127.0.0.1:" + std::to_string(server_.GetPort()) + "/health";
  HttpResponse response = transport.Send(request, std::chrono::milliseconds(5000));
  EXPECT_FALSE(response.HasTransportError()) << response.Describe();
  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(nlohmann::json::parse(response.body)["status"], "ok");
  EXPECT_EQ(response.GetHeader("Content-Type"), "application/json");

  request.url = "http://127.0.0.1:" + std::to_string(server_.GetPort()) + "/missing";
  EXPECT_EQ(transport.Send(request, std::chrono::milliseconds(5000)).status_code, 404);
  server_.Stop();
}

TEST_F(RestServerTest, Loopback_ConnectionRefused) {
  ASSERT_TRUE(server_.Start("127.0.0.1", 0));
  uint16_t port = server_.GetPort();
  server_.Stop();

  HttpTransport transport;
  HttpRequest request;
  request.method = "GET";
  request.url = "http://127.0.0.1:" + std::to_string(port) + "/health";
  HttpResponse response = transport.Send(request, std::chrono::milliseconds(2000));
  EXPECT_TRUE(response.HasTransportError());
}

TEST_F(RestServerTest, Loopback_LargeRequestBody) {
  server_.RegisterHandler("POST", "/upload", [](const auto& req, auto& resp) {
    WriteJson(resp, http::status::ok, {{"bytes", req.body().size()}});
  });
  ASSERT_TRUE(server_.Start("127.0.0.1", 0));

  HttpTransport transport;
  HttpRequest request;
  request.url = "http://127.0.0.1:" + std::to_string(server_.GetPort()) + "/upload";
  request.content_type = "application/octet-stream";
  request.body = std::string(2 * 1024 * 1024, 'x');
  HttpResponse response = transport.Send(request, std::chrono::milliseconds(10000));
  ASSERT_FALSE(response.HasTransportError()) << response.Describe();
  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(nlohmann::json::parse(response.body)["bytes"], 2 * 1024 * 1024);
  server_.Stop();
}

TEST_F(RestServerTest, DefaultBodyLimit_CoversLargestAudioUpload) {
  EXPECT_GT(RestServer::kDefaultBodyLimit, kMaxAudioFileBytes);
}

TEST_F(RestServerTest, Stop_WithIdleClientConnected) {
  ASSERT_TRUE(server_.Start("127.0.0.1", 0));

  net::io_context ioc;
  tcp::socket client(ioc);
  client.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), server_.GetPort()));
  // Let the server hand the connection to its thread, which then waits for a request
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  auto stopped = std::async(std::launch::async, [this]() { server_.Stop(); });
  EXPECT_EQ(stopped.wait_for(std::chrono::seconds(3)), std::future_status::ready);

  char byte = 0;
  boost::system::error_code ec;
  client.read_some(net::buffer(&byte, 1), ec);
  EXPECT_TRUE(ec);
  client.close(ec);
  stopped.wait();
  EXPECT_FALSE(server_.IsRunning());
}

// Full client stack against the mock API over a real socket
class VoiceApiLoopbackTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() / "voxguard_loopback_test";
    std::filesystem::create_directories(dir_);

    mock_config_.deepfake_latency = std::chrono::milliseconds(0);
    mock_config_.mfa_latency = std::chrono::milliseconds(0);
    mock_config_.sar_latency = std::chrono::milliseconds(0);
    mock_config_.simulate_errors = false;
    mock_config_.seed = 99;
    mock_config_.fail_first_n = 1;
    mock_ = std::make_unique<MockVoiceApi>(mock_config_);
    mock_->RegisterEndpoints(server_);
    ASSERT_TRUE(server_.Start("127.0.0.1", 0));

    config_.base_url = "http://127.0.0.1:" + std::to_string(server_.GetPort());
    config_.api_key = "mock_api_key_12345";
    config_.client_id = "loopback";
    config_.resilience.base_delay = std::chrono::milliseconds(1);
    config_.resilience.max_delay = std::chrono::milliseconds(5);
    config_.resilience.request_timeout = std::chrono::milliseconds(5000);
    metrics_ = std::make_shared<ResilienceMetrics>();
    client_ = std::make_unique<VoiceApiClient>(config_, std::make_shared<HttpTransport>(),
                                               std::make_shared<SteadyClock>(), metrics_);
  }

  void TearDown() override {
    server_.Stop();
    std::filesystem::remove_all(dir_);
  }

  std::string WriteAudio(const std::string& name) {
    std::string path = (dir_ / name).string();
    std::ofstream file(path, std::ios::binary);
    file << "RIFF....WAVEfmt ";
    return path;
  }

  std::filesystem::path dir_;
  RestServer server_;
  MockVoiceApiConfig mock_config_;
  std::unique_ptr<MockVoiceApi> mock_;
  VoiceApiConfig config_;
  std::shared_ptr<ResilienceMetrics> metrics_;
  std::unique_ptr<VoiceApiClient> client_;
};

TEST_F(VoiceApiLoopbackTest, Deepfake_RetriesInjectedFailure) {
  ApiResult result = client_->DetectDeepfake(WriteAudio("caller_fake.wav"), {{"session_id", "loop-1"}});
  ASSERT_TRUE(result.Ok()) << result.body.dump();
  EXPECT_EQ(result.outcome.attempts_used, 2);
  EXPECT_EQ(result.GetLabel(), "likely_synthetic");
  ASSERT_TRUE(result.GetScore().has_value());
  EXPECT_GE(*result.GetScore(), 0.70);
  EXPECT_EQ(result.body["session_id"], "loop-1");

  EXPECT_EQ(mock_->GetStats()["request_counts"].size(), 1u);
  EXPECT_EQ(metrics_->Snapshot().retry_count, 1u);
}

TEST_F(VoiceApiLoopbackTest, MfaAndSar) {
  ApiResult mfa = client_->VerifyMfa(WriteAudio("voice_match.wav"), "enroll-7");
  ASSERT_TRUE(mfa.Ok()) << mfa.body.dump();
  EXPECT_TRUE(mfa.body["verified"].get<bool>());

  ApiResult sar = client_->SubmitSar("loop-2", "review", "borderline score");
  ASSERT_TRUE(sar.Ok()) << sar.body.dump();
  EXPECT_EQ(sar.body["status"], "submitted");
  EXPECT_EQ(mock_->GetStats()["total_sar_cases"], 1);
}

TEST_F(VoiceApiLoopbackTest, WrongApiKey_IsFatal) {
  config_.api_key = "wrong";
  VoiceApiClient client(config_, std::make_shared<HttpTransport>(), std::make_shared<SteadyClock>());
  ApiResult result = client.DetectDeepfake(WriteAudio("real_caller.wav"));
  EXPECT_FALSE(result.Ok());
  EXPECT_EQ(result.outcome.terminal_reason, TerminalReason::FatalClientError);
  EXPECT_EQ(result.outcome.attempts_used, 1);
  EXPECT_EQ(result.outcome.last_response.status_code, 401);
}
