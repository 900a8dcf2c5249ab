#include <memory>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>
#include "application_kernel.hpp"
#include "mock_voice_api.hpp"

using namespace voxguard::engine::common;

// Stand-in for the voice fraud API, served on app.rest_port
class MockApiServerApp : public ApplicationKernel {
 public:
  MockApiServerApp() : ApplicationKernel("mock_api_server") {}

 protected:
  void OnInitialize() override {
    voxguard::MockVoiceApiConfig config = voxguard::MockVoiceApiConfig::FromConfig(GetConfig());
    api_ = std::make_unique<voxguard::MockVoiceApi>(config);
    api_->RegisterEndpoints(GetRestServer());

    GetRestServer().SetHealthCallback([]() {
      return nlohmann::json{
        {"status", "healthy"},
        {"service", "mock-voice-api"},
        {"version", "1.0.0"}
      };
    });

    int port = GetConfig().GetInt("app.rest_port", 0);
    SPDLOG_INFO("MockApiServer: endpoints on port {}", port);
    SPDLOG_INFO("  POST /v1/voice/deepfake    - Deepfake detection");
    SPDLOG_INFO("  POST /v1/mfa/voice/verify  - MFA verification");
    SPDLOG_INFO("  POST /v1/reports/sar       - SAR submission");
    SPDLOG_INFO("  POST /v1/enrollment        - Create enrollment");
    SPDLOG_INFO("  GET  /mock/stats, POST /mock/reset, GET|POST /mock/config");
    SPDLOG_INFO("  export VOXGUARD_API_URL=http://localhost:{}", port);
  }

  void OnStart() override {
    if (!GetRestServer().IsRunning()) {
      throw std::runtime_error("REST server is not running; set app.rest_port");
    }
  }

 private:
  std::unique_ptr<voxguard::MockVoiceApi> api_;
};

int main(int argc, char** argv) {
  MockApiServerApp app;
  return app.Run(argc, argv);
}
