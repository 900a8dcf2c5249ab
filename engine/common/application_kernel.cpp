#include "application_kernel.hpp"

#include <CLI/CLI.hpp>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>

namespace voxguard {
namespace engine {
namespace common {

std::atomic<ApplicationKernel*> ApplicationKernel::instance_{nullptr};

ApplicationKernel::ApplicationKernel(const std::string& app_name) : app_name_(app_name) {
  instance_ = this;
}

ApplicationKernel::~ApplicationKernel() {
  Shutdown();
  ApplicationKernel* self = this;
  instance_.compare_exchange_strong(self, nullptr);
}

bool ApplicationKernel::Initialize(int argc, char** argv) {
  try {
    std::string config_file = ParseCommandLineArguments(argc, argv);

    LoadConfiguration(config_file);

    // Logging level may come from the config file or LOG_LEVEL
    InitializeLogging();

    SPDLOG_INFO("Starting application: {}", app_name_);
    config_.PrintAllConfig();

    SetupSignalHandlers();

    try {
      OnInitialize();
    } catch (const std::exception& e) {
      SPDLOG_ERROR("OnInitialize hook failed: {}", e.what());
      return false;
    }

    InitializeRestServer();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("Initialization failed: {}", e.what());
    return false;
  }

  return true;
}

std::string ApplicationKernel::ParseCommandLineArguments(int argc, char** argv) {
  CLI::App app{app_name_};
  std::string config_file;
  app.add_option("--config_file", config_file, "Path to configuration file")
     ->required()
     ->check(CLI::ExistingFile);
  app.add_option("inputs", positional_args_, "Input files or directories");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    app.exit(e);
    throw std::runtime_error(std::string("Command-line parsing error: ") + e.what());
  }

  return config_file;
}

void ApplicationKernel::LoadConfiguration(const std::string& config_file) {
  loaded_config_file_ = config_file;
  if (!config_.LoadFromFile(config_file)) {
    throw std::runtime_error("Failed to load configuration from " + config_file);
  }
  int applied = config_.ApplyEnvironment(ConfigManager::DefaultEnvBindings());
  SPDLOG_DEBUG("Applied {} environment overrides", applied);
}

void ApplicationKernel::InitializeLogging() {
  std::string log_file_path = config_.GetString("app.log.file", "logs/" + app_name_ + ".log");
  std::string log_level_str = config_.GetString("app.log.level", "info");

  spdlog::level::level_enum level = spdlog::level::from_str(log_level_str);
  if (log_level_str == "warning") {
    level = spdlog::level::warn;
  } else if (level == spdlog::level::off && log_level_str != "off") {
    level = spdlog::level::info;  // Unknown name
  }

  std::string path_str = log_file_path;
  try {
    std::filesystem::path p(log_file_path);
    if (!p.is_absolute()) {
      p = std::filesystem::absolute(p);
    }
    path_str = p.string();
    if (p.has_parent_path()) {
      std::filesystem::create_directories(p.parent_path());
    }

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_str, true);
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    std::vector<spdlog::sink_ptr> sinks{file_sink, console_sink};

    auto logger = std::make_shared<spdlog::logger>(app_name_, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v [%s:%#]");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_every(std::chrono::seconds(1));

    SPDLOG_INFO("Logging to file: {} with level: {}", path_str, log_level_str);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[%s] InitLogging failed (path=%s): %s\n", app_name_.c_str(), path_str.c_str(), e.what());
    // Fallback to console only
    auto console = std::make_shared<spdlog::logger>(
        app_name_, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    spdlog::set_default_logger(console);
    spdlog::set_level(level);
  }

  SPDLOG_INFO("Logging initialized from config: {}", loaded_config_file_);
}

int ApplicationKernel::Run(int argc, char** argv) {
  if (!Initialize(argc, argv)) {
    Shutdown();
    return 1;
  }

  event_thread_.Start();

  SPDLOG_INFO("ApplicationKernel: Starting application");
  running_ = true;
  try {
    OnStart();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("Start failed: {}", e.what());
    Shutdown();
    return 1;
  }

  SPDLOG_INFO("Application {} started", app_name_);

  while (running_.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  SPDLOG_INFO("Stop requested");

  try {
    OnStop();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("Stop hook exception: {}", e.what());
    exit_code_ = 1;
  }

  Shutdown();

  SPDLOG_INFO("Application {} stopped (exit code {})", app_name_, exit_code_.load());
  spdlog::default_logger()->flush();
  return exit_code_.load();
}

void ApplicationKernel::RequestStop() {
  running_.store(false, std::memory_order_release);
}

void ApplicationKernel::Post(std::function<void()> task) {
  event_thread_.Post(std::move(task));
}

void ApplicationKernel::PostDelayed(std::function<void()> task, std::chrono::milliseconds delay) {
  event_thread_.PostDelayed(std::move(task), delay);
}

int ApplicationKernel::SchedulePeriodic(std::function<void()> task, std::chrono::milliseconds interval) {
  return event_thread_.SchedulePeriodic(std::move(task), interval);
}

void ApplicationKernel::CancelPeriodic(int task_id) {
  event_thread_.CancelPeriodic(task_id);
}

void ApplicationKernel::SetupSignalHandlers() {
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
}

void ApplicationKernel::SignalHandler(int signal) {
  ApplicationKernel* instance = instance_.load();
  if (instance && (signal == SIGINT || signal == SIGTERM)) {
    instance->running_.store(false, std::memory_order_release);
  }
}

void ApplicationKernel::InitializeRestServer() {
  rest_server_.SetAppName(app_name_);

  rest_server_.SetStatusCallback([this]() {
    nlohmann::json status;
    status["app_name"] = app_name_;
    status["uptime_seconds"] = rest_server_.GetUptime().count();
    status["state"] = running_.load() ? "running" : "stopped";
    return status.dump();
  });

  rest_server_.SetStopCallback([this]() {
    RequestStop();
  });

  // app.rest_port: 0 disables the server
  int rest_port = config_.GetInt("app.rest_port", 0);
  std::string rest_address = config_.GetString("app.rest_address", "0.0.0.0");

  if (rest_port > 0) {
    if (!rest_server_.Start(rest_address, static_cast<uint16_t>(rest_port))) {
      SPDLOG_WARN("Failed to start REST server on {}:{}", rest_address, rest_port);
    }
  } else {
    SPDLOG_INFO("REST server disabled (port=0 or not configured)");
  }
}

void ApplicationKernel::Shutdown() {
  if (shutdown_called_.exchange(true)) {
    return;  // Already shutting down
  }

  running_ = false;
  SPDLOG_INFO("Shutting down application: {}", app_name_);

  rest_server_.Stop();
  event_thread_.Stop();

  try {
    OnShutdown();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("Shutdown hook exception: {}", e.what());
  }
}

}  // namespace common
}  // namespace engine
}  // namespace voxguard
