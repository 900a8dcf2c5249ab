#pragma once

#include "config_manager.hpp"
#include "event_thread.hpp"
#include "rest_server.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace voxguard {
namespace engine {
namespace common {

/**
 * @brief Base application framework providing common infrastructure.
 *
 * ApplicationKernel provides a standardized lifecycle for applications:
 * 1. Initialize: Parse arguments, load config, setup logging, OnInitialize()
 * 2. Start: Start the event thread and REST server, OnStart()
 * 3. Run: Wait for a signal, /admin/stop or RequestStop()
 * 4. Stop: OnStop(), graceful shutdown, OnShutdown()
 *
 * Features:
 * - Configuration management (JSON file + environment overrides)
 * - Structured logging (spdlog)
 * - Event-driven task processing (EventThread)
 * - REST server with health and metrics endpoints
 * - Signal handling (SIGINT, SIGTERM)
 *
 * Usage:
 * ```cpp
 * class MyApp : public ApplicationKernel {
 *  protected:
 *   void OnStart() override { // Start your services }
 *   void OnStop() override { // Stop your services }
 * };
 * ```
 */
class ApplicationKernel {
 public:
  explicit ApplicationKernel(const std::string& app_name = "voxguard_app");
  virtual ~ApplicationKernel();

  ApplicationKernel(const ApplicationKernel&) = delete;
  ApplicationKernel& operator=(const ApplicationKernel&) = delete;

  /**
   * @brief Main entry point for the application.
   *
   * Usage: <app> --config_file <path> [inputs...]
   * @return Exit code: 1 if initialization or start failed, otherwise the
   *         code set with SetExitCode() (default 0).
   */
  int Run(int argc, char** argv);

  /** @brief Ask the run loop to stop (safe from any thread). */
  void RequestStop();

  bool IsRunning() const { return running_.load(); }

  //=== Task Posting ===
  void Post(std::function<void()> task);
  void PostDelayed(std::function<void()> task, std::chrono::milliseconds delay);
  int SchedulePeriodic(std::function<void()> task, std::chrono::milliseconds interval);
  void CancelPeriodic(int task_id);

  //=== Accessors ===
  ConfigManager& GetConfig() { return config_; }
  const ConfigManager& GetConfig() const { return config_; }

  const std::string& GetAppName() const { return app_name_; }

  /** @brief Positional command line arguments (after the options). */
  const std::vector<std::string>& GetPositionalArgs() const { return positional_args_; }

  RestServer& GetRestServer() { return rest_server_; }
  EventThread& GetEventThread() { return event_thread_; }

 protected:
  /** @brief Called after config and logging are ready, before the REST server starts. */
  virtual void OnInitialize() {}

  /** @brief Called when application starts (begin processing). */
  virtual void OnStart() {}

  /** @brief Called when the run loop ends. */
  virtual void OnStop() {}

  /** @brief Called during final cleanup. */
  virtual void OnShutdown() {}

  void SetExitCode(int code) { exit_code_ = code; }

 private:
  std::string app_name_;
  ConfigManager config_;
  EventThread event_thread_;
  RestServer rest_server_;
  std::vector<std::string> positional_args_;
  std::string loaded_config_file_;

  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_called_{false};
  std::atomic<int> exit_code_{0};
  static std::atomic<ApplicationKernel*> instance_;  ///< Target of the signal handler

  bool Initialize(int argc, char** argv);
  std::string ParseCommandLineArguments(int argc, char** argv);
  void LoadConfiguration(const std::string& config_file);
  void InitializeLogging();
  void SetupSignalHandlers();
  static void SignalHandler(int signal);
  void InitializeRestServer();
  void Shutdown();
};

}  // namespace common
}  // namespace engine
}  // namespace voxguard
