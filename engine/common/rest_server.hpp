#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace voxguard {
namespace engine {
namespace common {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

// HTTP request handler type
using HttpHandler = std::function<void(
    const http::request<http::string_body>& req,
    http::response<http::string_body>& resp)>;

// Request path without the query string
std::string GetRequestPath(const http::request<http::string_body>& req);

// Value of query parameter `name` in `target`, empty if absent
std::string GetQueryParam(const std::string& target, const std::string& name);

// Set status, content type and body and prepare the payload
void WriteJson(http::response<http::string_body>& resp, http::status status, const nlohmann::json& body);

/**
 * @brief REST server for health, metrics and admin endpoints plus custom
 * handlers
 *
 * One thread runs the accept loop; each connection is served on its own
 * thread. Built-in endpoints: GET /health, GET /status, GET /metrics,
 * POST /admin/stop. Custom handlers take precedence and may match by path
 * prefix.
 */
class RestServer {
 public:
  // Large enough for a 100 MiB audio upload plus multipart framing
  static constexpr uint64_t kDefaultBodyLimit = 128ull * 1024 * 1024;

  RestServer();
  ~RestServer();

  RestServer(const RestServer&) = delete;
  RestServer& operator=(const RestServer&) = delete;

  // Bind and start serving. Port 0 picks a free port (see GetPort()).
  bool Start(const std::string& address, uint16_t port);

  // Stop accepting, drop connections still waiting for a request and wait
  // for the requests being handled
  void Stop();

  bool IsRunning() const { return running_.load(); }

  // Bound port, 0 when not running
  uint16_t GetPort() const { return port_.load(); }

  // Register custom endpoint handler (before Start())
  void RegisterHandler(const std::string& method, const std::string& path, HttpHandler handler);

  std::chrono::seconds GetUptime() const;

  void SetAppName(const std::string& name) { app_name_ = name; }

  // Larger request bodies are answered with 413 (set before Start())
  void SetBodyLimit(uint64_t bytes) { body_limit_ = bytes; }

  // Body for GET /metrics and its content type
  void SetMetricsCallback(std::function<std::string()> callback,
                          const std::string& content_type = "application/json") {
    metrics_callback_ = std::move(callback);
    metrics_content_type_ = content_type;
  }

  // Body for GET /status
  void SetStatusCallback(std::function<std::string()> callback) { status_callback_ = std::move(callback); }

  // Body for GET /health. A "status" of "unhealthy" is served as 503.
  void SetHealthCallback(std::function<nlohmann::json()> callback) { health_callback_ = std::move(callback); }

  // Called for POST /admin/stop
  void SetStopCallback(std::function<void()> callback) { stop_callback_ = std::move(callback); }

  // Route a request without a socket (used by the connection threads and tests)
  void HandleRequest(const http::request<http::string_body>& req, http::response<http::string_body>& resp);

 private:
  std::string app_name_;
  uint64_t body_limit_{kDefaultBodyLimit};
  std::atomic<bool> running_{false};
  std::atomic<uint16_t> port_{0};
  std::thread server_thread_;
  std::chrono::steady_clock::time_point start_time_;

  std::shared_ptr<net::io_context> ioc_;
  std::shared_ptr<tcp::acceptor> acceptor_;

  // In-flight connection threads
  std::mutex connections_mutex_;
  std::condition_variable connections_cv_;
  int active_connections_{0};
  std::set<std::shared_ptr<tcp::socket>> reading_sockets_;  ///< Connections waiting for a request

  // Custom handlers: method -> path -> handler
  std::map<std::string, std::map<std::string, HttpHandler>> handlers_;

  std::function<std::string()> metrics_callback_;
  std::string metrics_content_type_{"application/json"};
  std::function<std::string()> status_callback_;
  std::function<nlohmann::json()> health_callback_;
  std::function<void()> stop_callback_;

  void StartAccept();
  void ServeConnection(std::shared_ptr<tcp::socket> socket);
  bool DispatchCustom(const std::string& method, const std::string& path,
                      const http::request<http::string_body>& req, http::response<http::string_body>& resp);
  void HandleHealth(http::response<http::string_body>& resp);
  void HandleStatus(http::response<http::string_body>& resp);
  void HandleMetrics(http::response<http::string_body>& resp);
  void HandleStop(http::response<http::string_body>& resp);
};

}  // namespace common
}  // namespace engine
}  // namespace voxguard
