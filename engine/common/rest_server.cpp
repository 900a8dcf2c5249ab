#include "rest_server.hpp"
#include <spdlog/spdlog.h>

namespace voxguard {
namespace engine {
namespace common {

std::string GetRequestPath(const http::request<http::string_body>& req) {
  std::string target(req.target());
  size_t query = target.find('?');
  return query == std::string::npos ? target : target.substr(0, query);
}

std::string GetQueryParam(const std::string& target, const std::string& name) {
  size_t query = target.find('?');
  if (query == std::string::npos) {
    return "";
  }
  size_t pos = query + 1;
  while (pos < target.size()) {
    size_t end = target.find('&', pos);
    std::string pair = target.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    size_t eq = pair.find('=');
    if (pair.substr(0, eq) == name) {
      return eq == std::string::npos ? "" : pair.substr(eq + 1);
    }
    if (end == std::string::npos) {
      break;
    }
    pos = end + 1;
  }
  return "";
}

void WriteJson(http::response<http::string_body>& resp, http::status status, const nlohmann::json& body) {
  resp.result(status);
  resp.set(http::field::content_type, "application/json");
  resp.body() = body.dump();
  resp.prepare_payload();
}

RestServer::RestServer() : app_name_("voxguard_app") {
  start_time_ = std::chrono::steady_clock::now();
}

RestServer::~RestServer() {
  Stop();
}

bool RestServer::Start(const std::string& address, uint16_t port) {
  if (running_.exchange(true)) {
    return false;  // Already running
  }

  try {
    ioc_ = std::make_shared<net::io_context>(1);
    auto endpoint = tcp::endpoint(net::ip::make_address(address), port);
    acceptor_ = std::make_shared<tcp::acceptor>(*ioc_, endpoint);
    port_ = acceptor_->local_endpoint().port();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("REST server failed to bind {}:{}: {}", address, port, e.what());
    acceptor_.reset();
    ioc_.reset();
    running_ = false;
    return false;
  }

  start_time_ = std::chrono::steady_clock::now();
  StartAccept();
  server_thread_ = std::thread([this]() {
    try {
      ioc_->run();
    } catch (const std::exception& e) {
      SPDLOG_ERROR("REST server error: {}", e.what());
    }
    SPDLOG_DEBUG("REST server io_context stopped");
  });

  SPDLOG_INFO("REST server listening on {}:{}", address, port_.load());
  return true;
}

void RestServer::Stop() {
  if (!running_.exchange(false)) {
    return;  // Not running
  }

  // Stop the io_context to interrupt the accept loop
  ioc_->stop();
  if (server_thread_.joinable()) {
    server_thread_.join();
  }
  boost::system::error_code ec;
  acceptor_->close(ec);

  {
    std::unique_lock<std::mutex> lock(connections_mutex_);
    // Unblock connections still waiting for a request
    for (const auto& socket : reading_sockets_) {
      boost::system::error_code shutdown_ec;
      socket->shutdown(tcp::socket::shutdown_both, shutdown_ec);
    }
    connections_cv_.wait(lock, [this] { return active_connections_ == 0; });
  }

  acceptor_.reset();
  ioc_.reset();
  port_ = 0;
  SPDLOG_INFO("REST server stopped");
}

void RestServer::RegisterHandler(const std::string& method, const std::string& path, HttpHandler handler) {
  handlers_[method][path] = std::move(handler);
}

std::chrono::seconds RestServer::GetUptime() const {
  auto now = std::chrono::steady_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now - start_time_);
}

void RestServer::StartAccept() {
  if (!running_.load()) {
    return;
  }

  auto socket = std::make_shared<tcp::socket>(*ioc_);
  acceptor_->async_accept(*socket, [this, socket](boost::system::error_code ec) {
    if (ec) {
      if (ec == boost::asio::error::operation_aborted) {
        SPDLOG_DEBUG("REST server accept cancelled");
      } else {
        SPDLOG_ERROR("REST server accept error: {}", ec.message());
      }
      return;
    }

    {
      std::lock_guard<std::mutex> lock(connections_mutex_);
      active_connections_++;
      reading_sockets_.insert(socket);
    }
    // Serve on a separate thread to avoid blocking accepts
    std::thread(&RestServer::ServeConnection, this, socket).detach();

    StartAccept();
  });
}

void RestServer::ServeConnection(std::shared_ptr<tcp::socket> socket) {
  try {
    beast::flat_buffer buffer;
    http::request_parser<http::string_body> parser;
    parser.body_limit(body_limit_);
    boost::system::error_code ec;
    http::read(*socket, buffer, parser, ec);
    {
      std::lock_guard<std::mutex> lock(connections_mutex_);
      reading_sockets_.erase(socket);
    }

    if (ec && ec != http::error::body_limit) {
      if (running_.load()) {
        SPDLOG_WARN("REST server read error: {}", ec.message());
      } else {
        SPDLOG_DEBUG("REST server dropped idle connection on stop");
      }
    } else {
      http::response<http::string_body> resp{http::status::ok, 11};
      if (ec) {
        SPDLOG_WARN("REST server rejected request body over {} bytes", body_limit_);
        WriteJson(resp, http::status::payload_too_large,
                  {{"status", "error"}, {"message", "Request body too large"}});
      } else {
        http::request<http::string_body> req = parser.release();
        resp.version(req.version());
        HandleRequest(req, resp);
      }
      resp.set(http::field::server, app_name_);
      resp.keep_alive(false);

      http::write(*socket, resp);
      boost::system::error_code shutdown_ec;
      socket->shutdown(tcp::socket::shutdown_send, shutdown_ec);
    }
  } catch (const std::exception& e) {
    SPDLOG_WARN("REST server connection error: {}", e.what());
  }

  // The socket must not outlive the io_context released by Stop()
  std::lock_guard<std::mutex> lock(connections_mutex_);
  reading_sockets_.erase(socket);
  boost::system::error_code ec;
  socket->close(ec);
  socket.reset();

  active_connections_--;
  connections_cv_.notify_all();
}

void RestServer::HandleRequest(const http::request<http::string_body>& req, http::response<http::string_body>& resp) {
  std::string method(req.method_string());
  std::string path = GetRequestPath(req);

  try {
    if (DispatchCustom(method, path, req, resp)) {
      return;
    }

    if (path == "/health" && method == "GET") {
      HandleHealth(resp);
    } else if (path == "/status" && method == "GET") {
      HandleStatus(resp);
    } else if (path == "/metrics" && method == "GET") {
      HandleMetrics(resp);
    } else if (path == "/admin/stop" && method == "POST") {
      HandleStop(resp);
    } else {
      WriteJson(resp, http::status::not_found, {{"status", "error"}, {"message", "Not found"}});
    }
  } catch (const std::exception& e) {
    SPDLOG_ERROR("REST handler error for {} {}: {}", method, path, e.what());
    WriteJson(resp, http::status::internal_server_error, {{"status", "error"}, {"message", e.what()}});
  }
}

bool RestServer::DispatchCustom(const std::string& method, const std::string& path,
                                const http::request<http::string_body>& req,
                                http::response<http::string_body>& resp) {
  auto method_it = handlers_.find(method);
  if (method_it == handlers_.end()) {
    return false;
  }

  // Exact match first, then prefix match (for paths like /files/{id})
  auto path_it = method_it->second.find(path);
  if (path_it != method_it->second.end()) {
    path_it->second(req, resp);
    return true;
  }
  for (const auto& [registered_path, handler] : method_it->second) {
    if (path.length() > registered_path.length() &&
        path.compare(0, registered_path.length(), registered_path) == 0 &&
        path[registered_path.length()] == '/') {
      handler(req, resp);
      return true;
    }
  }
  return false;
}

void RestServer::HandleHealth(http::response<http::string_body>& resp) {
  nlohmann::json health_json;
  auto callback = health_callback_;
  if (callback) {
    health_json = callback();
  } else {
    health_json["status"] = "ok";
  }
  bool unhealthy = health_json.value("status", "") == "unhealthy";
  WriteJson(resp, unhealthy ? http::status::service_unavailable : http::status::ok, health_json);
}

void RestServer::HandleStatus(http::response<http::string_body>& resp) {
  resp.result(http::status::ok);
  resp.set(http::field::content_type, "application/json");

  auto callback = status_callback_;
  if (callback) {
    resp.body() = callback();
  } else {
    nlohmann::json status_json;
    status_json["app_name"] = app_name_;
    status_json["uptime_seconds"] = GetUptime().count();
    status_json["state"] = "running";
    resp.body() = status_json.dump();
  }
  resp.prepare_payload();
}

void RestServer::HandleMetrics(http::response<http::string_body>& resp) {
  resp.result(http::status::ok);

  auto callback = metrics_callback_;
  if (callback) {
    resp.set(http::field::content_type, metrics_content_type_);
    resp.body() = callback();
  } else {
    nlohmann::json metrics_json;
    metrics_json["uptime_seconds"] = GetUptime().count();
    resp.set(http::field::content_type, "application/json");
    resp.body() = metrics_json.dump();
  }
  resp.prepare_payload();
}

void RestServer::HandleStop(http::response<http::string_body>& resp) {
  WriteJson(resp, http::status::ok, {{"status", "ok"}, {"message", "Stop command received"}});

  auto callback = stop_callback_;
  if (callback) {
    callback();
  }
}

}  // namespace common
}  // namespace engine
}  // namespace voxguard
