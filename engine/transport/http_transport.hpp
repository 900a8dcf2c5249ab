#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "transport.hpp"

namespace boost {
namespace asio {
namespace ssl {
class context;
}  // namespace ssl
}  // namespace asio
}  // namespace boost

namespace voxguard {

struct HttpTransportOptions {
  bool verify_peer = true;       ///< Verify the server certificate and host name (https only)
  std::string ca_file;           ///< Extra CA bundle; empty uses the system paths
  std::string user_agent = "voxguard/1.0";
};

/**
 * @brief Transport over Boost.Beast, plain TCP or TLS (OpenSSL)
 *
 * One connection per call. The timeout is a single deadline covering
 * resolve, connect, handshake, write and read. Each call runs on its own
 * io_context so Send() is safe to call from several threads.
 */
class HttpTransport : public Transport {
 public:
  explicit HttpTransport(const HttpTransportOptions& options = HttpTransportOptions());
  ~HttpTransport() override;

  HttpTransport(const HttpTransport&) = delete;
  HttpTransport& operator=(const HttpTransport&) = delete;

  HttpResponse Send(const HttpRequest& request, std::chrono::milliseconds timeout) override;

 private:
  HttpTransportOptions options_;
  std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;
};

}  // namespace voxguard
