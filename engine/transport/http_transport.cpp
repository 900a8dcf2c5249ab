#include "http_transport.hpp"
#include "engine/common/util.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <algorithm>
#include <cctype>
#include <optional>
#include <spdlog/spdlog.h>

namespace voxguard {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

// Phase of the exchange an error occurred in, used to pick the error kind
enum class Phase {
  Resolve,
  Connect,
  Handshake,
  Exchange
};

TransportError MapError(const beast::error_code& ec, Phase phase) {
  if (ec == beast::error::timeout || ec == net::error::timed_out) {
    return TransportError::Timeout;
  }
  switch (phase) {
    case Phase::Resolve:
      return TransportError::ResolveFailed;
    case Phase::Connect:
      return TransportError::ConnectionFailed;
    case Phase::Handshake:
      return TransportError::TlsFailure;
    case Phase::Exchange:
      break;
  }
  if (ec == net::error::connection_reset || ec == net::error::broken_pipe ||
      ec == net::error::connection_aborted || ec == net::error::eof ||
      ec == http::error::end_of_stream || ec == ssl::error::stream_truncated) {
    return TransportError::ConnectionReset;
  }
  return TransportError::ProtocolError;
}

// Start one async operation and drive the io_context until it completes.
// The tcp_stream deadline cancels the operation on expiry.
template <typename Initiator>
beast::error_code RunStep(net::io_context& ioc, Initiator&& initiate) {
  beast::error_code result = net::error::would_block;
  initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
  ioc.restart();
  ioc.run();
  return result;
}

std::optional<http::verb> ParseVerb(const std::string& method) {
  std::string upper = method;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  http::verb verb = http::string_to_verb(upper);
  if (verb == http::verb::unknown) {
    return std::nullopt;
  }
  return verb;
}

http::request<http::string_body> BuildRequest(const HttpRequest& request, http::verb verb,
                                              const engine::common::ParsedUrl& url,
                                              const std::string& user_agent) {
  http::request<http::string_body> req{verb, url.path, 11};
  bool default_port = (url.IsTls() && url.port == "443") || (!url.IsTls() && url.port == "80");
  req.set(http::field::host, default_port ? url.host : url.host + ":" + url.port);
  req.set(http::field::user_agent, user_agent);
  req.set(http::field::connection, "close");
  for (const auto& [name, value] : request.headers) {
    req.set(name, value);
  }
  if (!request.content_type.empty()) {
    req.set(http::field::content_type, request.content_type);
  }
  req.body() = request.body;
  req.prepare_payload();
  return req;
}

HttpResponse ConvertResponse(http::response<http::string_body>& res) {
  HttpResponse response;
  response.status_code = static_cast<int>(res.result_int());
  for (const auto& field : res) {
    response.SetHeader(std::string(field.name_string()), std::string(field.value()));
  }
  response.body = std::move(res.body());
  return response;
}

// Write the request and read the response on an established stream
template <typename Stream>
HttpResponse Exchange(net::io_context& ioc, Stream& stream,
                      http::request<http::string_body>& req) {
  beast::error_code ec = RunStep(ioc, [&](auto handler) {
    http::async_write(stream, req, std::move(handler));
  });
  if (ec) {
    return HttpResponse::FromError(MapError(ec, Phase::Exchange), "write: " + ec.message());
  }

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  ec = RunStep(ioc, [&](auto handler) {
    http::async_read(stream, buffer, res, std::move(handler));
  });
  if (ec) {
    return HttpResponse::FromError(MapError(ec, Phase::Exchange), "read: " + ec.message());
  }
  return ConvertResponse(res);
}

}  // namespace

HttpTransport::HttpTransport(const HttpTransportOptions& options)
    : options_(options),
      ssl_ctx_(std::make_unique<ssl::context>(ssl::context::tlsv12_client)) {
  ssl_ctx_->set_default_verify_paths();
  if (!options_.ca_file.empty()) {
    ssl_ctx_->load_verify_file(options_.ca_file);
  }
  ssl_ctx_->set_verify_mode(options_.verify_peer ? ssl::verify_peer : ssl::verify_none);
}

HttpTransport::~HttpTransport() = default;

HttpResponse HttpTransport::Send(const HttpRequest& request, std::chrono::milliseconds timeout) {
  engine::common::ParsedUrl url = engine::common::ParseUrl(request.url);
  if (!url.IsValid()) {
    return HttpResponse::FromError(TransportError::InvalidRequest, "invalid url: " + request.url);
  }
  std::optional<http::verb> verb = ParseVerb(request.method);
  if (!verb) {
    return HttpResponse::FromError(TransportError::InvalidRequest, "unsupported method: " + request.method);
  }

  try {
    net::io_context ioc;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    // Resolve (not covered by the stream deadline, bounded by run_for)
    tcp::resolver resolver(ioc);
    beast::error_code resolve_ec = net::error::would_block;
    tcp::resolver::results_type endpoints;
    resolver.async_resolve(url.host, url.port,
        [&](beast::error_code ec, tcp::resolver::results_type results) {
          resolve_ec = ec;
          endpoints = std::move(results);
        });
    ioc.run_for(timeout);
    if (resolve_ec == net::error::would_block) {
      resolver.cancel();
      ioc.restart();
      ioc.run();
      return HttpResponse::FromError(TransportError::Timeout, "resolve timed out for " + url.host);
    }
    if (resolve_ec) {
      return HttpResponse::FromError(MapError(resolve_ec, Phase::Resolve),
                                     "resolve " + url.host + ": " + resolve_ec.message());
    }

    auto req = BuildRequest(request, *verb, url, options_.user_agent);
    auto remaining = std::max(std::chrono::steady_clock::duration::zero(),
                              deadline - std::chrono::steady_clock::now());

    if (!url.IsTls()) {
      beast::tcp_stream stream(ioc);
      stream.expires_after(remaining);
      beast::error_code ec = RunStep(ioc, [&](auto handler) {
        stream.async_connect(endpoints, std::move(handler));
      });
      if (ec) {
        return HttpResponse::FromError(MapError(ec, Phase::Connect),
                                       "connect " + url.host + ":" + url.port + ": " + ec.message());
      }
      HttpResponse response = Exchange(ioc, stream, req);
      beast::error_code shutdown_ec;
      stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
      return response;
    }

    beast::ssl_stream<beast::tcp_stream> stream(ioc, *ssl_ctx_);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
      return HttpResponse::FromError(TransportError::TlsFailure, "failed to set SNI host name");
    }
    if (options_.verify_peer) {
      stream.set_verify_callback(ssl::host_name_verification(url.host));
    }
    beast::get_lowest_layer(stream).expires_after(remaining);

    beast::error_code ec = RunStep(ioc, [&](auto handler) {
      beast::get_lowest_layer(stream).async_connect(endpoints, std::move(handler));
    });
    if (ec) {
      return HttpResponse::FromError(MapError(ec, Phase::Connect),
                                     "connect " + url.host + ":" + url.port + ": " + ec.message());
    }
    ec = RunStep(ioc, [&](auto handler) {
      stream.async_handshake(ssl::stream_base::client, std::move(handler));
    });
    if (ec) {
      return HttpResponse::FromError(MapError(ec, Phase::Handshake), "tls handshake: " + ec.message());
    }

    HttpResponse response = Exchange(ioc, stream, req);

    // Graceful shutdown; "stream truncated" and "not connected" are harmless
    beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(1));
    beast::error_code shutdown_ec = RunStep(ioc, [&](auto handler) {
      stream.async_shutdown(std::move(handler));
    });
    if (shutdown_ec && shutdown_ec != beast::errc::not_connected &&
        shutdown_ec != ssl::error::stream_truncated) {
      SPDLOG_DEBUG("HttpTransport: shutdown warning for {}: {}", url.host, shutdown_ec.message());
    }
    return response;
  } catch (const std::exception& e) {
    SPDLOG_ERROR("HttpTransport: exception sending {} {}: {}", request.method, request.url, e.what());
    return HttpResponse::FromError(TransportError::ProtocolError, e.what());
  }
}

}  // namespace voxguard
