#include "http_types.hpp"
#include <algorithm>
#include <cctype>

namespace voxguard {

namespace {

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

}  // namespace

const char* ToString(TransportError error) {
  switch (error) {
    case TransportError::None: return "none";
    case TransportError::Timeout: return "timeout";
    case TransportError::ConnectionFailed: return "connection_failed";
    case TransportError::ConnectionReset: return "connection_reset";
    case TransportError::ResolveFailed: return "resolve_failed";
    case TransportError::TlsFailure: return "tls_failure";
    case TransportError::ProtocolError: return "protocol_error";
    case TransportError::InvalidRequest: return "invalid_request";
  }
  return "unknown";
}

std::string HttpResponse::GetHeader(const std::string& name) const {
  auto it = headers.find(ToLower(name));
  return it != headers.end() ? it->second : std::string();
}

void HttpResponse::SetHeader(const std::string& name, const std::string& value) {
  headers[ToLower(name)] = value;
}

std::string HttpResponse::Describe() const {
  if (HasTransportError()) {
    return std::string(ToString(error)) + ": " + error_message;
  }
  return "HTTP " + std::to_string(status_code);
}

HttpResponse HttpResponse::FromError(TransportError error, const std::string& message) {
  HttpResponse response;
  response.error = error;
  response.error_message = message;
  return response;
}

}  // namespace voxguard
