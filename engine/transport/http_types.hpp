#pragma once

#include <map>
#include <string>

namespace voxguard {

// Transport-level failure kinds (no HTTP status was received)
enum class TransportError {
  None,
  Timeout,
  ConnectionFailed,
  ConnectionReset,
  ResolveFailed,
  TlsFailure,
  ProtocolError,
  InvalidRequest
};

const char* ToString(TransportError error);

// Outbound request. `url` is absolute: http(s)://host[:port]/path[?query]
struct HttpRequest {
  std::string method = "POST";
  std::string url;
  std::map<std::string, std::string> headers;
  std::string content_type;
  std::string body;
};

// Result of one transport call. Either an HTTP status was received
// (error == None) or the call failed below HTTP.
struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;  ///< Keys stored lower-case
  std::string body;
  TransportError error = TransportError::None;
  std::string error_message;

  bool HasTransportError() const { return error != TransportError::None; }
  bool IsSuccess() const {
    return !HasTransportError() && status_code >= 200 && status_code < 300;
  }

  // Case-insensitive header lookup, empty string if absent
  std::string GetHeader(const std::string& name) const;
  void SetHeader(const std::string& name, const std::string& value);

  // Short human readable description ("HTTP 503" / "timeout: ...")
  std::string Describe() const;

  static HttpResponse FromError(TransportError error, const std::string& message);
};

}  // namespace voxguard
