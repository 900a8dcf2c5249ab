#pragma once

#include <string>

namespace voxguard {
namespace engine {
namespace common {

// Parsed HTTP URL components
struct ParsedUrl {
  std::string scheme;  ///< "http" or "https"
  std::string host;
  std::string port;
  std::string path;    ///< Path plus query string, at least "/"

  bool IsTls() const { return scheme == "https"; }
  bool IsValid() const { return !host.empty() && (scheme == "http" || scheme == "https"); }
};

// Parse an HTTP URL (http:// or https://) into its components
// Example: "https://api.voxguard.example:8443/v1/voice/deepfake?x=1"
//   -> scheme="https", host="api.voxguard.example", port="8443",
//      path="/v1/voice/deepfake?x=1"
//
// A missing port defaults to 443 for https and 80 for http. A URL without
// a scheme yields an invalid result (empty scheme).
ParsedUrl ParseUrl(const std::string& url);

// Join a base URL and a path, avoiding a doubled or missing slash
std::string JoinUrl(const std::string& base_url, const std::string& path);

}  // namespace common
}  // namespace engine
}  // namespace voxguard
