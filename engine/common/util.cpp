#include "util.hpp"
#include <algorithm>
#include <cctype>

namespace voxguard {
namespace engine {
namespace common {

ParsedUrl ParseUrl(const std::string& url) {
  ParsedUrl result;
  result.path = "/";

  // Find protocol separator "://"
  size_t protocol_end = url.find("://");
  if (protocol_end == std::string::npos) {
    return result;
  }

  result.scheme = url.substr(0, protocol_end);
  std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  result.port = result.scheme == "https" ? "443" : "80";

  std::string rest = url.substr(protocol_end + 3);

  // Path starts at the first '/' or '?', whichever comes first
  size_t path_start = rest.find_first_of("/?");
  std::string host_port = rest.substr(0, path_start);
  if (path_start != std::string::npos) {
    result.path = rest.substr(path_start);
    if (result.path[0] == '?') {
      result.path = "/" + result.path;
    }
  }

  size_t colon = host_port.find(':');
  if (colon != std::string::npos) {
    result.host = host_port.substr(0, colon);
    std::string port = host_port.substr(colon + 1);
    if (!port.empty()) {
      result.port = port;
    }
  } else {
    result.host = host_port;
  }

  return result;
}

std::string JoinUrl(const std::string& base_url, const std::string& path) {
  if (path.empty()) {
    return base_url;
  }
  bool base_slash = !base_url.empty() && base_url.back() == '/';
  bool path_slash = path.front() == '/';
  if (base_slash && path_slash) {
    return base_url + path.substr(1);
  }
  if (!base_slash && !path_slash) {
    return base_url + "/" + path;
  }
  return base_url + path;
}

}  // namespace common
}  // namespace engine
}  // namespace voxguard
