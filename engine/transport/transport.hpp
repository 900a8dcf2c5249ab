#pragma once

#include <chrono>
#include "http_types.hpp"

namespace voxguard {

/**
 * @brief Opaque request/response capability protected by the resilience layer
 *
 * Implementations report every failure through the returned HttpResponse
 * (status code or TransportError) instead of throwing, and must be safe to
 * call from several worker threads at once.
 */
class Transport {
 public:
  virtual ~Transport() = default;

  /**
   * @brief Send one request
   *
   * @param request Fully built request (URL, headers, body)
   * @param timeout Upper bound for connect + write + read
   * @return Response with status, or a transport error
   */
  virtual HttpResponse Send(const HttpRequest& request, std::chrono::milliseconds timeout) = 0;
};

}  // namespace voxguard
