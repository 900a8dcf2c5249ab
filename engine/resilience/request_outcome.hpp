#pragma once

#include <string>
#include "clock.hpp"
#include "engine/transport/http_types.hpp"

namespace voxguard {

// Terminal reason of one logical request. Every value must be handled by
// callers; none of them is reported by throwing.
enum class TerminalReason {
  Success,
  MaxRetriesExceeded,
  FatalClientError,
  BreakerOpen,
  RateLimited,
  Cancelled
};

const char* ToString(TerminalReason reason);

struct RequestOutcome {
  bool succeeded = false;
  int attempts_used = 0;                        ///< Transport calls made
  int retries = 0;                              ///< Backoff cycles started
  Clock::Duration total_latency{0};
  TerminalReason terminal_reason = TerminalReason::Cancelled;
  HttpResponse last_response;                   ///< Last transport result (empty if none)
  std::string error_message;

  double GetLatencyMs() const {
    return std::chrono::duration<double, std::milli>(total_latency).count();
  }
};

}  // namespace voxguard
