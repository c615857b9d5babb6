#pragma once

#include "probe/probe_error.hpp"
#include "probe/probe_target.hpp"

#include <chrono>
#include <cstddef>
#include <ostream>
#include <string>

namespace devtask::core::logging {
class Logger;
}

namespace devtask::probe {

// DEVTASK_VERSION comes from project(VERSION) in CMakeLists.txt.
inline constexpr const char* kProbeUserAgent = "devtask/" DEVTASK_VERSION;

// Upper bound for a buffered response body.
inline constexpr std::size_t kMaxResponseBodyBytes = 64U * 1024U * 1024U;

struct ProbeResult {
  bool ok = false;
  ProbeErrorCode error_code = ProbeErrorCode::kNone;
  std::string error;
  unsigned status_code = 0;
  std::size_t header_count = 0;
};

// Sends one `GET <path>` to the target and dumps the response to `out` the way
// `curl -i` shows it: status line, headers in receipt order, blank line, body.
//
// Any HTTP status counts as success. `timeout` is one budget for the whole
// exchange (resolve, connect, write, read), not a per-stage allowance; there
// is exactly one connection attempt. Nothing is written to `out` when the
// probe fails. A host lookup already inside getaddrinfo cannot be interrupted,
// so a stalled resolver can still hold the call past the budget; the default
// target resolves through the hosts file.
ProbeResult RunHttpProbe(const ProbeTarget& target, std::chrono::milliseconds timeout,
                         std::ostream& out, core::logging::Logger& logger);

} // namespace devtask::probe
