#pragma once

#include <boost/system/error_code.hpp>

#include <string>
#include <string_view>

namespace devtask::probe {

// Stable classification for probe failures.
//
// Raw Asio/Beast messages depend on the platform and Boost release; wrappers
// and engineers get a grep-friendly code instead.
enum class ProbeErrorCode {
  kNone,
  kInvalidTarget,
  kResolveFailed,
  kConnectionRefused,
  kTimeout,
  kConnectFailed,
  kProtocolError,
};

// The step of the exchange an error came from.
enum class ProbeStage {
  kResolve,
  kConnect,
  kWrite,
  kRead,
};

std::string_view ToStableErrorCode(ProbeErrorCode code);

std::string_view ToString(ProbeStage stage);

// True for failures to reach the server at all (lookup, refusal, timeout,
// other transport errors), as opposed to a reply that is not HTTP.
bool IsConnectionError(ProbeErrorCode code);

ProbeErrorCode ClassifyProbeError(ProbeStage stage, const boost::system::error_code& ec);

// Returns single-line contract text:
//   "<STABLE_CODE>: <actionable_message> detail: <raw_detail>"
// The detail suffix is omitted when raw detail is empty.
std::string FormatProbeError(ProbeErrorCode code, std::string_view detail);

} // namespace devtask::probe
