#include "probe/probe_error.hpp"

#include <boost/asio/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>

namespace devtask::probe {

namespace {

std::string BuildActionableMessage(const ProbeErrorCode code) {
  switch (code) {
  case ProbeErrorCode::kNone:
    return "no error";
  case ProbeErrorCode::kInvalidTarget:
    return "Probe target is invalid; check host, port and path.";
  case ProbeErrorCode::kResolveFailed:
    return "Could not resolve the server host name.";
  case ProbeErrorCode::kConnectionRefused:
    return "Connection refused; is the server running and listening on the port?";
  case ProbeErrorCode::kTimeout:
    return "Server did not answer in time; check that it accepts and responds to requests.";
  case ProbeErrorCode::kConnectFailed:
    return "Could not talk to the server over TCP.";
  case ProbeErrorCode::kProtocolError:
    return "Server replied with something that is not a complete HTTP response.";
  }
  return "unknown probe failure";
}

bool IsTimeout(const boost::system::error_code& ec) {
  return ec == boost::beast::error::timeout || ec == boost::asio::error::timed_out ||
         ec == boost::asio::error::operation_aborted;
}

bool IsHttpParseError(const boost::system::error_code& ec) {
  const boost::system::error_code http_error = boost::beast::http::error::end_of_stream;
  return ec.category() == http_error.category();
}

} // namespace

std::string_view ToStableErrorCode(const ProbeErrorCode code) {
  switch (code) {
  case ProbeErrorCode::kNone:
    return "PROBE_OK";
  case ProbeErrorCode::kInvalidTarget:
    return "PROBE_INVALID_TARGET";
  case ProbeErrorCode::kResolveFailed:
    return "PROBE_RESOLVE_FAILED";
  case ProbeErrorCode::kConnectionRefused:
    return "PROBE_CONNECTION_REFUSED";
  case ProbeErrorCode::kTimeout:
    return "PROBE_TIMEOUT";
  case ProbeErrorCode::kConnectFailed:
    return "PROBE_CONNECT_FAILED";
  case ProbeErrorCode::kProtocolError:
    return "PROBE_PROTOCOL_ERROR";
  }
  return "PROBE_UNKNOWN";
}

std::string_view ToString(const ProbeStage stage) {
  switch (stage) {
  case ProbeStage::kResolve:
    return "resolve";
  case ProbeStage::kConnect:
    return "connect";
  case ProbeStage::kWrite:
    return "write";
  case ProbeStage::kRead:
    return "read";
  }
  return "unknown";
}

bool IsConnectionError(const ProbeErrorCode code) {
  switch (code) {
  case ProbeErrorCode::kResolveFailed:
  case ProbeErrorCode::kConnectionRefused:
  case ProbeErrorCode::kTimeout:
  case ProbeErrorCode::kConnectFailed:
    return true;
  case ProbeErrorCode::kNone:
  case ProbeErrorCode::kInvalidTarget:
  case ProbeErrorCode::kProtocolError:
    return false;
  }
  return false;
}

ProbeErrorCode ClassifyProbeError(const ProbeStage stage, const boost::system::error_code& ec) {
  if (!ec) {
    return ProbeErrorCode::kNone;
  }
  if (IsTimeout(ec)) {
    return ProbeErrorCode::kTimeout;
  }

  switch (stage) {
  case ProbeStage::kResolve:
    return ProbeErrorCode::kResolveFailed;
  case ProbeStage::kConnect:
    if (ec == boost::asio::error::connection_refused) {
      return ProbeErrorCode::kConnectionRefused;
    }
    return ProbeErrorCode::kConnectFailed;
  case ProbeStage::kWrite:
    return ProbeErrorCode::kConnectFailed;
  case ProbeStage::kRead:
    // A peer that closes or resets before a full response arrives, or sends
    // bytes the parser rejects, did not produce an HTTP response.
    if (IsHttpParseError(ec) || ec == boost::asio::error::eof ||
        ec == boost::asio::error::connection_reset) {
      return ProbeErrorCode::kProtocolError;
    }
    return ProbeErrorCode::kConnectFailed;
  }
  return ProbeErrorCode::kConnectFailed;
}

std::string FormatProbeError(const ProbeErrorCode code, std::string_view detail) {
  std::string formatted(ToStableErrorCode(code));
  formatted += ": ";
  formatted += BuildActionableMessage(code);
  if (!detail.empty()) {
    formatted += " detail: ";
    formatted += detail;
  }
  return formatted;
}

} // namespace devtask::probe
