#include "../common/assertions.hpp"
#include "../common/local_http_responder.hpp"
#include "core/logging/logger.hpp"
#include "probe/http_probe.hpp"

#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>

namespace {

using devtask::probe::ProbeErrorCode;
using devtask::probe::ProbeResult;
using devtask::probe::ProbeTarget;
using devtask::tests::common::AssertContains;
using devtask::tests::common::AssertOrdered;
using devtask::tests::common::Fail;
using devtask::tests::common::LocalHttpResponder;

ProbeTarget LoopbackTarget(std::uint32_t port) {
  return ProbeTarget{"127.0.0.1", port, "/"};
}

ProbeResult Probe(const ProbeTarget& target, std::chrono::milliseconds timeout, std::string& out) {
  std::ostringstream out_stream;
  std::ostringstream log_stream;
  devtask::core::logging::Logger logger(devtask::core::logging::LogLevel::kDebug, log_stream);
  const ProbeResult result = devtask::probe::RunHttpProbe(target, timeout, out_stream, logger);
  out = out_stream.str();
  return result;
}

void ProbeDumpsStatusHeadersAndBody() {
  LocalHttpResponder responder("HTTP/1.1 200 OK\r\n"
                               "Content-Type: text/plain\r\n"
                               "X-Trace: abc\r\n"
                               "Content-Length: 5\r\n"
                               "Connection: close\r\n"
                               "\r\n"
                               "hello");

  std::string out;
  const ProbeResult result =
      Probe(LoopbackTarget(responder.Port()), std::chrono::milliseconds(2'000), out);
  responder.Join();

  if (!result.ok) {
    Fail("expected probe success, got: " + result.error);
  }
  if (result.status_code != 200U || result.header_count != 4U) {
    Fail("unexpected status or header count in probe result");
  }

  AssertContains(out, "HTTP/1.1 200 OK\r\n");
  AssertOrdered(out, "HTTP/1.1 200 OK", "Content-Type: text/plain");
  AssertOrdered(out, "Content-Type: text/plain", "X-Trace: abc");
  AssertOrdered(out, "X-Trace: abc", "Content-Length: 5");
  AssertOrdered(out, "Content-Length: 5", "Connection: close");
  AssertContains(out, "\r\n\r\nhello");

  const std::string& request = responder.ReceivedRequest();
  AssertContains(request, "GET / HTTP/1.1\r\n");
  AssertContains(request, "Host: 127.0.0.1:" + std::to_string(responder.Port()));
  AssertContains(request, std::string("User-Agent: devtask/") + DEVTASK_VERSION + "\r\n");
}

void ProbeTreatsErrorStatusAsValidResult() {
  LocalHttpResponder responder("HTTP/1.1 404 Not Found\r\n"
                               "Content-Length: 0\r\n"
                               "\r\n");

  std::string out;
  const ProbeResult result =
      Probe(LoopbackTarget(responder.Port()), std::chrono::milliseconds(2'000), out);
  responder.Join();

  if (!result.ok || result.status_code != 404U) {
    Fail("a 404 reply must still count as a successful probe");
  }
  AssertContains(out, "HTTP/1.1 404 Not Found\r\n");
  AssertContains(out, "Content-Length: 0\r\n");
}

void ProbeReadsBodyUntilClose() {
  LocalHttpResponder responder("HTTP/1.1 500 Internal Server Error\r\n"
                               "Server: dev\r\n"
                               "\r\n"
                               "boom");

  std::string out;
  const ProbeResult result =
      Probe(LoopbackTarget(responder.Port()), std::chrono::milliseconds(2'000), out);
  responder.Join();

  if (!result.ok || result.status_code != 500U) {
    Fail("expected close-delimited 500 reply to be read in full");
  }
  AssertContains(out, "HTTP/1.1 500 Internal Server Error\r\nServer: dev\r\n\r\nboom");
}

void ProbeReportsRefusedConnection() {
  const std::uint32_t port = devtask::tests::common::ReserveClosedPort();

  std::string out;
  const auto started = std::chrono::steady_clock::now();
  const ProbeResult result = Probe(LoopbackTarget(port), std::chrono::milliseconds(2'000), out);
  const auto elapsed = std::chrono::steady_clock::now() - started;

  if (result.ok || result.error_code != ProbeErrorCode::kConnectionRefused) {
    Fail("expected PROBE_CONNECTION_REFUSED for a closed port");
  }
  if (!devtask::probe::IsConnectionError(result.error_code)) {
    Fail("refused connection must be a connection error");
  }
  if (elapsed > std::chrono::milliseconds(2'500)) {
    Fail("refused probe took longer than its timeout");
  }
  if (!out.empty()) {
    Fail("failed probe must not write a response dump");
  }
  AssertContains(result.error, "connect http://127.0.0.1:");
}

void ProbeTimesOutOnSilentServer() {
  LocalHttpResponder responder("");

  std::string out;
  const auto started = std::chrono::steady_clock::now();
  const ProbeResult result =
      Probe(LoopbackTarget(responder.Port()), std::chrono::milliseconds(300), out);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  responder.Join();

  if (result.ok || result.error_code != ProbeErrorCode::kTimeout) {
    Fail("expected PROBE_TIMEOUT for a server that never answers");
  }
  if (elapsed > std::chrono::milliseconds(3'000)) {
    Fail("silent-server probe did not honour its timeout");
  }
  if (!out.empty()) {
    Fail("timed out probe must not write a response dump");
  }
}

// The reply is held back past the whole budget; the exchange must give up at
// the shared deadline even though connect and write already spent part of it.
void ExchangeHonoursOneBudgetAcrossStages() {
  LocalHttpResponder responder("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n",
                               std::chrono::milliseconds(1'500));

  std::string out;
  const auto started = std::chrono::steady_clock::now();
  const ProbeResult result =
      Probe(LoopbackTarget(responder.Port()), std::chrono::milliseconds(400), out);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  responder.Join();

  if (result.ok || result.error_code != ProbeErrorCode::kTimeout) {
    Fail("expected PROBE_TIMEOUT when the reply arrives after the deadline");
  }
  if (elapsed > std::chrono::milliseconds(1'200)) {
    Fail("exchange ran past its single timeout budget");
  }
  if (!out.empty()) {
    Fail("timed out exchange must not write a response dump");
  }
}

void FailuresLogOnlyAtDebugLevel() {
  const std::uint32_t port = devtask::tests::common::ReserveClosedPort();
  std::ostringstream out;
  std::ostringstream log;
  devtask::core::logging::Logger logger(devtask::core::logging::LogLevel::kInfo, log);
  const ProbeResult result = devtask::probe::RunHttpProbe(
      LoopbackTarget(port), std::chrono::milliseconds(2'000), out, logger);
  if (result.ok) {
    Fail("expected closed port to fail");
  }
  if (!log.str().empty()) {
    Fail("failure must leave only the caller's diagnostic, got log: " + log.str());
  }
}

void ProbeRejectsNonHttpReply() {
  LocalHttpResponder responder("SSH-2.0-OpenSSH_9.6\r\n\r\n");

  std::string out;
  const ProbeResult result =
      Probe(LoopbackTarget(responder.Port()), std::chrono::milliseconds(2'000), out);
  responder.Join();

  if (result.ok || result.error_code != ProbeErrorCode::kProtocolError) {
    Fail("expected PROBE_PROTOCOL_ERROR for a non-HTTP reply");
  }
}

void ProbeRejectsInvalidTarget() {
  std::string out;
  const ProbeResult result =
      Probe(ProbeTarget{"127.0.0.1", 0U, "/"}, std::chrono::milliseconds(100), out);
  if (result.ok || result.error_code != ProbeErrorCode::kInvalidTarget) {
    Fail("expected PROBE_INVALID_TARGET for port 0");
  }
}

} // namespace

int main() {
  ProbeDumpsStatusHeadersAndBody();
  ProbeTreatsErrorStatusAsValidResult();
  ProbeReadsBodyUntilClose();
  ProbeReportsRefusedConnection();
  ProbeTimesOutOnSilentServer();
  ExchangeHonoursOneBudgetAcrossStages();
  FailuresLogOnlyAtDebugLevel();
  ProbeRejectsNonHttpReply();
  ProbeRejectsInvalidTarget();
  return 0;
}
