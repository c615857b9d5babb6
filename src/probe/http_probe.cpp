#include "probe/http_probe.hpp"

#include "core/logging/logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>

#include <iterator>
#include <string>
#include <utility>

namespace devtask::probe {

namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

constexpr unsigned kHttp11 = 11;

// One request/response exchange driven on the caller's thread. Handlers chain
// resolve -> connect -> write -> read; `io.run()` returns once the chain ends.
// All stages share one deadline fixed in Start().
class ProbeSession {
public:
  ProbeSession(asio::io_context& io, const ProbeTarget& target,
               std::chrono::milliseconds timeout, core::logging::Logger& logger)
      : target_(target),
        timeout_(timeout),
        logger_(logger),
        resolver_(io),
        resolve_deadline_(io),
        stream_(io) {}

  void Start() {
    request_.method(http::verb::get);
    request_.target(target_.path);
    request_.version(kHttp11);
    request_.set(http::field::host, FormatHostHeader(target_));
    request_.set(http::field::user_agent, kProbeUserAgent);
    request_.set(http::field::accept, "*/*");

    parser_.body_limit(kMaxResponseBodyBytes);

    deadline_ = std::chrono::steady_clock::now() + timeout_;

    // The resolver has no expiry of its own.
    resolve_deadline_.expires_at(deadline_);
    resolve_deadline_.async_wait([this](const beast::error_code& ec) {
      if (!ec) {
        resolver_.cancel();
      }
    });

    logger_.Debug("resolving probe host", {{"host", target_.host}});
    resolver_.async_resolve(
        target_.host, std::to_string(target_.port),
        [this](const beast::error_code& ec, tcp::resolver::results_type results) {
          OnResolve(ec, std::move(results));
        });
  }

  // Writes the dump for a completed exchange; no-op after a failure.
  void WriteResponse(std::ostream& out) {
    if (!result_.ok) {
      return;
    }

    const auto& response = parser_.get();
    out << "HTTP/" << response.version() / 10 << '.' << response.version() % 10 << ' '
        << response.result_int() << ' ' << response.reason() << "\r\n";
    for (const auto& field : response.base()) {
      out << field.name_string() << ": " << field.value() << "\r\n";
    }
    out << "\r\n" << response.body();
    out.flush();
  }

  const ProbeResult& Result() const {
    return result_;
  }

private:
  void OnResolve(const beast::error_code& ec, tcp::resolver::results_type results) {
    resolve_deadline_.cancel();
    if (ec) {
      Fail(ProbeStage::kResolve, ec);
      return;
    }

    logger_.Debug("connecting to probe target", {{"url", FormatProbeUrl(target_)}});
    stream_.expires_at(deadline_);
    stream_.async_connect(
        results, [this](const beast::error_code& connect_ec, const tcp::endpoint& endpoint) {
          OnConnect(connect_ec, endpoint);
        });
  }

  void OnConnect(const beast::error_code& ec, const tcp::endpoint& endpoint) {
    if (ec) {
      Fail(ProbeStage::kConnect, ec);
      return;
    }

    logger_.Debug("connected", {{"endpoint", endpoint.address().to_string() + ":" +
                                                 std::to_string(endpoint.port())}});
    stream_.expires_at(deadline_);
    http::async_write(stream_, request_,
                      [this](const beast::error_code& write_ec, std::size_t bytes) {
                        OnWrite(write_ec, bytes);
                      });
  }

  void OnWrite(const beast::error_code& ec, const std::size_t bytes) {
    if (ec) {
      Fail(ProbeStage::kWrite, ec);
      return;
    }

    logger_.Debug("request sent", {{"bytes", std::to_string(bytes)}});
    stream_.expires_at(deadline_);
    http::async_read(stream_, buffer_, parser_,
                     [this](const beast::error_code& read_ec, std::size_t read_bytes) {
                       OnRead(read_ec, read_bytes);
                     });
  }

  void OnRead(const beast::error_code& ec, const std::size_t bytes) {
    if (ec) {
      Fail(ProbeStage::kRead, ec);
      return;
    }

    const auto& response = parser_.get();
    result_.ok = true;
    result_.error_code = ProbeErrorCode::kNone;
    result_.status_code = response.result_int();
    result_.header_count = static_cast<std::size_t>(
        std::distance(response.base().begin(), response.base().end()));

    logger_.Debug("response received", {{"status", std::to_string(result_.status_code)},
                                        {"bytes", std::to_string(bytes)}});

    beast::error_code shutdown_ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
    if (shutdown_ec && shutdown_ec != beast::errc::not_connected) {
      logger_.Debug("socket shutdown failed", {{"error", shutdown_ec.message()}});
    }
  }

  void Fail(const ProbeStage stage, const beast::error_code& ec) {
    result_.ok = false;
    result_.error_code = ClassifyProbeError(stage, ec);
    result_.error = std::string(ToString(stage)) + " " + FormatProbeUrl(target_) + ": " +
                    ec.message();
    logger_.Debug("probe failed", {{"stage", ToString(stage)},
                                  {"error_code", ToStableErrorCode(result_.error_code)},
                                  {"error", ec.message()}});
  }

  const ProbeTarget& target_;
  const std::chrono::milliseconds timeout_;
  std::chrono::steady_clock::time_point deadline_;
  core::logging::Logger& logger_;
  tcp::resolver resolver_;
  asio::steady_timer resolve_deadline_;
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::empty_body> request_;
  http::response_parser<http::string_body> parser_;
  ProbeResult result_;
};

} // namespace

ProbeResult RunHttpProbe(const ProbeTarget& target, const std::chrono::milliseconds timeout,
                         std::ostream& out, core::logging::Logger& logger) {
  std::string error;
  if (!ValidateProbeTarget(target, error)) {
    ProbeResult invalid;
    invalid.error_code = ProbeErrorCode::kInvalidTarget;
    invalid.error = error;
    logger.Debug("probe target rejected", {{"error", error}});
    return invalid;
  }

  asio::io_context io;
  ProbeSession session(io, target, timeout, logger);
  session.Start();
  io.run();

  session.WriteResponse(out);
  return session.Result();
}

} // namespace devtask::probe
