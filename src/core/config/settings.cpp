#include "core/config/settings.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <system_error>

namespace devtask::core::config {

namespace {

const char* ReadNonEmptyEnv(const char* name) {
  const char* raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return nullptr;
  }
  return raw;
}

} // namespace

bool ParseTimeoutMillis(std::string_view raw, std::chrono::milliseconds& timeout,
                        std::string& error) {
  error.clear();
  if (raw.empty()) {
    error = std::string("missing value for ") + kProbeTimeoutEnv;
    return false;
  }

  std::uint64_t parsed = 0;
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    error = std::string("invalid ") + kProbeTimeoutEnv + " '" + std::string(raw) +
            "' (expected whole milliseconds)";
    return false;
  }

  if (parsed == 0U || parsed > static_cast<std::uint64_t>(kMaxProbeTimeout.count())) {
    error = std::string(kProbeTimeoutEnv) + " must be in [1, " +
            std::to_string(kMaxProbeTimeout.count()) + "], got " + std::string(raw);
    return false;
  }

  timeout = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(parsed));
  return true;
}

bool LoadSettingsFromEnvironment(Settings& settings, std::string& error) {
  error.clear();

  if (const char* raw = ReadNonEmptyEnv(kLogLevelEnv); raw != nullptr) {
    logging::LogLevel level = settings.log_level;
    if (!logging::ParseLogLevel(raw, kLogLevelEnv, level, error)) {
      return false;
    }
    settings.log_level = level;
  }

  if (const char* raw = ReadNonEmptyEnv(kProbeTimeoutEnv); raw != nullptr) {
    std::chrono::milliseconds timeout = settings.probe_timeout;
    if (!ParseTimeoutMillis(raw, timeout, error)) {
      return false;
    }
    settings.probe_timeout = timeout;
  }

  return true;
}

} // namespace devtask::core::config
