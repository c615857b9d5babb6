#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace devtask::core::config {

inline constexpr const char* kLogLevelEnv = "DEVTASK_LOG_LEVEL";
inline constexpr const char* kProbeTimeoutEnv = "DEVTASK_PROBE_TIMEOUT_MS";

inline constexpr std::chrono::milliseconds kDefaultProbeTimeout{5'000};
inline constexpr std::chrono::milliseconds kMaxProbeTimeout{600'000};

// Process-wide knobs read once at startup. The probe target is deliberately
// absent: it is a compiled-in constant, not a setting.
struct Settings {
  logging::LogLevel log_level = logging::LogLevel::kWarn;
  std::chrono::milliseconds probe_timeout = kDefaultProbeTimeout;
};

// Parses a timeout in whole milliseconds. Accepts [1, kMaxProbeTimeout].
bool ParseTimeoutMillis(std::string_view raw, std::chrono::milliseconds& timeout,
                        std::string& error);

// Applies `DEVTASK_LOG_LEVEL` and `DEVTASK_PROBE_TIMEOUT_MS` on top of the
// defaults. Unset or empty variables keep the default; malformed values fail.
bool LoadSettingsFromEnvironment(Settings& settings, std::string& error);

} // namespace devtask::core::config
