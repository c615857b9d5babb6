#pragma once

#include <cstdint>
#include <string>

namespace devtask::probe {

// Where the `check` task sends its request. The server behind it is an
// external collaborator; devtask never starts or manages it.
struct ProbeTarget {
  std::string host;
  std::uint32_t port = 0;
  std::string path;
};

inline constexpr const char* kDefaultProbeHost = "localhost";
inline constexpr std::uint32_t kDefaultProbePort = 4221U;
inline constexpr const char* kDefaultProbePath = "/";

// Compiled-in target used by the default task table.
ProbeTarget DefaultProbeTarget();

// Host non-empty, port in [1, 65535], path non-empty and starting with '/'.
bool ValidateProbeTarget(const ProbeTarget& target, std::string& error);

// "http://<host>:<port><path>" for diagnostics.
std::string FormatProbeUrl(const ProbeTarget& target);

// Value for the Host request header. The port is omitted when it is 80.
std::string FormatHostHeader(const ProbeTarget& target);

} // namespace devtask::probe
