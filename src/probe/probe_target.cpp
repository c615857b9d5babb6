#include "probe/probe_target.hpp"

namespace devtask::probe {

ProbeTarget DefaultProbeTarget() {
  ProbeTarget target;
  target.host = kDefaultProbeHost;
  target.port = kDefaultProbePort;
  target.path = kDefaultProbePath;
  return target;
}

bool ValidateProbeTarget(const ProbeTarget& target, std::string& error) {
  error.clear();
  if (target.host.empty()) {
    error = "probe host cannot be empty";
    return false;
  }
  if (target.port < 1U || target.port > 65535U) {
    error = "probe port must be in [1, 65535], got " + std::to_string(target.port);
    return false;
  }
  if (target.path.empty() || target.path.front() != '/') {
    error = "probe path must start with '/': '" + target.path + "'";
    return false;
  }
  return true;
}

std::string FormatProbeUrl(const ProbeTarget& target) {
  return "http://" + target.host + ":" + std::to_string(target.port) + target.path;
}

std::string FormatHostHeader(const ProbeTarget& target) {
  if (target.port == 80U) {
    return target.host;
  }
  return target.host + ":" + std::to_string(target.port);
}

} // namespace devtask::probe
