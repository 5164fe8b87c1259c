#pragma once

#include <chrono>
#include <string>

#include "config/config.pb.h"

namespace codereview::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so field names and
  value formats follow the protobuf JSON mapping (durations as "30s").
  Unknown keys are rejected. Errors are reported as util::InvalidArgument.
*/
class ConfigLoader {
 public:
  static codereview::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static codereview::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  // Fills unset sections with built-in defaults and checks the result.
  static void Finalize(codereview::runtime::config::RuntimeConfig* config);
};

// Defaults for unset durations.
inline constexpr std::chrono::milliseconds kDefaultGeneratorDeadline{120000};
inline constexpr std::chrono::milliseconds kDefaultIdleTimeout{60000};
inline constexpr std::chrono::milliseconds kDefaultHeartbeatInterval{15000};
inline constexpr std::chrono::milliseconds kDefaultMaintenanceInterval{30000};

} // namespace codereview::config
