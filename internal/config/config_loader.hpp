#pragma once

#include <string>

#include "config/config.pb.h"

namespace chatlog::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Unset tunables are filled by ApplyDefaults().
*/
class ConfigLoader {
 public:
  static chatlog::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static chatlog::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(chatlog::runtime::config::RuntimeConfig* config);
};

// Defaults for zero-valued tunables.
inline constexpr uint32_t kDefaultPageSize             = 10000;
inline constexpr uint32_t kDefaultLockTimeoutMs        = 5000;
inline constexpr uint32_t kDefaultBusyTimeoutMs        = 5000;
inline constexpr uint32_t kDefaultMaxConnections       = 16;
inline constexpr uint32_t kDefaultStatementTimeoutMs   = 30000;
inline constexpr uint32_t kDefaultAcquireTimeoutMs     = 10000;
inline constexpr uint32_t kDefaultCatchUpIntervalMs    = 5000;
inline constexpr uint32_t kDefaultCatchUpBatchSize     = 500;
inline constexpr uint32_t kDefaultRetryBackoffMs       = 1000;
inline constexpr uint32_t kDefaultSweepIntervalMs      = 30000;
inline constexpr uint32_t kDefaultStreamingTimeoutMs   = 300000;

} // namespace chatlog::config
