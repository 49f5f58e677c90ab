#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace relay::config {

inline constexpr char    kDefaultStoragePrefix[]       = "wc@2:client:";
inline constexpr char    kDefaultRelayProtocol[]       = "irn";
inline constexpr int64_t kDefaultHeartbeatIntervalSecs = 5;
inline constexpr int32_t kMinHeartbeatIntervalNanos    = 1000000;
inline constexpr int64_t kDefaultPublishTtlSecs        = 86400;

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Missing sections
  are filled with defaults; invalid values throw util::InvalidArgument.
*/
class ConfigLoader {
 public:
  static relay::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static relay::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(relay::runtime::config::RuntimeConfig& config);
};

} // namespace relay::config
