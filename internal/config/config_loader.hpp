#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace strands::config {

inline constexpr const char* kDefaultBindAddress            = "0.0.0.0:50051";
inline constexpr const char* kDefaultSenderEmail            = "no-reply@strands";
inline constexpr uint64_t    kDefaultSweepIntervalMs        = 60'000;
inline constexpr uint32_t    kDefaultLoyalCustomerMinVisits = 5;
inline constexpr const char* kDefaultServiceName            = "strands-settlement";
inline constexpr uint32_t    kDefaultMetricsIntervalMs      = 1'000;

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected; unset knobs receive the defaults above.
*/
class ConfigLoader {
 public:
  static strands::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(strands::runtime::config::RuntimeConfig& config);

 private:
  static void Validate(const strands::runtime::config::RuntimeConfig& config);
};

} // namespace strands::config
