#pragma once

#include <chrono>
#include <string>

#include <google/protobuf/duration.pb.h>

#include "config/config.pb.h"

namespace bolt::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset fields are
  filled with defaults afterwards.
*/
class ConfigLoader {
 public:
  static bolt::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(bolt::runtime::config::RuntimeConfig* config);
};

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& duration);

} // namespace bolt::config
