#pragma once

#include <string>

#include "config/config.pb.h"

namespace workstream::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Resolve() fills
  defaults and derived paths; Validate() rejects unusable values. The
  result is built once at startup and handed to every component.
*/
class ConfigLoader {
 public:
  static workstream::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Config for a bare --project-root invocation, already resolved.
  static workstream::runtime::config::RuntimeConfig ForProjectRoot(const std::string& project_root);

  static void Resolve(workstream::runtime::config::RuntimeConfig& config);
  static void Validate(const workstream::runtime::config::RuntimeConfig& config);
};

} // namespace workstream::config
