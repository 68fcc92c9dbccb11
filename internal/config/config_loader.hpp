#pragma once

#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/table_spec.hpp"

namespace scd::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown fields
  are rejected by the protobuf parser. JSON files load unchanged.
*/
class ConfigLoader {
 public:
  static scd::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Engine-side view of every configured table. Does not validate;
  // core::ValidateTableSpec runs at the start of each pass.
  static std::vector<core::TableSpec> TableSpecs(const scd::runtime::config::RuntimeConfig& config);
};

} // namespace scd::config
