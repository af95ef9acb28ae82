#pragma once

#include <string>

#include "config/config.pb.h"

namespace ledger::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys
  are rejected. Zero-valued settings are replaced by defaults afterwards.
*/
class ConfigLoader {
 public:
  static ledger::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static ledger::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills unset fields and rejects inconsistent values.
  static void ApplyDefaults(ledger::runtime::config::RuntimeConfig& config);
};

} // namespace ledger::config
