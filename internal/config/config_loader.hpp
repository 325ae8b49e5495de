#pragma once

#include <string>

#include "config/config.pb.h"

namespace famgraph::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a google.protobuf.Value, then to JSON, then parsed
  into the proto. Unknown keys are rejected. Unset sections get their
  defaults (memory database, sync persistence, traversal limits 64/100000,
  view depth 2, birth-date comparison on).
*/
class ConfigLoader {
 public:
  static RuntimeConfig LoadFromYaml(const std::string& path);

  static RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills unset fields and rejects inconsistent values.
  static void ApplyDefaults(RuntimeConfig& config);
};

} // namespace famgraph::config
