#pragma once

#include <string>

#include "config/config.pb.h"

namespace msgstore::config {

/*
  Loads StoreConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected. Durations use the protobuf JSON form ("30s", "1.5s").
  Throws util::InvalidConfig.
*/
class ConfigLoader {
 public:
  static msgstore::runtime::config::StoreConfig LoadFromYaml(const std::string& path);
  static msgstore::runtime::config::StoreConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace msgstore::config
