#pragma once

#include <filesystem>
#include <string>

#include "config/config.pb.h"

namespace jobflow::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a protobuf Value, rendered as JSON, then parsed into
  RuntimeConfig so unknown keys are rejected by the JSON parser.

  Relative paths (store, content root, log file) in a file loaded with
  LoadFromYaml are taken relative to that file's directory, so a config can
  sit next to the workflow it opens.
*/
class ConfigLoader {
 public:
  static jobflow::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static jobflow::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ResolveRelativePaths(jobflow::runtime::config::RuntimeConfig& config, const std::filesystem::path& base_dir);

  // Throws std::invalid_argument when a selected backend lacks its path or
  // the log level is not one spdlog knows.
  static void Validate(const jobflow::runtime::config::RuntimeConfig& config);
};

} // namespace jobflow::config
