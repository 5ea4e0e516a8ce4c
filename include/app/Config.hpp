#pragma once

#include <string>
#include <utility>
#include <vector>
#include "model/Telemetry.hpp"

namespace devtel::app {

struct Settings {
  // Flattened [devices] section handed to startup functions
  devtel::model::ConfigMap devices;
  bool log_backends{false};
  // File the settings came from, empty when none was read
  std::string source;
};

// $XDG_CONFIG_HOME/devtel/config.toml, else ~/.config/devtel/config.toml.
std::string config_file_path();

// Resolve settings: TOML file -> DEVTEL_DEVICE_* environment -> overrides.
// A missing file is not an error; an explicitly named one that cannot be
// read is reported through err (settings still resolve from env/overrides).
Settings load_settings(const std::string& path, bool path_is_explicit,
                       const std::vector<std::pair<std::string, std::string>>& overrides,
                       std::string& err);

// DEVTEL_DEVICE_AMD_REFRESH -> "amd-refresh"; empty if not a device variable.
std::string device_key_from_env(const std::string& var);

} // namespace devtel::app
