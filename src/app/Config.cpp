#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include <cctype>
#include <cstdlib>
#include <string>

extern char** environ;

namespace devtel::app {

// Accepts DEVTEL_X or devtel_x
static const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("DEVTEL_", 0) == 0) {
    alt = std::string("devtel_") + n.substr(7);
  } else if (n.rfind("devtel_", 0) == 0) {
    alt = std::string("DEVTEL_") + n.substr(7);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/devtel/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/devtel/config.toml";
  return {};
}

std::string device_key_from_env(const std::string& var) {
  static const std::string prefix = "DEVTEL_DEVICE_";
  if (var.size() <= prefix.size() || var.compare(0, prefix.size(), prefix) != 0) return {};
  std::string key = var.substr(prefix.size());
  for (auto& c : key) {
    if (c == '_') c = '-';
    else c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return key;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const devtel::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

Settings load_settings(const std::string& path, bool path_is_explicit,
                       const std::vector<std::pair<std::string, std::string>>& overrides,
                       std::string& err) {
  Settings s{};
  devtel::util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);
  if (have_toml) s.source = path;
  else if (path_is_explicit) err = "cannot read config file " + path;

  // --- [devices] ---
  if (have_toml) {
    for (const auto& [k, v] : toml.entries("devices")) s.devices[k] = v;
  }
  // Environment is more specific than the file
  for (char** e = environ; e && *e; ++e) {
    std::string entry(*e);
    auto eq = entry.find('=');
    if (eq == std::string::npos) continue;
    auto key = device_key_from_env(entry.substr(0, eq));
    if (!key.empty()) s.devices[key] = entry.substr(eq + 1);
  }
  // Command line wins
  for (const auto& [k, v] : overrides) s.devices[k] = v;

  // --- [devtel] ---
  s.log_backends = resolve_bool(toml, have_toml, "devtel", "log_backends", "DEVTEL_LOG_BACKENDS", false);
  return s;
}

} // namespace devtel::app
