#include "backends/AmdReaders.hpp"
#include "util/Procfs.hpp"
#include "util/Sysfs.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

namespace devtel::backends {

static bool first_hwmon_path(const std::string& device_path, std::string& out, std::string& err) {
  std::string root = device_path + "/hwmon";
  std::vector<std::string> entries;
  int e = 0;
  if (!devtel::util::list_dir(root, entries, e)) {
    err = "cannot read " + root + ": " + std::strerror(e);
    return false;
  }
  for (const auto& name : entries) {
    std::string p = root + "/" + name;
    if (devtel::util::is_directory(p)) { out = p; return true; }
  }
  err = "AMD GPU error: no hwmon directory under " + root;
  return false;
}

static bool first_matching_file(const std::string& dir, const std::string& prefix, const std::string& suffix,
                                std::string& out, std::string& err) {
  std::vector<std::string> entries;
  int e = 0;
  if (!devtel::util::list_dir(dir, entries, e)) {
    err = "cannot read " + dir + ": " + std::strerror(e);
    return false;
  }
  for (const auto& name : entries) {
    if (name.size() < prefix.size() + suffix.size()) continue;
    if (!name.starts_with(prefix) || !name.ends_with(suffix)) continue;
    std::string p = dir + "/" + name;
    if (devtel::util::is_regular_file(p)) { out = p; return true; }
  }
  err = "AMD GPU error: no " + prefix + "*" + suffix + " file found in " + dir;
  return false;
}

bool read_amd_temp(const std::string& device_path, int& out, std::string& err) {
  std::string hwmon, input;
  if (!first_hwmon_path(device_path, hwmon, err)) return false;
  if (!first_matching_file(hwmon, "temp", "_input", input, err)) return false;
  long long mdeg = 0;
  if (!devtel::util::read_int_file(input, mdeg, err)) return false;
  out = static_cast<int>((mdeg + 500) / 1000);
  return true;
}

bool read_amd_busy(const std::string& device_path, int& out, std::string& err) {
  long long v = 0;
  if (!devtel::util::read_int_file(device_path + "/gpu_busy_percent", v, err)) return false;
  out = static_cast<int>(v);
  return true;
}

bool read_amd_vram(const std::string& device_path, devtel::model::MemoryInfo& out, std::string& err) {
  uint64_t total = 0, used = 0;
  if (!devtel::util::read_u64_file(device_path + "/mem_info_vram_total", total, err) &&
      !devtel::util::read_u64_file(device_path + "/mem_info_vis_vram_total", total, err)) {
    return false;
  }
  if (!devtel::util::read_u64_file(device_path + "/mem_info_vram_used", used, err) &&
      !devtel::util::read_u64_file(device_path + "/mem_info_vis_vram_used", used, err)) {
    return false;
  }
  if (total == 0) {
    err = "AMD GPU error: total VRAM is zero";
    return false;
  }
  out.total = total;
  out.used = used;
  out.used_pct = (static_cast<double>(used) / static_cast<double>(total)) * 100.0;
  return true;
}

} // namespace devtel::backends
