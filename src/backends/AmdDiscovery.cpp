#include "backends/AmdDiscovery.hpp"
#include "backends/AmdLabel.hpp"
#include "util/Procfs.hpp"
#include "util/Sysfs.hpp"

#include <cerrno>
#include <cstring>
#include <unordered_set>

namespace devtel::backends {

static bool has_amd_vendor(const std::string& device_path) {
  uint32_t vendor = 0;
  std::string ignored;
  return devtel::util::read_id_file(device_path + "/vendor", vendor, ignored) && vendor == kAmdVendorId;
}

static std::string basename_of(const std::string& path) {
  auto pos = path.find_last_of('/');
  return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string driver_name(const std::string& device_path) {
  auto link = devtel::util::read_link(device_path + "/driver");
  if (!link) return {};
  return basename_of(*link);
}

// Two devices without a PCI slot and with the same model would collide
static void append_unique(std::vector<AmdGpu>& out, std::unordered_set<std::string>& seen, AmdGpu gpu) {
  if (!seen.insert(gpu.label).second) {
    gpu.label += "." + gpu.card;
    seen.insert(gpu.label);
  }
  out.push_back(std::move(gpu));
}

static bool discover_from_drm(const devtel::util::IdTable& ids, std::vector<AmdGpu>& out, std::string& err) {
  std::vector<std::string> entries;
  int e = 0;
  if (!devtel::util::list_dir(kDrmRoot, entries, e)) {
    err = std::string("cannot read ") + kDrmRoot + ": " + std::strerror(e);
    return false;
  }
  std::unordered_set<std::string> seen;
  for (const auto& name : entries) {
    // cardN only; connectors look like card0-DP-1
    if (name.rfind("card", 0) != 0 || name.find('-') != std::string::npos) continue;
    std::string entry = std::string(kDrmRoot) + "/" + name;
    if (!devtel::util::is_directory(entry)) continue;
    std::string device_path = entry + "/device";
    if (!has_amd_vendor(device_path)) continue;
    std::string drv = driver_name(device_path);
    if (!drv.empty() && drv != "amdgpu" && drv != "radeon") continue;
    append_unique(out, seen, AmdGpu{amd_label(name, device_path, ids), device_path, name});
  }
  return true;
}

static bool discover_from_driver(const devtel::util::IdTable& ids, std::vector<AmdGpu>& out, std::string& err) {
  std::vector<std::string> entries;
  int e = 0;
  if (!devtel::util::list_dir(kAmdgpuDriverRoot, entries, e)) {
    // Driver not loaded: nothing bound, not a failure
    if (e == ENOENT) return true;
    err = std::string("cannot read ") + kAmdgpuDriverRoot + ": " + std::strerror(e);
    return false;
  }
  static const char* const kControlFiles[] = {"bind", "unbind", "new_id", "remove_id", "uevent", "module"};
  std::unordered_set<std::string> seen;
  for (const auto& name : entries) {
    bool control = false;
    for (const char* c : kControlFiles) {
      if (name.rfind(c, 0) == 0) { control = true; break; }
    }
    if (control) continue;
    std::string device_path = std::string(kPciDevicesRoot) + "/" + name;
    if (!devtel::util::exists(device_path)) continue;
    if (!has_amd_vendor(device_path)) continue;
    append_unique(out, seen, AmdGpu{amd_label(name, device_path, ids), device_path, name});
  }
  return true;
}

bool discover_amd_gpus(const devtel::util::IdTable& ids, std::vector<AmdGpu>& out, std::string& err) {
  out.clear();
  if (!discover_from_drm(ids, out, err)) return false;
  if (!out.empty()) return true;
  return discover_from_driver(ids, out, err);
}

} // namespace devtel::backends
