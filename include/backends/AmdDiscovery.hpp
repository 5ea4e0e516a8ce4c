#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "util/IdTable.hpp"

namespace devtel::backends {

inline constexpr uint32_t kAmdVendorId = 0x1002;
inline constexpr const char* kDrmRoot = "/sys/class/drm";
inline constexpr const char* kAmdgpuDriverRoot = "/sys/bus/pci/drivers/amdgpu";
inline constexpr const char* kPciDevicesRoot = "/sys/bus/pci/devices";

struct AmdGpu {
  std::string label;        // unique within one discovery pass
  std::string device_path;  // sysfs device directory, re-read every cycle
  std::string card;         // drm card name or PCI address
};

// Basename of <device_path>/driver, empty when unbound.
std::string driver_name(const std::string& device_path);

// Enumerate AMD GPUs via /sys/class/drm, falling back to the amdgpu driver
// binding directory when the class scan finds none. Returns false only
// when a directory that should be listable cannot be read.
bool discover_amd_gpus(const devtel::util::IdTable& ids, std::vector<AmdGpu>& out, std::string& err);

} // namespace devtel::backends
