#pragma once
#include <string>
#include "model/Telemetry.hpp"

namespace devtel::backends {

// Each reader works on one sysfs device directory and fails independently.

// First hwmon temp*_input, millidegrees rounded half-up to whole degrees.
bool read_amd_temp(const std::string& device_path, int& out, std::string& err);

// gpu_busy_percent
bool read_amd_busy(const std::string& device_path, int& out, std::string& err);

// mem_info_vram_{total,used}, falling back to the mem_info_vis_vram_* pair.
// A zero total is an error rather than a 0% reading.
bool read_amd_vram(const std::string& device_path, devtel::model::MemoryInfo& out, std::string& err);

} // namespace devtel::backends
