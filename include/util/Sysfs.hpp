#pragma once
#include <cstdint>
#include <string>

namespace devtel::util {

// Single-value sysfs leaf readers. Each returns false and fills err with a
// message naming the path when the file is missing or does not parse.

// Decimal signed integer (e.g. gpu_busy_percent, temp1_input).
bool read_int_file(const std::string& abs, long long& out, std::string& err);

// Decimal unsigned integer (e.g. mem_info_vram_total).
bool read_u64_file(const std::string& abs, uint64_t& out, std::string& err);

// Integer with base auto-detection, so "0x1002" and "4098" both parse
// (vendor, device and revision files).
bool read_id_file(const std::string& abs, uint32_t& out, std::string& err);

} // namespace devtel::util
