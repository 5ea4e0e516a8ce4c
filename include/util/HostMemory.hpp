#pragma once
#include <cstdint>
#include <string>

namespace devtel::util {

// Total physical memory of the host in bytes (/proc/meminfo MemTotal).
// Unified-memory GPUs report against this instead of a VRAM size.
bool host_total_memory(uint64_t& bytes, std::string& err);

} // namespace devtel::util
