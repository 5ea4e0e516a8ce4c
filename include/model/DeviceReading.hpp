#pragma once
#include <cstdint>
#include <string>

namespace devtel::model {

// One device as reported by a native GPU API, copied out of the API's own
// buffers so nothing here needs releasing.
struct DeviceReading {
  std::string name;
  bool     has_memory{false};
  uint64_t total_mem{};        // bytes; ignored for unified memory
  uint64_t used_mem{};         // bytes; system-wide allocation for unified memory
  bool     unified_memory{false};
  int      util{-1};           // percent, -1 when the device cannot report it
  bool     has_temp{false};
  int      temp_c{0};
  std::string error;           // non-empty when part of the read failed
};

} // namespace devtel::model
