#pragma once
#include <string>
#include <vector>
#include "model/DeviceReading.hpp"

namespace devtel::backends {

// Capability boundary around an opaque vendor API. Implementations must
// release whatever the API hands out before query() returns.
class GpuQuery {
public:
  virtual ~GpuQuery() = default;
  // Readings in the API's enumeration order. False (with err) when the API
  // could not be reached at all.
  virtual bool query(std::vector<devtel::model::DeviceReading>& out, std::string& err) = 0;
};

} // namespace devtel::backends
