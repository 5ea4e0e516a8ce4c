#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>

namespace devtel::model {

// Human-readable failure description. Empty means no error.
using Error = std::string;

// device label (or backend key) -> last error seen this cycle
using ErrorMap = std::unordered_map<std::string, Error>;

// Resolved configuration handed to every startup function.
using ConfigMap = std::unordered_map<std::string, std::string>;

struct MemoryInfo {
  uint64_t total{};   // bytes
  uint64_t used{};    // bytes
  double   used_pct{}; // 0..100
};

using TempMap  = std::unordered_map<std::string, int>;        // label -> whole degrees C
using MemMap   = std::unordered_map<std::string, MemoryInfo>; // label -> memory
using UsageMap = std::unordered_map<std::string, int>;        // label -> percent 0..100

// Complete published state of one backend. Never mutated after publish.
struct BackendSnapshot {
  uint64_t seq{};
  TempMap  temps;
  MemMap   mems;
  UsageMap usage;
  ErrorMap errors;
};

} // namespace devtel::model
