#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "app/Backend.hpp"
#include "app/Registry.hpp"
#include "backends/GpuQuery.hpp"

namespace devtel::backends {

// Backend fed by a native device API rather than sysfs. Devices carry no bus
// slot, so labels are <name>.<ordinal>; ordinals follow enumeration order and
// can shift when devices come and go.
class NativeGpuBackend : public devtel::app::Backend {
public:
  NativeGpuBackend(std::string key, std::chrono::nanoseconds refresh, std::unique_ptr<GpuQuery> query);
  ~NativeGpuBackend() override;

protected:
  bool collect(devtel::model::BackendSnapshot& snap, size_t& devices, devtel::model::Error& err) override;

private:
  std::unique_ptr<GpuQuery> query_;
};

struct NativeStartup {
  std::string key;                               // backend key, e.g. "nvidia"
  std::string vendor;                            // for messages, e.g. "NVIDIA"
  std::vector<std::string> enable_keys;
  std::string refresh_key;
};

// Shared startup for native backends: enable decision, first query,
// refresh parsing, then start + adopt + provider registration.
std::optional<devtel::model::Error> start_native(const NativeStartup& desc, const devtel::model::ConfigMap& cfg,
                                                 devtel::app::Registry& reg, std::unique_ptr<GpuQuery> query);

} // namespace devtel::backends
