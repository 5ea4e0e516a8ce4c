#pragma once
#include <chrono>
#include <optional>
#include "app/Backend.hpp"
#include "app/Registry.hpp"
#include "util/IdTable.hpp"

namespace devtel::backends {

// AMD GPUs through the amdgpu/radeon sysfs interface.
class AmdBackend : public devtel::app::Backend {
public:
  AmdBackend(std::chrono::nanoseconds refresh, const devtel::util::IdTable& ids);
  ~AmdBackend() override;

protected:
  bool collect(devtel::model::BackendSnapshot& snap, size_t& devices, devtel::model::Error& err) override;

private:
  const devtel::util::IdTable& ids_;
};

// Startup for config keys amd/amdgpu and amd-refresh.
std::optional<devtel::model::Error> start_amd(const devtel::model::ConfigMap& cfg, devtel::app::Registry& reg,
                                              const devtel::util::IdTable& ids);

} // namespace devtel::backends
