#pragma once
#include <optional>
#include <string>
#include <vector>
#include "app/Registry.hpp"
#include "backends/GpuQuery.hpp"

namespace devtel::backends {

// GpuQuery over the runtime-loaded NVML library.
class NvmlQuery : public GpuQuery {
public:
  explicit NvmlQuery(std::string path_override = {});
  bool query(std::vector<devtel::model::DeviceReading>& out, std::string& err) override;

private:
  std::string path_override_;
};

// Startup for config keys nvidia, nvidia-refresh and nvidia-nvml-path.
std::optional<devtel::model::Error> start_nvidia(const devtel::model::ConfigMap& cfg, devtel::app::Registry& reg);

} // namespace devtel::backends
