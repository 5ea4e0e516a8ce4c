#include "backends/NvidiaBackend.hpp"
#include "backends/NativeGpuBackend.hpp"
#include "util/NvmlDyn.hpp"

#include <memory>

namespace devtel::backends {

NvmlQuery::NvmlQuery(std::string path_override) : path_override_(std::move(path_override)) {}

bool NvmlQuery::query(std::vector<devtel::model::DeviceReading>& out, std::string& err) {
  auto& nvml = devtel::util::NvmlDyn::instance();
  if (!nvml.load_once(path_override_)) {
    err = nvml.load_error();
    return false;
  }
  return nvml.read_devices(out, err);
}

std::optional<devtel::model::Error> start_nvidia(const devtel::model::ConfigMap& cfg, devtel::app::Registry& reg) {
  std::string path;
  if (auto it = cfg.find("nvidia-nvml-path"); it != cfg.end()) path = it->second;
  static const NativeStartup desc{"nvidia", "NVIDIA", {"nvidia"}, "nvidia-refresh"};
  return start_native(desc, cfg, reg, std::make_unique<NvmlQuery>(path));
}

static devtel::app::StartupRegistrar nvidia_registrar{"nvidia", start_nvidia};

} // namespace devtel::backends
