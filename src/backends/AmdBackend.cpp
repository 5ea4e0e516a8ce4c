#include "backends/AmdBackend.hpp"
#include "backends/AmdDiscovery.hpp"
#include "backends/AmdReaders.hpp"

#include <cstdio>
#include <memory>
#include <vector>

using namespace std::chrono;

namespace devtel::backends {

AmdBackend::AmdBackend(nanoseconds refresh, const devtel::util::IdTable& ids)
    : Backend("amd", refresh), ids_(ids) {}

AmdBackend::~AmdBackend() { stop(); }

bool AmdBackend::collect(devtel::model::BackendSnapshot& snap, size_t& devices, devtel::model::Error& err) {
  std::vector<AmdGpu> gpus;
  if (!discover_amd_gpus(ids_, gpus, err)) return false;
  devices = gpus.size();
  for (const auto& gpu : gpus) {
    // A failing kind is recorded and skipped; the other kinds still run
    std::string e;
    int temp = 0;
    if (read_amd_temp(gpu.device_path, temp, e)) snap.temps[gpu.label] = temp;
    else snap.errors[gpu.label] = e;

    int busy = 0;
    if (read_amd_busy(gpu.device_path, busy, e)) snap.usage[gpu.label] = busy;
    else snap.errors[gpu.label] = e;

    devtel::model::MemoryInfo mem{};
    if (read_amd_vram(gpu.device_path, mem, e)) snap.mems[gpu.label] = mem;
    else snap.errors[gpu.label] = e;
  }
  return true;
}

std::optional<devtel::model::Error> start_amd(const devtel::model::ConfigMap& cfg, devtel::app::Registry& reg,
                                              const devtel::util::IdTable& ids) {
  auto mode = devtel::app::resolve_enable(cfg, {"amd", "amdgpu"});
  if (mode == devtel::app::EnableMode::Off) return std::nullopt;
  bool forced = mode == devtel::app::EnableMode::Force;

  std::vector<AmdGpu> gpus;
  std::string err;
  if (!discover_amd_gpus(ids, gpus, err)) {
    if (forced) return "AMD GPU error: " + err;
    if (devtel::app::Backend::verbose()) std::fprintf(stderr, "devtel: amd: not enabled: %s\n", err.c_str());
    return std::nullopt;
  }
  if (gpus.empty()) {
    if (forced) {
      return std::string("AMD GPU error: no AMD GPUs found (check ") + kDrmRoot + " and " + kAmdgpuDriverRoot + ")";
    }
    return std::nullopt;
  }

  nanoseconds refresh{};
  if (!devtel::app::resolve_refresh(cfg, "amd-refresh", seconds(1), refresh, err)) return err;

  if (!ids.available() && devtel::app::Backend::verbose()) {
    std::fprintf(stderr, "devtel: amd: %s, using generic labels\n", ids.error().c_str());
  }

  auto backend = std::make_unique<AmdBackend>(refresh, ids);
  backend->start();
  auto& b = reg.adopt(std::move(backend));
  reg.register_temp([&b](devtel::model::TempMap& out){ return b.copy_temps(out); });
  reg.register_mem([&b](devtel::model::MemMap& out){ return b.copy_mems(out); });
  reg.register_usage([&b](devtel::model::UsageMap& out, bool){ return b.copy_usage(out); });
  return std::nullopt;
}

static devtel::app::StartupRegistrar amd_registrar{"amd",
  [](const devtel::model::ConfigMap& cfg, devtel::app::Registry& reg) {
    // Only reach for amdgpu.ids once the user has not switched AMD off
    if (devtel::app::resolve_enable(cfg, {"amd", "amdgpu"}) == devtel::app::EnableMode::Off) {
      return std::optional<devtel::model::Error>{};
    }
    return start_amd(cfg, reg, devtel::util::IdTable::shared());
  }};

} // namespace devtel::backends
