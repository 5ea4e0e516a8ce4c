#include "backends/NativeGpuBackend.hpp"
#include "util/HostMemory.hpp"

#include <cstdio>
#include <vector>

using namespace std::chrono;

namespace devtel::backends {

NativeGpuBackend::NativeGpuBackend(std::string key, nanoseconds refresh, std::unique_ptr<GpuQuery> query)
    : Backend(std::move(key), refresh), query_(std::move(query)) {}

NativeGpuBackend::~NativeGpuBackend() { stop(); }

bool NativeGpuBackend::collect(devtel::model::BackendSnapshot& snap, size_t& devices, devtel::model::Error& err) {
  std::vector<devtel::model::DeviceReading> readings;
  if (!query_->query(readings, err)) return false;
  devices = readings.size();

  // Host total is only needed for unified-memory devices; read it at most once
  bool host_read = false, host_ok = false;
  uint64_t host_total = 0;
  std::string host_err;

  for (size_t idx = 0; idx < readings.size(); ++idx) {
    const auto& r = readings[idx];
    std::string label = r.name + "." + std::to_string(idx);
    if (!r.error.empty()) snap.errors[label] = r.error;

    if (r.util >= 0) snap.usage[label] = r.util;
    else if (r.error.empty()) snap.usage[label] = 0; // cannot report, not failed

    if (r.has_temp) snap.temps[label] = r.temp_c;

    if (!r.has_memory) continue;
    uint64_t total = r.total_mem;
    if (r.unified_memory) {
      if (!host_read) { host_ok = devtel::util::host_total_memory(host_total, host_err); host_read = true; }
      if (!host_ok) { snap.errors[label] = host_err; continue; }
      total = host_total;
    }
    if (total == 0) {
      snap.errors[label] = key() + " GPU error: total memory is zero";
      continue;
    }
    snap.mems[label] = devtel::model::MemoryInfo{
      total, r.used_mem, (static_cast<double>(r.used_mem) / static_cast<double>(total)) * 100.0};
  }
  return true;
}

std::optional<devtel::model::Error> start_native(const NativeStartup& desc, const devtel::model::ConfigMap& cfg,
                                                 devtel::app::Registry& reg, std::unique_ptr<GpuQuery> query) {
  auto mode = devtel::app::resolve_enable(cfg, desc.enable_keys);
  if (mode == devtel::app::EnableMode::Off) return std::nullopt;
  bool forced = mode == devtel::app::EnableMode::Force;

  std::vector<devtel::model::DeviceReading> readings;
  std::string err;
  if (!query->query(readings, err)) {
    if (forced) return desc.vendor + " GPU error: " + err;
    if (devtel::app::Backend::verbose()) std::fprintf(stderr, "devtel: %s: not enabled: %s\n", desc.key.c_str(), err.c_str());
    return std::nullopt;
  }
  if (readings.empty()) {
    if (forced) return desc.vendor + " GPU error: no " + desc.vendor + " GPUs found";
    return std::nullopt;
  }

  nanoseconds refresh{};
  if (!devtel::app::resolve_refresh(cfg, desc.refresh_key.c_str(), seconds(1), refresh, err)) return err;

  auto backend = std::make_unique<NativeGpuBackend>(desc.key, refresh, std::move(query));
  backend->start();
  auto& b = reg.adopt(std::move(backend));
  reg.register_temp([&b](devtel::model::TempMap& out){ return b.copy_temps(out); });
  reg.register_mem([&b](devtel::model::MemMap& out){ return b.copy_mems(out); });
  reg.register_usage([&b](devtel::model::UsageMap& out, bool){ return b.copy_usage(out); });
  return std::nullopt;
}

} // namespace devtel::backends
