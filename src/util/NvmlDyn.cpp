#include "util/NvmlDyn.hpp"
#include <cstdio>
#include <dlfcn.h>

namespace devtel::util {

static const int NVML_SUCCESS = 0;
static const int NVML_ERROR_NOT_SUPPORTED = 3;
static const int NVML_ERROR_INSUFFICIENT_SIZE = 7;
static const unsigned int NVML_TEMPERATURE_GPU = 0; // core sensor
static const unsigned long long NVML_VALUE_NOT_AVAILABLE = ~0ull;

NvmlDyn& NvmlDyn::instance() {
  static NvmlDyn inst;
  return inst;
}

bool NvmlDyn::load_once(const std::string& path_override) {
  std::call_once(load_flag_, [&]{ load(path_override); });
  return available();
}

void NvmlDyn::load(const std::string& path_override) {
  std::vector<std::string> candidates;

  if (!path_override.empty()) {
    static const std::vector<std::string> allowed_prefixes = {
      "/usr/lib", "/usr/lib64", "/usr/local/lib", "/usr/local/lib64",
      "/opt/nvidia", "/opt/cuda"
    };
    bool valid = false;
    for (const auto& prefix : allowed_prefixes) {
      if (path_override.rfind(prefix, 0) == 0) { valid = true; break; }
    }
    if (valid) {
      candidates.emplace_back(path_override);
    } else {
      std::fprintf(stderr, "devtel: nvidia-nvml-path rejected (invalid prefix): %s\n", path_override.c_str());
    }
  }

  candidates.emplace_back("libnvidia-ml.so.1");
  candidates.emplace_back("libnvidia-ml.so");

  for (const auto& lib : candidates) {
    handle_ = ::dlopen(lib.c_str(), RTLD_LAZY | RTLD_LOCAL);
    if (handle_) break;
  }
  if (!handle_) { load_error_ = "NVML library not available (libnvidia-ml.so.1)"; return; }
  if (!dlsym_all()) {
    ::dlclose(handle_); handle_ = nullptr;
    load_error_ = "NVML library is missing required symbols";
  }
}

bool NvmlDyn::dlsym_all() {
  auto L = [&](const char* sym){ return ::dlsym(handle_, sym); };
  p_nvmlInit_v2 = (nvmlReturn_t (*)())L("nvmlInit_v2");
  p_nvmlShutdown = (nvmlReturn_t (*)())L("nvmlShutdown");
  p_nvmlErrorString = (const char* (*)(nvmlReturn_t))L("nvmlErrorString");
  p_nvmlDeviceGetCount_v2 = (nvmlReturn_t (*)(unsigned int*))L("nvmlDeviceGetCount_v2");
  p_nvmlDeviceGetHandleByIndex_v2 = (nvmlReturn_t (*)(unsigned int, nvmlDevice_t*))L("nvmlDeviceGetHandleByIndex_v2");
  p_nvmlDeviceGetName = (nvmlReturn_t (*)(nvmlDevice_t, char*, unsigned int))L("nvmlDeviceGetName");
  p_nvmlDeviceGetMemoryInfo = (nvmlReturn_t (*)(nvmlDevice_t, nvmlMemory_t*))L("nvmlDeviceGetMemoryInfo");
  p_nvmlDeviceGetTemperature = (nvmlReturn_t (*)(nvmlDevice_t, unsigned int, unsigned int*))L("nvmlDeviceGetTemperature");
  p_nvmlDeviceGetUtilizationRates = (nvmlReturn_t (*)(nvmlDevice_t, nvmlUtilization_t*))L("nvmlDeviceGetUtilizationRates");
  // Unversioned symbol keeps the v1 {pid, usedGpuMemory} layout
  p_nvmlDeviceGetComputeRunningProcesses = (nvmlReturn_t (*)(nvmlDevice_t, unsigned int*, nvmlProcessInfo_v1_t*))L("nvmlDeviceGetComputeRunningProcesses");
  // Core must-haves
  return p_nvmlInit_v2 && p_nvmlShutdown && p_nvmlDeviceGetCount_v2 && p_nvmlDeviceGetHandleByIndex_v2 && p_nvmlDeviceGetMemoryInfo;
}

bool NvmlDyn::available() const { return handle_ != nullptr; }

std::string NvmlDyn::describe(const char* what, nvmlReturn_t rc) const {
  std::string msg = std::string(what) + " failed: ";
  if (p_nvmlErrorString) {
    const char* s = p_nvmlErrorString(rc);
    if (s && *s) return msg + s;
  }
  return msg + "error " + std::to_string(rc);
}

// Integrated/unified-memory parts have no VRAM counter; the allocation the
// device itself reports is the sum over its compute processes.
bool NvmlDyn::unified_used(nvmlDevice_t dev, unsigned long long& used) const {
  if (!p_nvmlDeviceGetComputeRunningProcesses) return false;
  unsigned int count = 0;
  auto rc = p_nvmlDeviceGetComputeRunningProcesses(dev, &count, nullptr);
  used = 0;
  if (rc == NVML_SUCCESS) return true; // no processes
  if (rc != NVML_ERROR_INSUFFICIENT_SIZE) return false;
  // Processes may start between the two calls; leave headroom
  count += 8;
  std::vector<nvmlProcessInfo_v1_t> buf(count);
  rc = p_nvmlDeviceGetComputeRunningProcesses(dev, &count, buf.data());
  if (rc != NVML_SUCCESS) return false;
  for (unsigned int i = 0; i < count && i < buf.size(); ++i) {
    if (buf[i].usedGpuMemory != NVML_VALUE_NOT_AVAILABLE) used += buf[i].usedGpuMemory;
  }
  return true;
}

bool NvmlDyn::read_devices(std::vector<devtel::model::DeviceReading>& out, std::string& err) {
  out.clear();
  if (!available()) { err = load_error_.empty() ? "NVML not loaded" : load_error_; return false; }
  std::lock_guard<std::mutex> lk(read_mu_);

  Guard guard(*this);
  if (!guard.ok()) { err = describe("nvmlInit_v2", guard.rc()); return false; }

  unsigned int n = 0;
  if (auto rc = p_nvmlDeviceGetCount_v2(&n); rc != NVML_SUCCESS) {
    err = describe("nvmlDeviceGetCount_v2", rc);
    return false;
  }

  for (unsigned int i = 0; i < n; ++i) {
    devtel::model::DeviceReading rec{};
    nvmlDevice_t dev{};
    if (auto rc = p_nvmlDeviceGetHandleByIndex_v2(i, &dev); rc != NVML_SUCCESS) {
      // keep the slot so later ordinals do not shift
      rec.name = "GPU";
      rec.error = describe("nvmlDeviceGetHandleByIndex_v2", rc);
      out.push_back(std::move(rec));
      continue;
    }
    if (p_nvmlDeviceGetName) {
      char name[96]; name[0] = '\0';
      if (p_nvmlDeviceGetName(dev, name, sizeof(name)) == NVML_SUCCESS && name[0]) rec.name = name;
    }
    if (rec.name.empty()) rec.name = "GPU";

    nvmlMemory_t mem{};
    auto mrc = p_nvmlDeviceGetMemoryInfo(dev, &mem);
    if (mrc == NVML_SUCCESS) {
      rec.has_memory = true; rec.total_mem = mem.total; rec.used_mem = mem.used;
    } else if (mrc == NVML_ERROR_NOT_SUPPORTED) {
      unsigned long long used = 0;
      if (unified_used(dev, used)) {
        rec.has_memory = true; rec.unified_memory = true; rec.used_mem = used;
      } else {
        rec.error = "unified memory usage unavailable";
      }
    } else {
      rec.error = describe("nvmlDeviceGetMemoryInfo", mrc);
    }

    if (p_nvmlDeviceGetTemperature) {
      unsigned int tc = 0;
      if (p_nvmlDeviceGetTemperature(dev, NVML_TEMPERATURE_GPU, &tc) == NVML_SUCCESS) {
        rec.has_temp = true; rec.temp_c = static_cast<int>(tc);
      }
    }

    if (p_nvmlDeviceGetUtilizationRates) {
      nvmlUtilization_t ur{};
      if (p_nvmlDeviceGetUtilizationRates(dev, &ur) == NVML_SUCCESS) rec.util = static_cast<int>(ur.gpu);
    }

    out.push_back(std::move(rec));
  }
  return true;
}

} // namespace devtel::util
