#pragma once
#include <mutex>
#include <string>
#include <vector>
#include "model/DeviceReading.hpp"

namespace devtel::util {

// Lightweight runtime NVML loader (dlopen/dlsym).
// Avoids build-time dependency on nvml.h and enables graceful degradation
// across driver/toolkit updates and varying library layouts.
class NvmlDyn {
public:
  // Singleton accessor
  static NvmlDyn& instance();

  // Attempt to load libnvidia-ml once (idempotent). A non-empty
  // path_override is tried first when it lives under a system library prefix.
  bool load_once(const std::string& path_override);

  // True if library is loaded and core symbols are present.
  bool available() const;
  const std::string& load_error() const { return load_error_; }

  // One reading per NVML device index. NVML is initialised for the duration
  // of the call and shut down before returning.
  bool read_devices(std::vector<devtel::model::DeviceReading>& out, std::string& err);

private:
  NvmlDyn() = default;
  NvmlDyn(const NvmlDyn&) = delete;
  NvmlDyn& operator=(const NvmlDyn&) = delete;

  std::once_flag load_flag_;
  std::mutex read_mu_;
  void* handle_{};
  std::string load_error_;

  using nvmlReturn_t = int; // NVML_SUCCESS == 0
  using nvmlDevice_t = void*;
  struct nvmlMemory_t { unsigned long long total, free, used; };
  struct nvmlUtilization_t { unsigned int gpu, memory; };
  struct nvmlProcessInfo_v1_t { unsigned int pid; unsigned long long usedGpuMemory; };

  // Initialises NVML on construction, shuts it down on destruction.
  class Guard {
  public:
    explicit Guard(NvmlDyn& n) : n_(n), rc_(n.p_nvmlInit_v2()) {}
    ~Guard() { if (rc_ == 0) n_.p_nvmlShutdown(); }
    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    bool ok() const { return rc_ == 0; }
    nvmlReturn_t rc() const { return rc_; }
  private:
    NvmlDyn& n_;
    nvmlReturn_t rc_;
  };

  nvmlReturn_t (*p_nvmlInit_v2)(){};
  nvmlReturn_t (*p_nvmlShutdown)(){};
  const char* (*p_nvmlErrorString)(nvmlReturn_t){};
  nvmlReturn_t (*p_nvmlDeviceGetCount_v2)(unsigned int* count){};
  nvmlReturn_t (*p_nvmlDeviceGetHandleByIndex_v2)(unsigned int index, nvmlDevice_t* device){};
  nvmlReturn_t (*p_nvmlDeviceGetName)(nvmlDevice_t device, char* name, unsigned int length){};
  nvmlReturn_t (*p_nvmlDeviceGetMemoryInfo)(nvmlDevice_t device, nvmlMemory_t* mem){};
  nvmlReturn_t (*p_nvmlDeviceGetTemperature)(nvmlDevice_t device, unsigned int sensorType, unsigned int* temp){};
  nvmlReturn_t (*p_nvmlDeviceGetUtilizationRates)(nvmlDevice_t device, nvmlUtilization_t* utilization){};
  nvmlReturn_t (*p_nvmlDeviceGetComputeRunningProcesses)(nvmlDevice_t device, unsigned int* count, nvmlProcessInfo_v1_t* infos){};

  void load(const std::string& path_override);
  bool dlsym_all();
  std::string describe(const char* what, nvmlReturn_t rc) const;
  bool unified_used(nvmlDevice_t dev, unsigned long long& used) const;
};

} // namespace devtel::util
