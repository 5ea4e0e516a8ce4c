#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "app/Backend.hpp"
#include "model/Telemetry.hpp"

namespace devtel::app {

class Registry;

// Backend bring-up: decide enable/disable, do the first discovery, and on
// success adopt a started Backend plus its provider callbacks into reg.
// Returning an error means the user asked for this backend and it failed.
using StartupFn = std::function<std::optional<devtel::model::Error>(const devtel::model::ConfigMap&, Registry&)>;

using TempProvider  = std::function<devtel::model::ErrorMap(devtel::model::TempMap&)>;
using MemProvider   = std::function<devtel::model::ErrorMap(devtel::model::MemMap&)>;
using UsageProvider = std::function<devtel::model::ErrorMap(devtel::model::UsageMap&, bool)>;

// Backend-agnostic registry of startup functions and provider callbacks.
// The rendering side calls temps()/mems()/usage() which fan out to every
// registered callback of that kind and union the results.
class Registry {
public:
  Registry() = default;
  ~Registry();
  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;

  // Process-wide instance that backends self-register into.
  static Registry& global();

  void register_startup(std::string name, StartupFn fn);
  void register_temp(TempProvider fn);
  void register_mem(MemProvider fn);
  void register_usage(UsageProvider fn);

  // Run every startup once, in registration order. Returns the errors of
  // force-enabled backends that failed; non-empty means bring-up failed.
  std::vector<devtel::model::Error> run_startups(const devtel::model::ConfigMap& cfg);

  // Take ownership of a (normally already started) backend.
  Backend& adopt(std::unique_ptr<Backend> backend);

  // Merge all providers of a kind into out; returns the union of errors.
  devtel::model::ErrorMap temps(devtel::model::TempMap& out) const;
  devtel::model::ErrorMap mems(devtel::model::MemMap& out) const;
  devtel::model::ErrorMap usage(devtel::model::UsageMap& out, bool per_device) const;

  std::vector<std::string> startup_names() const;
  std::vector<std::string> backend_keys() const;
  size_t temp_provider_count() const;
  size_t mem_provider_count() const;
  size_t usage_provider_count() const;

  // Stop every owned backend's sampling thread.
  void stop_all();

private:
  struct Startup { std::string name; StartupFn fn; };

  mutable std::mutex mu_;
  std::vector<Startup> startups_;
  std::vector<TempProvider> temp_;
  std::vector<MemProvider> mem_;
  std::vector<UsageProvider> usage_;
  std::vector<std::unique_ptr<Backend>> backends_;
};

// Static self-registration into Registry::global(), one per backend.
struct StartupRegistrar {
  StartupRegistrar(std::string name, StartupFn fn) {
    Registry::global().register_startup(std::move(name), std::move(fn));
  }
};

} // namespace devtel::app
