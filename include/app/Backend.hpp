#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "app/SnapshotCache.hpp"
#include "model/Telemetry.hpp"

namespace devtel::app {

enum class BackendState { Disabled, Initializing, Running };

// One hardware data source: owns its snapshot cache and its sampling
// thread. Subclasses implement collect(); everything else (first sync
// sample, periodic refresh, publication, partial-failure policy) lives here.
//
// Subclasses must call stop() from their own destructor so the sampling
// thread never runs collect() on a half-destroyed object.
class Backend {
public:
  Backend(std::string key, std::chrono::nanoseconds refresh);
  virtual ~Backend();
  Backend(const Backend&) = delete;
  Backend& operator=(const Backend&) = delete;

  const std::string& key() const { return key_; }
  std::chrono::nanoseconds refresh() const { return refresh_; }
  BackendState state() const { return state_.load(std::memory_order_acquire); }

  // Publish one synchronous sample, then launch the periodic thread.
  void start();
  // Request stop and join. The backend stays Running (no way back).
  void stop();

  // One full discovery + read cycle, published atomically.
  void sample_once();

  uint64_t seq() const { return cache_.seq(); }
  std::shared_ptr<const devtel::model::BackendSnapshot> snapshot() const { return cache_.current(); }

  // Provider callback bodies: merge cached values into out and return a
  // copy of this backend's error map.
  devtel::model::ErrorMap copy_temps(devtel::model::TempMap& out) const;
  devtel::model::ErrorMap copy_mems(devtel::model::MemMap& out) const;
  devtel::model::ErrorMap copy_usage(devtel::model::UsageMap& out) const;

  // Log per-cycle enumeration failures to stderr (off by default).
  static void set_verbose(bool on);
  static bool verbose();

protected:
  // Discover devices and read every metric into snap. Per-device failures go
  // into snap.errors keyed by label. Returns false (with err) only when the
  // enumeration itself failed; devices receives the number discovered.
  virtual bool collect(devtel::model::BackendSnapshot& snap, size_t& devices,
                       devtel::model::Error& err) = 0;

private:
  void run(std::stop_token st);

  std::string key_;
  std::chrono::nanoseconds refresh_;
  std::atomic<BackendState> state_{BackendState::Disabled};
  SnapshotCache cache_;
  std::mutex wake_mu_;
  std::condition_variable_any wake_cv_;
  std::jthread thread_{};
};

enum class EnableMode { Auto, Force, Off };

// "true" under any of keys forces the backend on, "false" turns it off,
// anything else leaves it to auto-detection. Force wins over Off.
EnableMode resolve_enable(const devtel::model::ConfigMap& cfg,
                          const std::vector<std::string>& keys);

// Read a refresh interval from cfg[key], or def when absent. Fails on an
// unparseable or non-positive duration.
bool resolve_refresh(const devtel::model::ConfigMap& cfg, const char* key,
                     std::chrono::nanoseconds def, std::chrono::nanoseconds& out,
                     devtel::model::Error& err);

} // namespace devtel::app
