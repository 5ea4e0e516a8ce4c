#include "app/Backend.hpp"
#include "util/Duration.hpp"

#include <cstdio>

using namespace std::chrono;

namespace devtel::app {

static std::atomic<bool> g_verbose{false};

void Backend::set_verbose(bool on) { g_verbose.store(on, std::memory_order_relaxed); }
bool Backend::verbose() { return g_verbose.load(std::memory_order_relaxed); }

Backend::Backend(std::string key, nanoseconds refresh)
    : key_(std::move(key)), refresh_(refresh > nanoseconds::zero() ? refresh : nanoseconds(seconds(1))) {}

Backend::~Backend() { stop(); }

void Backend::start() {
  if (thread_.joinable()) return;
  state_.store(BackendState::Initializing, std::memory_order_release);
  // First read by a caller must never be empty because of timing
  sample_once();
  state_.store(BackendState::Running, std::memory_order_release);
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Backend::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

void Backend::run(std::stop_token st) {
  auto next = steady_clock::now() + refresh_;
  while (!st.stop_requested()) {
    {
      std::unique_lock<std::mutex> lk(wake_mu_);
      wake_cv_.wait_until(lk, st, next, []{ return false; });
    }
    if (st.stop_requested()) break;
    sample_once();
    next += refresh_;
    // A slow cycle drops missed ticks instead of bursting to catch up
    auto now = steady_clock::now();
    if (next <= now) next = now + refresh_;
  }
}

void Backend::sample_once() {
  // All I/O happens into this private snapshot; readers never see it until publish
  auto snap = std::make_shared<devtel::model::BackendSnapshot>();
  size_t devices = 0;
  devtel::model::Error err;
  if (!collect(*snap, devices, err)) {
    // Keep last-known-good metrics; only the backend-level error changes
    auto prev = cache_.current();
    auto kept = std::make_shared<devtel::model::BackendSnapshot>(*prev);
    kept->errors[key_] = err;
    if (verbose()) std::fprintf(stderr, "devtel: %s: discovery failed: %s\n", key_.c_str(), err.c_str());
    cache_.publish(std::move(kept));
    return;
  }
  if (devices == 0) {
    snap->temps.clear();
    snap->mems.clear();
    snap->usage.clear();
    snap->errors[key_] = "no " + key_ + " devices found";
  }
  cache_.publish(std::move(snap));
}

devtel::model::ErrorMap Backend::copy_temps(devtel::model::TempMap& out) const {
  auto snap = cache_.current();
  for (const auto& [k, v] : snap->temps) out[k] = v;
  return snap->errors;
}

devtel::model::ErrorMap Backend::copy_mems(devtel::model::MemMap& out) const {
  auto snap = cache_.current();
  for (const auto& [k, v] : snap->mems) out[k] = v;
  return snap->errors;
}

devtel::model::ErrorMap Backend::copy_usage(devtel::model::UsageMap& out) const {
  auto snap = cache_.current();
  for (const auto& [k, v] : snap->usage) out[k] = v;
  return snap->errors;
}

EnableMode resolve_enable(const devtel::model::ConfigMap& cfg, const std::vector<std::string>& keys) {
  bool off = false;
  for (const auto& k : keys) {
    auto it = cfg.find(k);
    if (it == cfg.end()) continue;
    if (it->second == "true") return EnableMode::Force;
    if (it->second == "false") off = true;
  }
  return off ? EnableMode::Off : EnableMode::Auto;
}

bool resolve_refresh(const devtel::model::ConfigMap& cfg, const char* key, nanoseconds def,
                     nanoseconds& out, devtel::model::Error& err) {
  auto it = cfg.find(key);
  if (it == cfg.end()) { out = def; return true; }
  nanoseconds d{};
  if (!devtel::util::parse_duration(it->second, d)) {
    err = std::string("invalid duration for ") + key + ": \"" + it->second + "\"";
    return false;
  }
  if (d <= nanoseconds::zero()) {
    err = std::string(key) + " must be positive";
    return false;
  }
  out = d;
  return true;
}

} // namespace devtel::app
