#include "minitest.hpp"
#include "app/Backend.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

using namespace std::chrono;

namespace {

// Backend whose collect() result is driven by the test.
class ScriptedBackend : public devtel::app::Backend {
public:
  explicit ScriptedBackend(nanoseconds refresh = seconds(1)) : Backend("fake", refresh) {}
  ~ScriptedBackend() override { stop(); }

  void set_devices(int n) { std::lock_guard<std::mutex> lk(mu_); devices_ = n; }
  void set_value(int v) { std::lock_guard<std::mutex> lk(mu_); value_ = v; }
  void fail(const std::string& why) { std::lock_guard<std::mutex> lk(mu_); fail_ = why; }
  void recover() { std::lock_guard<std::mutex> lk(mu_); fail_.clear(); }
  int calls() const { return calls_.load(); }

protected:
  bool collect(devtel::model::BackendSnapshot& snap, size_t& devices, devtel::model::Error& err) override {
    calls_.fetch_add(1);
    std::lock_guard<std::mutex> lk(mu_);
    if (!fail_.empty()) { err = fail_; return false; }
    devices = static_cast<size_t>(devices_);
    for (int i = 0; i < devices_; ++i) {
      std::string label = "dev." + std::to_string(i);
      snap.temps[label] = value_;
      snap.usage[label] = value_;
      snap.mems[label] = devtel::model::MemoryInfo{100, static_cast<uint64_t>(value_), static_cast<double>(value_)};
    }
    return true;
  }

private:
  std::mutex mu_;
  int devices_{1};
  int value_{10};
  std::string fail_;
  std::atomic<int> calls_{0};
};

} // namespace

TEST(backend_start_publishes_synchronously) {
  ScriptedBackend b;
  ASSERT_TRUE(b.state() == devtel::app::BackendState::Disabled);
  b.start();
  ASSERT_TRUE(b.state() == devtel::app::BackendState::Running);
  // No waiting: the first sample happened inside start()
  ASSERT_EQ(b.seq(), 1u);
  devtel::model::TempMap temps;
  auto errs = b.copy_temps(temps);
  ASSERT_EQ(temps.size(), 1u);
  ASSERT_EQ(temps["dev.0"], 10);
  ASSERT_TRUE(errs.empty());
  b.stop();
  ASSERT_TRUE(b.state() == devtel::app::BackendState::Running);
}

TEST(backend_periodic_refresh_advances_seq) {
  ScriptedBackend b(milliseconds(20));
  b.start();
  auto s1 = b.seq();
  b.set_value(77);
  std::this_thread::sleep_for(milliseconds(200));
  auto s2 = b.seq();
  b.stop();
  ASSERT_TRUE(s2 > s1);
  devtel::model::UsageMap usage;
  b.copy_usage(usage);
  ASSERT_EQ(usage["dev.0"], 77);
  // Stopped: nothing more is published
  auto s3 = b.seq();
  std::this_thread::sleep_for(milliseconds(60));
  ASSERT_EQ(b.seq(), s3);
}

TEST(backend_discovery_failure_keeps_previous_metrics) {
  ScriptedBackend b;
  b.set_value(42);
  b.sample_once();
  b.fail("cannot read /sys/class/drm: Permission denied");
  b.sample_once();
  devtel::model::MemMap mems;
  auto errs = b.copy_mems(mems);
  ASSERT_EQ(mems.size(), 1u);
  ASSERT_EQ(mems["dev.0"].used, 42u);
  ASSERT_EQ(errs.size(), 1u);
  ASSERT_EQ(errs["fake"], "cannot read /sys/class/drm: Permission denied");
  // Recovery replaces the snapshot and clears the backend-level error
  b.recover();
  b.set_value(43);
  b.sample_once();
  mems.clear();
  errs = b.copy_mems(mems);
  ASSERT_EQ(mems["dev.0"].used, 43u);
  ASSERT_TRUE(errs.empty());
}

TEST(backend_snapshot_holds_one_cycle) {
  ScriptedBackend b;
  b.set_devices(2);
  b.set_value(5);
  b.sample_once();
  auto first = b.snapshot();
  ASSERT_EQ(first->seq, b.seq());
  b.set_value(6);
  b.sample_once();
  auto second = b.snapshot();
  ASSERT_EQ(second->seq, first->seq + 1);
  // The earlier snapshot is immutable once published
  ASSERT_EQ(first->temps.at("dev.0"), 5);
  ASSERT_EQ(first->usage.at("dev.1"), 5);
  for (const auto& [label, v] : second->temps) {
    ASSERT_EQ(v, 6);
    ASSERT_EQ(second->usage.at(label), 6);
    ASSERT_EQ(second->mems.at(label).used, 6u);
  }
  ASSERT_TRUE(second->errors.empty());
}

TEST(backend_zero_devices_clears_metrics) {
  ScriptedBackend b;
  b.sample_once();
  b.set_devices(0);
  b.sample_once();
  devtel::model::TempMap temps;
  devtel::model::UsageMap usage;
  auto errs = b.copy_temps(temps);
  b.copy_usage(usage);
  ASSERT_TRUE(temps.empty());
  ASSERT_TRUE(usage.empty());
  ASSERT_EQ(errs["fake"], "no fake devices found");
}

TEST(backend_copy_merges_without_clearing) {
  ScriptedBackend b;
  b.sample_once();
  devtel::model::TempMap temps;
  temps["other.0"] = 99;
  b.copy_temps(temps);
  ASSERT_EQ(temps.size(), 2u);
  ASSERT_EQ(temps["other.0"], 99);
}

TEST(backend_nonpositive_refresh_defaults_to_one_second) {
  ScriptedBackend b(nanoseconds(0));
  ASSERT_TRUE(b.refresh() == nanoseconds(seconds(1)));
}

TEST(backend_resolve_enable_modes) {
  using devtel::app::EnableMode;
  devtel::model::ConfigMap cfg;
  ASSERT_TRUE(devtel::app::resolve_enable(cfg, {"amd", "amdgpu"}) == EnableMode::Auto);
  cfg["amd"] = "false";
  ASSERT_TRUE(devtel::app::resolve_enable(cfg, {"amd", "amdgpu"}) == EnableMode::Off);
  cfg["amdgpu"] = "true";
  ASSERT_TRUE(devtel::app::resolve_enable(cfg, {"amd", "amdgpu"}) == EnableMode::Force);
  cfg.clear();
  cfg["amd"] = "yes please";
  ASSERT_TRUE(devtel::app::resolve_enable(cfg, {"amd"}) == EnableMode::Auto);
}

TEST(backend_resolve_refresh) {
  devtel::model::ConfigMap cfg;
  nanoseconds out{}; std::string err;
  ASSERT_TRUE(devtel::app::resolve_refresh(cfg, "amd-refresh", seconds(1), out, err));
  ASSERT_TRUE(out == nanoseconds(seconds(1)));
  cfg["amd-refresh"] = "250ms";
  ASSERT_TRUE(devtel::app::resolve_refresh(cfg, "amd-refresh", seconds(1), out, err));
  ASSERT_TRUE(out == nanoseconds(milliseconds(250)));
  cfg["amd-refresh"] = "soon";
  ASSERT_TRUE(!devtel::app::resolve_refresh(cfg, "amd-refresh", seconds(1), out, err));
  ASSERT_TRUE(err.find("amd-refresh") != std::string::npos);
  cfg["amd-refresh"] = "0s";
  ASSERT_TRUE(!devtel::app::resolve_refresh(cfg, "amd-refresh", seconds(1), out, err));
}
