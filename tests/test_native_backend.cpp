#include "minitest.hpp"
#include "FakeQuery.hpp"
#include "SysTree.hpp"
#include "app/Registry.hpp"
#include "backends/NativeGpuBackend.hpp"
#include "backends/NvidiaBackend.hpp"

using devtel::app::Registry;
using devtel::backends::NativeGpuBackend;
using devtel::model::DeviceReading;

static DeviceReading discrete(const std::string& name, int util, uint64_t total, uint64_t used) {
  DeviceReading r{};
  r.name = name; r.util = util;
  r.has_memory = true; r.total_mem = total; r.used_mem = used;
  r.has_temp = true; r.temp_c = 60;
  return r;
}

static const devtel::backends::NativeStartup kDesc{"fake", "FAKE", {"fake"}, "fake-refresh"};

TEST(native_labels_follow_enumeration_order) {
  auto st = std::make_shared<FakeQueryState>();
  st->devices = {discrete("NVIDIA A100", 10, 1000, 100), discrete("NVIDIA A100", 90, 1000, 900)};
  NativeGpuBackend b("fake", std::chrono::seconds(1), std::make_unique<FakeQuery>(st));
  b.sample_once();
  devtel::model::UsageMap usage;
  devtel::model::MemMap mems;
  devtel::model::TempMap temps;
  auto errs = b.copy_usage(usage);
  b.copy_mems(mems);
  b.copy_temps(temps);
  ASSERT_TRUE(errs.empty());
  ASSERT_EQ(usage["NVIDIA A100.0"], 10);
  ASSERT_EQ(usage["NVIDIA A100.1"], 90);
  ASSERT_TRUE(mems["NVIDIA A100.1"].used_pct > 89.9 && mems["NVIDIA A100.1"].used_pct < 90.1);
  ASSERT_EQ(temps["NVIDIA A100.0"], 60);
}

TEST(native_utilization_sentinel) {
  auto st = std::make_shared<FakeQueryState>();
  DeviceReading quiet = discrete("GPU", -1, 1000, 0);
  DeviceReading broken = discrete("GPU", -1, 1000, 0);
  broken.error = "utilization query failed";
  st->devices = {quiet, broken};
  NativeGpuBackend b("fake", std::chrono::seconds(1), std::make_unique<FakeQuery>(st));
  b.sample_once();
  devtel::model::UsageMap usage;
  auto errs = b.copy_usage(usage);
  // Cannot report: shown as idle. Failed: omitted and reported.
  ASSERT_EQ(usage["GPU.0"], 0);
  ASSERT_TRUE(usage.find("GPU.1") == usage.end());
  ASSERT_EQ(errs["GPU.1"], "utilization query failed");
}

TEST(native_unified_memory_uses_host_total) {
  SysTree t("native_unified");
  t.write("proc/meminfo", "MemTotal:       16777216 kB\nMemFree:         1048576 kB\n");
  t.use_proc();
  auto st = std::make_shared<FakeQueryState>();
  DeviceReading r{};
  r.name = "GB10"; r.util = 5;
  r.has_memory = true; r.unified_memory = true; r.used_mem = 4ull * 1024 * 1024 * 1024;
  st->devices = {r};
  NativeGpuBackend b("fake", std::chrono::seconds(1), std::make_unique<FakeQuery>(st));
  b.sample_once();
  devtel::model::MemMap mems;
  auto errs = b.copy_mems(mems);
  ASSERT_TRUE(errs.empty());
  ASSERT_EQ(mems["GB10.0"].total, 16ull * 1024 * 1024 * 1024);
  ASSERT_TRUE(mems["GB10.0"].used_pct > 24.99 && mems["GB10.0"].used_pct < 25.01);
}

TEST(native_zero_total_memory_is_error) {
  auto st = std::make_shared<FakeQueryState>();
  st->devices = {discrete("GPU", 3, 0, 0)};
  NativeGpuBackend b("fake", std::chrono::seconds(1), std::make_unique<FakeQuery>(st));
  b.sample_once();
  devtel::model::MemMap mems;
  devtel::model::UsageMap usage;
  auto errs = b.copy_mems(mems);
  b.copy_usage(usage);
  ASSERT_TRUE(mems.empty());
  ASSERT_EQ(usage["GPU.0"], 3);
  ASSERT_EQ(errs["GPU.0"], "fake GPU error: total memory is zero");
}

TEST(native_query_failure_keeps_last_sample) {
  auto st = std::make_shared<FakeQueryState>();
  st->devices = {discrete("GPU", 20, 1000, 500)};
  NativeGpuBackend b("fake", std::chrono::seconds(1), std::make_unique<FakeQuery>(st));
  b.sample_once();
  { std::lock_guard<std::mutex> lk(st->mu); st->ok = false; st->err = "driver went away"; }
  b.sample_once();
  devtel::model::UsageMap usage;
  auto errs = b.copy_usage(usage);
  ASSERT_EQ(usage["GPU.0"], 20);
  ASSERT_EQ(errs["fake"], "driver went away");
}

TEST(native_startup_enable_policy) {
  auto st = std::make_shared<FakeQueryState>();
  {
    Registry reg;
    ASSERT_TRUE(!devtel::backends::start_native(kDesc, {}, reg, std::make_unique<FakeQuery>(st)).has_value());
    ASSERT_TRUE(reg.backend_keys().empty());
    auto err = devtel::backends::start_native(kDesc, {{"fake", "true"}}, reg, std::make_unique<FakeQuery>(st));
    ASSERT_TRUE(err.has_value());
    ASSERT_EQ(*err, "FAKE GPU error: no FAKE GPUs found");
  }
  {
    st->ok = false; st->err = "library not loaded";
    Registry reg;
    ASSERT_TRUE(!devtel::backends::start_native(kDesc, {}, reg, std::make_unique<FakeQuery>(st)).has_value());
    auto err = devtel::backends::start_native(kDesc, {{"fake", "true"}}, reg, std::make_unique<FakeQuery>(st));
    ASSERT_TRUE(err.has_value());
    ASSERT_EQ(*err, "FAKE GPU error: library not loaded");
  }
  {
    st->ok = true;
    st->devices = {discrete("GPU", 1, 1000, 1)};
    Registry reg;
    int before = st->calls;
    ASSERT_TRUE(!devtel::backends::start_native(kDesc, {{"fake", "false"}}, reg, std::make_unique<FakeQuery>(st)).has_value());
    ASSERT_EQ(st->calls, before);
    ASSERT_TRUE(!devtel::backends::start_native(kDesc, {{"fake-refresh", "100ms"}}, reg, std::make_unique<FakeQuery>(st)).has_value());
    ASSERT_EQ(reg.backend_keys().size(), 1u);
    ASSERT_EQ(reg.usage_provider_count(), 1u);
    devtel::model::UsageMap usage;
    reg.usage(usage, false);
    ASSERT_EQ(usage["GPU.0"], 1);
  }
}

TEST(nvidia_startup_disabled_by_config) {
  Registry reg;
  ASSERT_TRUE(!devtel::backends::start_nvidia({{"nvidia", "false"}}, reg).has_value());
  ASSERT_TRUE(reg.backend_keys().empty());
}
