#include "app/Backend.hpp"
#include "app/Config.hpp"
#include "app/Registry.hpp"
#include "model/Telemetry.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_sigint(int){ g_stop.store(true); }

template <typename Map>
static std::vector<std::string> sorted_keys(const Map& m) {
  std::vector<std::string> keys;
  keys.reserve(m.size());
  for (const auto& kv : m) keys.push_back(kv.first);
  std::sort(keys.begin(), keys.end());
  return keys;
}

static std::string human_bytes(uint64_t b) {
  char buf[32];
  double v = static_cast<double>(b);
  const char* unit = "B";
  const char* units[] = {"KiB", "MiB", "GiB", "TiB"};
  for (const char* u : units) {
    if (v < 1024.0) break;
    v /= 1024.0; unit = u;
  }
  std::snprintf(buf, sizeof(buf), "%.1f %s", v, unit);
  return buf;
}

static void print_frame(const devtel::app::Registry& reg, int frame) {
  devtel::model::TempMap temps;
  devtel::model::MemMap mems;
  devtel::model::UsageMap usage;
  devtel::model::ErrorMap errors;
  for (auto& [k, v] : reg.temps(temps)) errors[k] = std::move(v);
  for (auto& [k, v] : reg.mems(mems)) errors[k] = std::move(v);
  for (auto& [k, v] : reg.usage(usage, true)) errors[k] = std::move(v);

  std::cout << "--- frame " << frame << " ---\n";
  for (const auto& k : sorted_keys(usage))
    std::cout << "usage  " << k << "  " << usage[k] << "%\n";
  for (const auto& k : sorted_keys(mems)) {
    const auto& m = mems[k];
    char pct[16]; std::snprintf(pct, sizeof(pct), "%.1f", m.used_pct);
    std::cout << "mem    " << k << "  " << human_bytes(m.used) << " / "
              << human_bytes(m.total) << " (" << pct << "%)\n";
  }
  for (const auto& k : sorted_keys(temps))
    std::cout << "temp   " << k << "  " << temps[k] << "C\n";
  for (const auto& k : sorted_keys(errors))
    std::cout << "error  " << k << "  " << errors[k] << "\n";
  std::cout.flush();
}

static bool parse_int_arg(const char* s, int& out) {
  char* end = nullptr;
  long v = std::strtol(s, &end, 10);
  if (end == s || *end != '\0') return false;
  out = static_cast<int>(v);
  return true;
}

static void usage_text() {
  std::cout << "Usage: devtel [--iterations N] [--sleep-ms MS] [--config PATH] [--set key=value]...\n";
  std::cout << "Notes: runs until Ctrl+C by default. Keys under --set match the [devices]\n"
               "       config section (amd, amd-refresh, nvidia, nvidia-refresh, nvidia-nvml-path).\n";
}

int main(int argc, char** argv) {
  std::signal(SIGINT, on_sigint);
  int iterations = 0; // 0 or less => run until Ctrl+C
  int sleep_ms = 1000;
  std::string config_path;
  bool config_explicit = false;
  std::vector<std::pair<std::string, std::string>> overrides;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--iterations" && i + 1 < argc) {
      if (!parse_int_arg(argv[++i], iterations)) { std::fprintf(stderr, "devtel: invalid --iterations '%s'\n", argv[i]); return 2; }
    } else if (a == "--sleep-ms" && i + 1 < argc) {
      if (!parse_int_arg(argv[++i], sleep_ms) || sleep_ms <= 0) { std::fprintf(stderr, "devtel: invalid --sleep-ms '%s'\n", argv[i]); return 2; }
    } else if (a == "--config" && i + 1 < argc) {
      config_path = argv[++i]; config_explicit = true;
    } else if (a == "--set" && i + 1 < argc) {
      std::string kv = argv[++i];
      auto eq = kv.find('=');
      if (eq == std::string::npos || eq == 0) { std::fprintf(stderr, "devtel: --set expects key=value, got '%s'\n", kv.c_str()); return 2; }
      overrides.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
    } else if (a == "-h" || a == "--help") {
      usage_text();
      return 0;
    } else {
      std::fprintf(stderr, "devtel: unknown argument '%s'\n", a.c_str());
      usage_text();
      return 2;
    }
  }

  if (!config_explicit) config_path = devtel::app::config_file_path();
  std::string cfg_err;
  auto settings = devtel::app::load_settings(config_path, config_explicit, overrides, cfg_err);
  if (!cfg_err.empty()) std::fprintf(stderr, "devtel: %s\n", cfg_err.c_str());
  devtel::app::Backend::set_verbose(settings.log_backends);

  auto& reg = devtel::app::Registry::global();
  auto errors = reg.run_startups(settings.devices);
  if (!errors.empty()) {
    for (const auto& e : errors) std::fprintf(stderr, "devtel: %s\n", e.c_str());
    reg.stop_all();
    return 1;
  }
  if (reg.backend_keys().empty())
    std::fprintf(stderr, "devtel: no device backends active\n");

  for (int i = 0; (iterations <= 0 || i < iterations) && !g_stop.load(); ++i) {
    if (i > 0) {
      auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(sleep_ms);
      while (!g_stop.load() && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(10ms);
      if (g_stop.load()) break;
    }
    print_frame(reg, i);
  }
  reg.stop_all();
  return 0;
}
