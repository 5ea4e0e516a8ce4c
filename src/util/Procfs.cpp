#include "util/Procfs.hpp"

#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace devtel::util {

static std::string proc_root() {
  const char* env = std::getenv("DEVTEL_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

static std::string sys_root() {
  const char* env = std::getenv("DEVTEL_SYS_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  auto root = proc_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto map_sys_path(const std::string& abs) -> std::string {
  if (abs.rfind("/sys", 0) != 0) return abs; // not under /sys
  auto root = sys_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1));
  return p.string();
}

auto map_path(const std::string& abs) -> std::string {
  if (abs.rfind("/sys", 0) == 0) return map_sys_path(abs);
  return map_proc_path(abs);
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_path(abs));
  if (!in) return std::nullopt;
  try {
    std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) return std::nullopt;
    return s;
  } catch (const std::ios_base::failure&) {
    // File disappeared or became unreadable between open and read
    return std::nullopt;
  }
}

auto list_dir(const std::string& abs, std::vector<std::string>& out, int& err_out) -> bool {
  out.clear();
  err_out = 0;
  auto path = map_path(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) { err_out = errno; return false; }
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  // readdir order is filesystem dependent; callers need a stable order
  std::sort(out.begin(), out.end());
  return true;
}

auto read_link(const std::string& abs) -> std::optional<std::string> {
  auto path = map_path(abs);
  char buf[4096];
  ssize_t n = ::readlink(path.c_str(), buf, sizeof(buf) - 1);
  if (n < 0) return std::nullopt;
  return std::string(buf, static_cast<size_t>(n));
}

auto is_directory(const std::string& abs) -> bool {
  struct stat st{};
  if (::stat(map_path(abs).c_str(), &st) != 0) return false;
  return S_ISDIR(st.st_mode);
}

auto is_regular_file(const std::string& abs) -> bool {
  struct stat st{};
  if (::stat(map_path(abs).c_str(), &st) != 0) return false;
  return S_ISREG(st.st_mode);
}

auto exists(const std::string& abs) -> bool {
  struct stat st{};
  return ::stat(map_path(abs).c_str(), &st) == 0;
}

} // namespace devtel::util
