#include "util/HostMemory.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string_view>

namespace devtel::util {

static inline uint64_t parse_u64(std::string_view s) {
  uint64_t v = 0;
  // strip non-digits on right (e.g., kB)
  while (!s.empty() && (s.back() < '0' || s.back() > '9')) s.remove_suffix(1);
  // strip spaces on left
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  std::from_chars(s.data(), s.data() + s.size(), v);
  return v;
}

bool host_total_memory(uint64_t& bytes, std::string& err) {
  auto txt_opt = read_file_string("/proc/meminfo");
  if (!txt_opt) { err = "cannot read /proc/meminfo"; return false; }
  const std::string& txt = *txt_opt;

  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start);
    if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("MemTotal:")) {
      uint64_t kb = parse_u64(line.substr(9));
      if (kb == 0) { err = "MemTotal is zero in /proc/meminfo"; return false; }
      bytes = kb * 1024ull;
      return true;
    }
    start = end + 1;
  }
  err = "MemTotal missing from /proc/meminfo";
  return false;
}

} // namespace devtel::util
