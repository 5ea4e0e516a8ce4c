#include "util/IdTable.hpp"
#include "util/Procfs.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace devtel::util {

static std::string trim(const std::string& s) {
  auto issp = [](unsigned char c){ return c==' '||c=='\t'||c=='\r'||c=='\n'; };
  size_t b = 0, e = s.size();
  while (b < e && issp(s[b])) ++b;
  while (e > b && issp(s[e-1])) --e;
  return s.substr(b, e - b);
}

static bool parse_hex32(const std::string& s, uint32_t& out) {
  if (s.empty() || !std::isxdigit(static_cast<unsigned char>(s[0]))) return false;
  errno = 0;
  char* end = nullptr;
  unsigned long long v = std::strtoull(s.c_str(), &end, 16);
  if (errno != 0 || *end != '\0' || v > 0xFFFFFFFFull) return false;
  out = static_cast<uint32_t>(v);
  return true;
}

const IdTable& IdTable::shared() {
  static IdTable table;
  static std::once_flag once;
  std::call_once(once, []{ table.load(default_paths()); });
  return table;
}

std::vector<std::string> IdTable::default_paths() {
  std::vector<std::string> paths;
  if (const char* env = std::getenv("DEVTEL_AMDGPU_IDS"); env && *env) paths.emplace_back(env);
  paths.emplace_back("/usr/share/libdrm/amdgpu.ids");
  paths.emplace_back("/opt/amdgpu/share/libdrm/amdgpu.ids");
  return paths;
}

bool IdTable::load(const std::vector<std::string>& paths) {
  names_.clear();
  available_ = false;
  source_.clear();
  for (const auto& p : paths) {
    // A directory opens fine as an ifstream but reads nothing
    if (!is_regular_file(p)) continue;
    std::ifstream in(p);
    if (!in) continue;
    std::stringstream ss;
    ss << in.rdbuf();
    if (in.bad()) continue;
    parse(ss.str());
    available_ = true;
    error_.clear();
    source_ = p;
    return true;
  }
  error_ = "amdgpu.ids not found";
  return false;
}

void IdTable::parse(const std::string& content) {
  std::istringstream in(content);
  std::string raw;
  while (std::getline(in, raw)) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#' || line.find(',') == std::string::npos) continue;
    // device, revision, name (name may itself contain commas)
    size_t c1 = line.find(',');
    size_t c2 = line.find(',', c1 + 1);
    if (c2 == std::string::npos) continue;
    std::string dev = trim(line.substr(0, c1));
    std::string rev = trim(line.substr(c1 + 1, c2 - c1 - 1));
    std::string name = trim(line.substr(c2 + 1));
    if (dev.empty() || rev.empty() || name.empty()) continue;
    uint32_t dev_id = 0, rev_id = 0;
    if (!parse_hex32(dev, dev_id) || !parse_hex32(rev, rev_id)) continue;
    names_[key(dev_id, rev_id)] = name;
  }
}

std::optional<std::string> IdTable::lookup(uint32_t device_id, uint32_t revision_id) const {
  auto it = names_.find(key(device_id, revision_id));
  if (it == names_.end() || it->second.empty()) return std::nullopt;
  return it->second;
}

} // namespace devtel::util
