#include "util/Sysfs.hpp"
#include "util/Procfs.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace devtel::util {

static std::string trim(const std::string& s) {
  auto issp = [](unsigned char c){ return c==' '||c=='\t'||c=='\r'||c=='\n'; };
  size_t b = 0, e = s.size();
  while (b < e && issp(s[b])) ++b;
  while (e > b && issp(s[e-1])) --e;
  return s.substr(b, e - b);
}

static bool read_trimmed(const std::string& abs, std::string& out, std::string& err) {
  auto txt = read_file_string(abs);
  if (!txt) { err = "cannot read " + abs; return false; }
  out = trim(*txt);
  if (out.empty()) { err = "empty value in " + abs; return false; }
  return true;
}

bool read_int_file(const std::string& abs, long long& out, std::string& err) {
  std::string s;
  if (!read_trimmed(abs, s, err)) return false;
  errno = 0;
  char* end = nullptr;
  long long v = std::strtoll(s.c_str(), &end, 10);
  if (errno != 0 || end == s.c_str() || *end != '\0') {
    err = "invalid integer \"" + s + "\" in " + abs;
    return false;
  }
  out = v;
  return true;
}

bool read_u64_file(const std::string& abs, uint64_t& out, std::string& err) {
  std::string s;
  if (!read_trimmed(abs, s, err)) return false;
  if (s[0] == '-' || s[0] == '+') {
    err = "invalid unsigned integer \"" + s + "\" in " + abs;
    return false;
  }
  errno = 0;
  char* end = nullptr;
  unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (errno != 0 || end == s.c_str() || *end != '\0') {
    err = "invalid unsigned integer \"" + s + "\" in " + abs;
    return false;
  }
  out = static_cast<uint64_t>(v);
  return true;
}

bool read_id_file(const std::string& abs, uint32_t& out, std::string& err) {
  std::string s;
  if (!read_trimmed(abs, s, err)) return false;
  if (s[0] == '-' || s[0] == '+') {
    err = "invalid id \"" + s + "\" in " + abs;
    return false;
  }
  errno = 0;
  char* end = nullptr;
  unsigned long long v = std::strtoull(s.c_str(), &end, 0);
  if (errno != 0 || end == s.c_str() || *end != '\0' || v > std::numeric_limits<uint32_t>::max()) {
    err = "invalid id \"" + s + "\" in " + abs;
    return false;
  }
  out = static_cast<uint32_t>(v);
  return true;
}

} // namespace devtel::util
