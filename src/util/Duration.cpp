#include "util/Duration.hpp"

#include <cctype>
#include <cmath>
#include <string_view>

namespace devtel::util {

static bool unit_scale(std::string_view unit, double& ns_per_unit) {
  if (unit == "ns") { ns_per_unit = 1.0; return true; }
  if (unit == "us" || unit == "\xC2\xB5s" || unit == "\xCE\xBCs") { ns_per_unit = 1e3; return true; }
  if (unit == "ms") { ns_per_unit = 1e6; return true; }
  if (unit == "s")  { ns_per_unit = 1e9; return true; }
  if (unit == "m")  { ns_per_unit = 60e9; return true; }
  if (unit == "h")  { ns_per_unit = 3600e9; return true; }
  return false;
}

bool parse_duration(const std::string& text, std::chrono::nanoseconds& out) {
  std::string_view s(text);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  if (s.empty()) return false;
  if (s.front() == '+') s.remove_prefix(1);
  if (s == "0") { out = std::chrono::nanoseconds(0); return true; }
  if (s.empty() || s.front() == '-') return false;

  double total_ns = 0.0;
  while (!s.empty()) {
    // number: digits with optional fraction
    size_t i = 0;
    bool digits = false;
    double value = 0.0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
      value = value * 10.0 + (s[i] - '0'); ++i; digits = true;
    }
    if (i < s.size() && s[i] == '.') {
      ++i;
      double scale = 0.1;
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
        value += (s[i] - '0') * scale; scale /= 10.0; ++i; digits = true;
      }
    }
    if (!digits) return false;
    s.remove_prefix(i);
    // unit: everything up to the next digit or '.'
    size_t j = 0;
    while (j < s.size() && s[j] != '.' && !std::isdigit(static_cast<unsigned char>(s[j]))) ++j;
    if (j == 0) return false; // missing unit
    double scale = 0.0;
    if (!unit_scale(s.substr(0, j), scale)) return false;
    s.remove_prefix(j);
    total_ns += value * scale;
  }
  if (!std::isfinite(total_ns) || total_ns > 9.2e18) return false;
  out = std::chrono::nanoseconds(static_cast<long long>(std::llround(total_ns)));
  return true;
}

} // namespace devtel::util
