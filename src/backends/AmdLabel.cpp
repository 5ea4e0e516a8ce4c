#include "backends/AmdLabel.hpp"
#include "util/Procfs.hpp"
#include "util/Sysfs.hpp"

#include <utility>

namespace devtel::backends {

static std::string trim(const std::string& s) {
  auto issp = [](unsigned char c){ return c==' '||c=='\t'||c=='\r'||c=='\n'; };
  size_t b = 0, e = s.size();
  while (b < e && issp(s[b])) ++b;
  while (e > b && issp(s[e-1])) --e;
  return s.substr(b, e - b);
}

static void replace_all(std::string& s, const std::string& from, const std::string& to) {
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

// Order matters: longer MI250 spellings before the bare one, MI300X before MI300.
static const std::pair<const char*, const char*> kAmdAliases[] = {
  {"AMD Instinct MI210",          "MI210"},
  {"AMD MI210",                   "MI210"},
  {"AMD Instinct MI250X / MI250", "MI250"},
  {"AMD Instinct MI250X/MI250",   "MI250"},
  {"AMD Instinct MI250",          "MI250"},
  {"AMD Instinct MI300X",         "MI300X"},
  {"AMD MI300X",                  "MI300X"},
  {"AMD Instinct MI300",          "MI300"},
  {"AMD MI300",                   "MI300"},
  {"AMD Instinct MI325X",         "MI325X"},
  {"AMD MI325X",                  "MI325X"},
};

std::string simplify_amd_name(const std::string& name) {
  std::string clean = trim(name);
  if (clean.empty()) return clean;
  for (const auto& [from, to] : kAmdAliases) replace_all(clean, from, to);
  return clean;
}

std::string simplify_pci_slot(const std::string& slot) {
  std::string clean = trim(slot);
  if (clean.empty()) return clean;
  if (clean.rfind("0000:", 0) == 0) clean.erase(0, 5);
  if (clean.size() >= 5 && clean.compare(clean.size() - 5, 5, ":00.0") == 0) clean.erase(clean.size() - 5);
  return clean;
}

std::string format_amd_label(const std::string& name, const std::string& slot, const std::string& card) {
  std::string clean_name = simplify_amd_name(name);
  std::string clean_slot = simplify_pci_slot(slot);
  if (!clean_slot.empty()) return clean_name + "." + clean_slot;
  if (!clean_name.empty() && clean_name != "AMD") return clean_name;
  return "AMD." + card;
}

std::string pci_slot_name(const std::string& device_path) {
  auto uevent = devtel::util::read_file_string(device_path + "/uevent");
  if (!uevent) return {};
  size_t start = 0;
  const std::string& txt = *uevent;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start);
    if (end == std::string::npos) end = txt.size();
    std::string line = txt.substr(start, end - start);
    if (line.rfind("PCI_SLOT_NAME=", 0) == 0) return trim(line.substr(14));
    start = end + 1;
  }
  return {};
}

std::string amd_label(const std::string& card, const std::string& device_path,
                      const devtel::util::IdTable& ids) {
  if (ids.available()) {
    uint32_t dev_id = 0, rev_id = 0;
    std::string err;
    if (devtel::util::read_id_file(device_path + "/device", dev_id, err) &&
        devtel::util::read_id_file(device_path + "/revision", rev_id, err)) {
      if (auto name = ids.lookup(dev_id, rev_id)) return format_amd_label(*name, pci_slot_name(device_path), card);
    }
  }
  // Unresolved model: the card name keeps devices apart without a table
  return "AMD." + card;
}

} // namespace devtel::backends
