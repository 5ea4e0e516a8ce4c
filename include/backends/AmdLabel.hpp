#pragma once
#include <string>
#include "util/IdTable.hpp"

namespace devtel::backends {

// Shorten long Instinct marketing names ("AMD Instinct MI300X" -> "MI300X").
std::string simplify_amd_name(const std::string& name);

// "0000:2f:00.0" -> "2f"
std::string simplify_pci_slot(const std::string& slot);

// <model>.<slot>, or <model> without a slot, or AMD.<card> as last resort.
std::string format_amd_label(const std::string& name, const std::string& slot, const std::string& card);

// PCI_SLOT_NAME from <device_path>/uevent, empty when unavailable.
std::string pci_slot_name(const std::string& device_path);

// Full label for one device; AMD.<card> when the id table is unavailable
// or has no entry for the device.
std::string amd_label(const std::string& card, const std::string& device_path,
                      const devtel::util::IdTable& ids);

} // namespace devtel::backends
