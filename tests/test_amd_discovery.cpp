#include "minitest.hpp"
#include "SysTree.hpp"
#include "backends/AmdDiscovery.hpp"

#include <algorithm>

using namespace devtel::backends;

static const char* kIds = "74A1,\t00,\tAMD Instinct MI300X\n740F,\t02,\tAMD Instinct MI210\n";

static std::vector<std::string> labels_of(const std::vector<AmdGpu>& gpus) {
  std::vector<std::string> out;
  for (const auto& g : gpus) out.push_back(g.label);
  return out;
}

TEST(amd_discovery_drm_scan_filters_candidates) {
  SysTree t("disc_drm");
  t.amd_device("sys/class/drm/card0/device", "0x74a1", "0x00", "0000:2f:00.0");
  t.amd_device("sys/class/drm/card1/device", "0x740f", "0x02", "0000:c1:00.0");
  // Connector directories share the card prefix
  t.write("sys/class/drm/card0-DP-1/device/vendor", "0x1002\n");
  // Other vendor
  t.write("sys/class/drm/card2/device/vendor", "0x10de\n");
  // AMD device handed to another driver
  t.write("sys/class/drm/card3/device/vendor", "0x1002\n");
  t.symlink("../../../../bus/pci/drivers/vfio-pci", "sys/class/drm/card3/device/driver");
  t.mkdir("sys/class/drm/renderD128");
  t.write("sys/class/drm/version", "drm 1.1.0 20060810\n");
  t.use_sys();

  devtel::util::IdTable ids;
  ASSERT_TRUE(ids.load({t.ids_file(kIds)}));
  std::vector<AmdGpu> gpus; std::string err;
  ASSERT_TRUE(discover_amd_gpus(ids, gpus, err));
  ASSERT_EQ(gpus.size(), 2u);
  ASSERT_EQ(gpus[0].label, "MI300X.2f");
  ASSERT_EQ(gpus[0].card, "card0");
  ASSERT_EQ(gpus[0].device_path, "/sys/class/drm/card0/device");
  ASSERT_EQ(gpus[1].label, "MI210.c1");
  ASSERT_EQ(driver_name("/sys/class/drm/card0/device"), "amdgpu");
  ASSERT_EQ(driver_name("/sys/class/drm/card2/device"), "");
}

TEST(amd_discovery_is_idempotent) {
  SysTree t("disc_idem");
  t.amd_device("sys/class/drm/card0/device");
  t.amd_device("sys/class/drm/card1/device", "0x74a1", "0x00", "0000:45:00.0");
  t.use_sys();
  devtel::util::IdTable ids;
  ASSERT_TRUE(ids.load({t.ids_file(kIds)}));
  std::vector<AmdGpu> first, second; std::string err;
  ASSERT_TRUE(discover_amd_gpus(ids, first, err));
  ASSERT_TRUE(discover_amd_gpus(ids, second, err));
  ASSERT_TRUE(labels_of(first) == labels_of(second));
  ASSERT_EQ(first.size(), 2u);
}

TEST(amd_discovery_falls_back_to_driver_binding) {
  SysTree t("disc_drv");
  t.mkdir("sys/class/drm");
  t.amd_device("sys/bus/pci/devices/0000:2f:00.0");
  t.mkdir("sys/bus/pci/drivers/amdgpu/0000:2f:00.0");
  t.write("sys/bus/pci/drivers/amdgpu/bind", "");
  t.write("sys/bus/pci/drivers/amdgpu/unbind", "");
  t.write("sys/bus/pci/drivers/amdgpu/new_id", "");
  t.write("sys/bus/pci/drivers/amdgpu/uevent", "");
  t.mkdir("sys/bus/pci/drivers/amdgpu/module");
  // Bound entry whose device directory vanished
  t.mkdir("sys/bus/pci/drivers/amdgpu/0000:99:00.0");
  t.use_sys();
  devtel::util::IdTable ids;
  ASSERT_TRUE(ids.load({t.ids_file(kIds)}));
  std::vector<AmdGpu> gpus; std::string err;
  ASSERT_TRUE(discover_amd_gpus(ids, gpus, err));
  ASSERT_EQ(gpus.size(), 1u);
  ASSERT_EQ(gpus[0].label, "MI300X.2f");
  ASSERT_EQ(gpus[0].card, "0000:2f:00.0");
  ASSERT_EQ(gpus[0].device_path, "/sys/bus/pci/devices/0000:2f:00.0");
}

TEST(amd_discovery_no_driver_means_no_devices) {
  SysTree t("disc_none");
  t.mkdir("sys/class/drm/card0");
  t.write("sys/class/drm/card0/device/vendor", "0x8086\n");
  t.use_sys();
  devtel::util::IdTable ids;
  std::vector<AmdGpu> gpus; std::string err;
  ASSERT_TRUE(discover_amd_gpus(ids, gpus, err));
  ASSERT_TRUE(gpus.empty());
  ASSERT_TRUE(err.empty());
}

TEST(amd_discovery_missing_class_dir_is_error) {
  SysTree t("disc_err");
  t.mkdir("sys");
  t.use_sys();
  devtel::util::IdTable ids;
  std::vector<AmdGpu> gpus; std::string err;
  ASSERT_TRUE(!discover_amd_gpus(ids, gpus, err));
  ASSERT_TRUE(err.find("/sys/class/drm") != std::string::npos);
}

TEST(amd_discovery_unreadable_driver_dir_is_error) {
  SysTree t("disc_drv_err");
  t.mkdir("sys/class/drm");
  // Present but not listable: opendir fails with ENOTDIR, not ENOENT
  t.write("sys/bus/pci/drivers/amdgpu", "");
  t.use_sys();
  devtel::util::IdTable ids;
  std::vector<AmdGpu> gpus; std::string err;
  ASSERT_TRUE(!discover_amd_gpus(ids, gpus, err));
  ASSERT_TRUE(gpus.empty());
  ASSERT_TRUE(err.find("/sys/bus/pci/drivers/amdgpu") != std::string::npos);
}

TEST(amd_discovery_duplicate_labels_get_card_suffix) {
  SysTree t("disc_dup");
  t.amd_device("sys/class/drm/card0/device");
  t.amd_device("sys/class/drm/card1/device");
  // No PCI slot: both resolve to the bare model name
  t.write("sys/class/drm/card0/device/uevent", "DRIVER=amdgpu\n");
  t.write("sys/class/drm/card1/device/uevent", "DRIVER=amdgpu\n");
  t.use_sys();
  devtel::util::IdTable ids;
  ASSERT_TRUE(ids.load({t.ids_file(kIds)}));
  std::vector<AmdGpu> gpus; std::string err;
  ASSERT_TRUE(discover_amd_gpus(ids, gpus, err));
  auto labels = labels_of(gpus);
  ASSERT_EQ(labels.size(), 2u);
  ASSERT_EQ(labels[0], "MI300X");
  ASSERT_EQ(labels[1], "MI300X.card1");
}
