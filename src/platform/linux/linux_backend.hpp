/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include "platform/linux/sysfs_usb.hpp"
#include "usb/backend.hpp"

#include <filesystem>

namespace usbport::linux {

struct LinuxBackendCfg {
  std::filesystem::path sysfs = kSysUsbDevices;
  int control_timeout_ms = 5000;
};

// sysfs for enumeration and authorization, usbfs for hub requests and resets.
class LinuxUsbBackend final : public usb::IUsbBackend {
public:
  explicit LinuxUsbBackend(LinuxBackendCfg cfg = {}) : cfg_(std::move(cfg)) {}

  // Startup check: the sysfs tree must exist.
  core::Status check_access() const;

  core::Result<std::vector<usb::UsbDeviceRecord>> enumerate() override;
  core::Result<usb::HubState> read_hub(const topology::DeviceInfo& hub) override;
  core::Status hub_feature(const topology::DeviceInfo& hub, int port,
                           usb::HubFeature feature, bool set) override;
  core::Status rebind_driver(const topology::DeviceInfo& dev) override;
  core::Status set_authorized(const topology::DeviceInfo& dev, bool authorized) override;

private:
  LinuxBackendCfg cfg_;
};

} // namespace usbport::linux
