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

#include "core/status.hpp"
#include "topology/node.hpp"
#include "usb/backend.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace usbport::linux {

inline constexpr const char* kSysUsbDevices = "/sys/bus/usb/devices";

// Every device directory under base ("usbN" root hubs and "B-p.p..."
// devices). Interface directories are folded into their device. A device
// whose identifying attributes cannot be read yet is returned without info.
core::Result<std::vector<usb::UsbDeviceRecord>>
enumerate_usb_devices_sysfs(const std::filesystem::path& base = kSysUsbDevices);

std::optional<topology::DeviceInfo> load_device(const std::filesystem::path& dir, std::string sysname);

core::Status write_authorized(const std::filesystem::path& base, const std::string& sysname, bool authorized);

} // namespace usbport::linux
