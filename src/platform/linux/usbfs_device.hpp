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
#include "platform/posix-common/filehandle.hpp"
#include "topology/capability.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace usbport::linux {

struct ControlSetup {
  std::uint8_t bRequestType = 0;
  std::uint8_t bRequest = 0;
  std::uint16_t wValue = 0;
  std::uint16_t wIndex = 0;
};

// A usbfs node (/dev/bus/usb/BBB/DDD) opened for control transfers.
// Opening needs write access even for IN requests.
class UsbFsDevice {
 public:
  explicit UsbFsDevice(std::string devnode, int timeout_ms = 5000);
  ~UsbFsDevice();

  UsbFsDevice(const UsbFsDevice&) = delete;
  UsbFsDevice& operator=(const UsbFsDevice&) = delete;

  UsbFsDevice(UsbFsDevice&&) noexcept = default;
  UsbFsDevice& operator=(UsbFsDevice&&) noexcept = default;

  core::Status open() noexcept;
  void close() noexcept;
  bool is_open() const noexcept { return fd_.valid(); }

  const std::string& devnode() const noexcept { return devnode_; }

  // Bytes transferred on success.
  core::Result<int> control(const ControlSetup& setup, std::span<std::uint8_t> data) noexcept;

  // Class descriptor of a hub; SuperSpeed descriptor type for usb_level >= 3.
  core::Result<topology::HubDescriptor> hub_descriptor(int usb_level) noexcept;

  // wPortStatus of one downstream port.
  core::Result<std::uint16_t> port_status(int port) noexcept;

  core::Status port_feature(int port, std::uint16_t feature, bool set) noexcept;

  core::Status reset() noexcept;

  // Interface driver unbind/bind through USBDEVFS_IOCTL.
  core::Status disconnect_driver(int ifc) noexcept;
  core::Status connect_driver(int ifc) noexcept;

 private:
  std::string devnode_;
  int timeout_ms_ = 5000;
  FileHandle fd_;
};

} // namespace usbport::linux
