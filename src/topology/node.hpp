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

#include "topology/capability.hpp"
#include "topology/port_address.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace usbport::topology {

// wPortStatus bits, USB 2.0 table 11-21
inline constexpr std::uint16_t USB_PORT_STAT_CONNECTION = 0x0001;
inline constexpr std::uint16_t USB_PORT_STAT_ENABLE     = 0x0002;
inline constexpr std::uint16_t USB_PORT_STAT_SUSPEND    = 0x0004;
inline constexpr std::uint16_t USB_PORT_STAT_RESET      = 0x0010;
inline constexpr std::uint16_t USB_PORT_STAT_POWER      = 0x0100;
inline constexpr std::uint16_t USB_PORT_STAT_POWER_SS   = 0x0200; // USB 3.x hubs

inline constexpr std::uint8_t USB_CLASS_HUB = 0x09;

struct StatusFlags {
  enum Bit : std::uint8_t {
    Powered   = 1u << 0,
    Enabled   = 1u << 1,
    Connected = 1u << 2,
    Suspended = 1u << 3,
    Resetting = 1u << 4,
  };

  std::uint8_t bits = 0;

  bool has(Bit b) const noexcept { return (bits & b) != 0; }
  void set(Bit b) noexcept { bits = static_cast<std::uint8_t>(bits | b); }
  bool empty() const noexcept { return bits == 0; }

  // Single-letter codes in listing order: P C E R S.
  std::string letters() const;

  static StatusFlags from_port_status(std::uint16_t wPortStatus, int usb_level) noexcept;

  friend bool operator==(const StatusFlags&, const StatusFlags&) = default;
};

struct InterfaceInfo {
  int number = -1;
  std::string driver; // empty when nothing is bound
  std::vector<std::string> ttys;

  friend bool operator==(const InterfaceInfo&, const InterfaceInfo&) = default;
};

struct DeviceInfo {
  std::string sysname; // kernel name, e.g. "1-1.4"
  int busnum = -1;
  int devnum = -1;

  std::uint16_t vendor = 0;
  std::uint16_t product = 0;
  std::uint8_t device_class = 0;
  int usb_level = 2;

  std::optional<std::string> serial;
  std::optional<std::string> manufacturer;
  std::optional<std::string> product_name;

  std::string driver; // device-level driver ("usb" once enumerated)
  std::vector<InterfaceInfo> interfaces;

  // Kernel authorization state; nullopt when the host does not expose a
  // writable "authorized" attribute for this device.
  std::optional<bool> authorized;

  bool is_hub() const noexcept { return device_class == USB_CLASS_HUB; }
  bool has_bound_driver() const noexcept;
  std::vector<std::string> ttys() const;
  std::string devnode() const;

  friend bool operator==(const DeviceInfo&, const DeviceInfo&) = default;
};

struct TopologyNode {
  PortAddress address;
  StatusFlags flags;
  std::optional<DeviceInfo> device;

  // Capabilities of the enclosing hub toward this port (empty for bus roots).
  CapabilityMask caps;

  // Set on hub nodes whose class descriptor was read.
  std::optional<HubCapabilities> hub;

  std::vector<TopologyNode> children; // ascending port number

  bool is_bus() const noexcept { return address.is_bus(); }
  bool is_hub() const noexcept { return device && device->is_hub(); }
};

} // namespace usbport::topology
