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
#include "topology/capability.hpp"
#include "topology/node.hpp"
#include "topology/port_address.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace usbport::usb {

// Hub port feature selectors, USB 2.0 table 11-17
enum class HubFeature : std::uint16_t {
  PortEnable = 1,
  PortReset  = 4,
  PortPower  = 8,
};

const char* to_string(HubFeature f) noexcept;

struct UsbDeviceRecord {
  topology::PortAddress address;
  // nullopt when the device's descriptors could not be read (for example
  // while it is still being enumerated).
  std::optional<topology::DeviceInfo> info;
};

struct HubState {
  topology::HubDescriptor desc;
  // wPortStatus per port, index 0 is port 1. nullopt for a port whose
  // status request failed.
  std::vector<std::optional<std::uint16_t>> port_status;
};

// The host's USB access. Everything the engine does to hardware goes through
// this interface.
class IUsbBackend {
public:
  virtual ~IUsbBackend() = default;

  // Every USB device currently known to the host, root hubs included.
  virtual core::Result<std::vector<UsbDeviceRecord>> enumerate() = 0;

  // Class descriptor and port status of a hub.
  virtual core::Result<HubState> read_hub(const topology::DeviceInfo& hub) = 0;

  virtual core::Status hub_feature(const topology::DeviceInfo& hub, int port,
                                   HubFeature feature, bool set) = 0;

  // Unbind the interface drivers, reset the device and bind them again.
  virtual core::Status rebind_driver(const topology::DeviceInfo& dev) = 0;

  // Kernel device-model authorization (logical power) of a device.
  virtual core::Status set_authorized(const topology::DeviceInfo& dev, bool authorized) = 0;
};

} // namespace usbport::usb
