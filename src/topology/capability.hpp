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

#include <cstdint>
#include <string>

namespace usbport::topology {

// wHubCharacteristics, USB 2.0 11.23.2.1 / USB 3.2 10.15.2.1
inline constexpr std::uint16_t HUB_CHAR_LPSM       = 0x0003;
inline constexpr std::uint16_t HUB_CHAR_LPSM_GANGED = 0x0000;
inline constexpr std::uint16_t HUB_CHAR_LPSM_PORT   = 0x0001;

// Class-specific hub descriptor fields the resolver needs.
struct HubDescriptor {
  int nports = 0;
  std::uint16_t characteristics = 0;
  int usb_level = 2; // bcdUSB major version of the hub
};

enum class PowerSwitching : std::uint8_t { None, Ganged, PerPort };

// What one hub can do to its downstream ports.
struct HubCapabilities {
  PowerSwitching power = PowerSwitching::None;
  bool port_disable = false;
  bool port_reset = false;
  int usb_level = 0;
  int nports = 0;
};

struct CapabilityMask {
  bool power_switch = false;
  bool disable = false;
  bool hard_reset = false;
  // Power switching acts on every port of the hub at once.
  bool ganged = false;

  bool empty() const noexcept { return !power_switch && !disable && !hard_reset; }
  friend bool operator==(const CapabilityMask&, const CapabilityMask&) = default;
};

HubCapabilities resolve_hub(const HubDescriptor& desc) noexcept;
CapabilityMask mask_for(const HubCapabilities& caps) noexcept;

const char* to_string(PowerSwitching p) noexcept;
std::string describe(const CapabilityMask& m);

} // namespace usbport::topology
