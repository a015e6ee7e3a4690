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

#include "topology/capability.hpp"

namespace usbport::topology {

HubCapabilities resolve_hub(const HubDescriptor& desc) noexcept {
  HubCapabilities caps;
  caps.usb_level = desc.usb_level;
  caps.nports = desc.nports;

  switch (desc.characteristics & HUB_CHAR_LPSM) {
    case HUB_CHAR_LPSM_GANGED: caps.power = PowerSwitching::Ganged; break;
    case HUB_CHAR_LPSM_PORT:   caps.power = PowerSwitching::PerPort; break;
    default:                   caps.power = PowerSwitching::None; break;
  }

  // PORT_ENABLE can only be cleared on USB 2.0 (and older) hubs; SuperSpeed
  // hubs reject the feature selector.
  caps.port_disable = desc.usb_level <= 2;
  caps.port_reset = desc.nports > 0;
  return caps;
}

CapabilityMask mask_for(const HubCapabilities& caps) noexcept {
  CapabilityMask m;
  m.power_switch = caps.power != PowerSwitching::None;
  m.ganged = caps.power == PowerSwitching::Ganged;
  m.disable = caps.port_disable;
  m.hard_reset = caps.port_reset;
  return m;
}

const char* to_string(PowerSwitching p) noexcept {
  switch (p) {
    case PowerSwitching::None: return "none";
    case PowerSwitching::Ganged: return "ganged";
    case PowerSwitching::PerPort: return "per-port";
  }
  return "?";
}

std::string describe(const CapabilityMask& m) {
  if (m.empty()) return "none";
  std::string out;
  auto add = [&](const char* s) {
    if (!out.empty()) out += ',';
    out += s;
  };
  if (m.power_switch) add(m.ganged ? "power(ganged)" : "power");
  if (m.disable) add("disable");
  if (m.hard_reset) add("reset");
  return out;
}

} // namespace usbport::topology
