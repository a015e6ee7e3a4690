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

#include "topology/node.hpp"

#include <algorithm>
#include <sstream>

namespace usbport::topology {

std::string StatusFlags::letters() const {
  std::string out;
  if (has(Powered)) out += 'P';
  if (has(Connected)) out += 'C';
  if (has(Enabled)) out += 'E';
  if (has(Resetting)) out += 'R';
  if (has(Suspended)) out += 'S';
  return out;
}

StatusFlags StatusFlags::from_port_status(std::uint16_t st, int usb_level) noexcept {
  StatusFlags f;
  const std::uint16_t power_bit = usb_level >= 3 ? USB_PORT_STAT_POWER_SS : USB_PORT_STAT_POWER;
  if (st & power_bit) f.set(Powered);
  if (st & USB_PORT_STAT_CONNECTION) f.set(Connected);
  if (st & USB_PORT_STAT_ENABLE) f.set(Enabled);
  if (st & USB_PORT_STAT_RESET) f.set(Resetting);
  if (st & USB_PORT_STAT_SUSPEND) f.set(Suspended);
  return f;
}

bool DeviceInfo::has_bound_driver() const noexcept {
  if (!driver.empty()) return true;
  return std::any_of(interfaces.begin(), interfaces.end(),
                     [](const InterfaceInfo& i) { return !i.driver.empty(); });
}

std::vector<std::string> DeviceInfo::ttys() const {
  std::vector<std::string> out;
  for (const auto& i : interfaces) out.insert(out.end(), i.ttys.begin(), i.ttys.end());
  std::sort(out.begin(), out.end());
  return out;
}

std::string DeviceInfo::devnode() const {
  std::ostringstream oss;
  oss << "/dev/bus/usb/";
  oss.width(3);
  oss.fill('0');
  oss << busnum;
  oss << "/";
  oss.width(3);
  oss.fill('0');
  oss << devnum;
  return oss.str();
}

} // namespace usbport::topology
