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

#include "usb/backend.hpp"

namespace usbport::usb {

const char* to_string(HubFeature f) noexcept {
  switch (f) {
    case HubFeature::PortEnable: return "PORT_ENABLE";
    case HubFeature::PortReset: return "PORT_RESET";
    case HubFeature::PortPower: return "PORT_POWER";
  }
  return "PORT_?";
}

} // namespace usbport::usb
