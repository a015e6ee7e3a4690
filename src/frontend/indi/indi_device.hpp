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

#include "engine/control_engine.hpp"
#include "frontend/indi/xml.hpp"
#include "topology/port_address.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace usbport::indi {

inline constexpr const char* kProtocolVersion = "1.7";

// "USBPORT_" followed by the upper-cased short host name.
std::string default_device_name();

// Property name of a port: "PORT_" and the address with '-' and '.' as '_'.
std::string property_name(const topology::PortAddress& addr);

// The INDI view of the engine: one writable text vector per listed port,
// with an INFO element holding the listing line and a COMMAND element that
// accepts a command name. Transport-free; every reply is meant for all
// connected clients.
class IndiDevice {
public:
  IndiDevice(engine::ControlEngine& engine, std::string name);

  const std::string& name() const noexcept { return name_; }

  std::vector<XmlElement> handle(const XmlElement& msg);

private:
  struct PortProp {
    topology::PortAddress address;
    std::string info;
  };
  using PropMap = std::map<std::string, PortProp>;

  std::vector<XmlElement> get_properties_(const XmlElement& msg);
  std::vector<XmlElement> new_text_vector_(const XmlElement& msg);

  core::Result<PropMap> current_ports_();

  // Defines, updates and deletes vectors so clients match ports; the vector
  // named target gets state and message.
  std::vector<XmlElement> refresh_(const std::string& target, std::string_view state, const std::string& message);

  XmlElement def_vector_(const std::string& prop, const PortProp& p) const;
  XmlElement set_vector_(const std::string& prop, const PortProp& p, std::string_view state,
                         const std::string& message) const;
  XmlElement del_property_(const std::string& prop) const;
  XmlElement message_(const std::string& text) const;

private:
  engine::ControlEngine& engine_;
  std::string name_;

  // What the clients have been told exists.
  PropMap defined_;
};

} // namespace usbport::indi
