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

#include "frontend/indi/indi_device.hpp"

#include "core/str.hpp"
#include "frontend/render.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <unistd.h>

namespace usbport::indi {

namespace {

constexpr std::string_view kIdle = "Idle";
constexpr std::string_view kOk = "Ok";
constexpr std::string_view kAlert = "Alert";

constexpr const char* kInfo = "INFO";
constexpr const char* kCommand = "COMMAND";

} // namespace

std::string default_device_name() {
  char host[256]{};
  std::string h;
  if (::gethostname(host, sizeof(host) - 1) == 0) h = host;
  h = h.substr(0, h.find('.'));
  if (h.empty()) h = "localhost";

  std::transform(h.begin(), h.end(), h.begin(), [](unsigned char c) {
    return std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_';
  });
  return "USBPORT_" + h;
}

std::string property_name(const topology::PortAddress& addr) {
  std::string s = "PORT_" + addr.str();
  std::replace(s.begin(), s.end(), '-', '_');
  std::replace(s.begin(), s.end(), '.', '_');
  return s;
}

IndiDevice::IndiDevice(engine::ControlEngine& engine, std::string name)
  : engine_(engine), name_(std::move(name)) {}

std::vector<XmlElement> IndiDevice::handle(const XmlElement& msg) {
  if (msg.tag == "getProperties") return get_properties_(msg);
  if (msg.tag == "newTextVector") return new_text_vector_(msg);

  spdlog::debug("INDI: ignoring <{}>", msg.tag);
  return {};
}

std::vector<XmlElement> IndiDevice::get_properties_(const XmlElement& msg) {
  if (const auto* dev = msg.attr("device"); dev && *dev != name_) return {};

  auto pr = current_ports_();
  if (!pr) return {message_(pr.st.msg)};

  std::vector<XmlElement> out;
  for (const auto& [prop, p] : defined_) {
    if (!pr.value.count(prop)) out.push_back(del_property_(prop));
  }
  defined_ = std::move(pr.value);

  const auto* only = msg.attr("name");
  for (const auto& [prop, p] : defined_) {
    if (only && *only != prop) continue;
    out.push_back(def_vector_(prop, p));
  }
  return out;
}

std::vector<XmlElement> IndiDevice::new_text_vector_(const XmlElement& msg) {
  if (msg.attr_or("device") != name_) return {};

  const std::string prop = msg.attr_or("name");
  const auto it = defined_.find(prop);
  if (it == defined_.end()) {
    spdlog::warn("INDI: write to unknown property '{}'", prop);
    return {message_(fmt::format("{}: no such property", prop))};
  }
  const topology::PortAddress addr = it->second.address;

  std::string text;
  if (const auto* c = msg.child_named("oneText", kCommand)) text = std::string(core::trim(c->text));

  if (text.empty()) return refresh_(prop, kOk, {});

  const auto cmd = engine::parse_command(text);
  if (!cmd) {
    spdlog::warn("INDI: {}: command '{}' not recognized", prop, text);
    return refresh_(prop, kAlert, "command not recognized");
  }

  const engine::Outcome o = engine_.execute(addr, *cmd);
  return refresh_(prop, o.ok() ? kOk : kAlert, o.describe());
}

core::Result<IndiDevice::PropMap> IndiDevice::current_ports_() {
  auto lr = engine_.list();
  if (!lr) return core::Result<PropMap>::Fail(std::move(lr.st));

  PropMap out;
  for (const auto& e : lr.value) {
    if (auto line = frontend::render_line(e)) {
      out.emplace(property_name(e.address), PortProp{e.address, std::move(*line)});
    }
  }
  return core::Result<PropMap>::Ok(std::move(out));
}

std::vector<XmlElement> IndiDevice::refresh_(const std::string& target, std::string_view state,
                                              const std::string& message) {
  std::vector<XmlElement> out;

  auto pr = current_ports_();
  if (!pr) {
    out.push_back(message_(pr.st.msg));
    if (const auto it = defined_.find(target); it != defined_.end()) {
      out.push_back(set_vector_(target, it->second, kAlert, message.empty() ? pr.st.msg : message));
    }
    return out;
  }
  const PropMap& now = pr.value;

  for (const auto& [prop, p] : defined_) {
    if (!now.count(prop)) out.push_back(del_property_(prop));
  }
  for (const auto& [prop, p] : now) {
    if (!defined_.count(prop)) out.push_back(def_vector_(prop, p));
  }
  for (const auto& [prop, p] : now) {
    if (prop == target) {
      out.push_back(set_vector_(prop, p, state, message));
    } else {
      out.push_back(set_vector_(prop, p, kIdle, {}));
    }
  }
  if (!now.count(target) && !message.empty()) out.push_back(message_(message));

  defined_ = std::move(pr.value);
  return out;
}

XmlElement IndiDevice::def_vector_(const std::string& prop, const PortProp& p) const {
  const std::string addr = p.address.str();

  XmlElement v("defTextVector");
  v.set("device", name_).set("name", prop).set("label", addr).set("group", addr);
  v.set("state", std::string(kIdle)).set("perm", "rw").set("timeout", "0");

  XmlElement info("defText");
  info.set("name", kInfo).set("label", "Port");
  info.text = p.info;

  XmlElement cmd("defText");
  cmd.set("name", kCommand).set("label", "Command");

  v.add(std::move(info)).add(std::move(cmd));
  return v;
}

XmlElement IndiDevice::set_vector_(const std::string& prop, const PortProp& p, std::string_view state,
                                   const std::string& message) const {
  XmlElement v("setTextVector");
  v.set("device", name_).set("name", prop).set("state", std::string(state));
  if (!message.empty()) v.set("message", message);

  XmlElement info("oneText");
  info.set("name", kInfo);
  info.text = p.info;

  XmlElement cmd("oneText");
  cmd.set("name", kCommand);

  v.add(std::move(info)).add(std::move(cmd));
  return v;
}

XmlElement IndiDevice::del_property_(const std::string& prop) const {
  XmlElement d("delProperty");
  d.set("device", name_).set("name", prop);
  return d;
}

XmlElement IndiDevice::message_(const std::string& text) const {
  XmlElement m("message");
  m.set("device", name_).set("message", text);
  return m;
}

} // namespace usbport::indi
