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

#include "topology/node.hpp"
#include "topology/port_address.hpp"
#include "usb/backend.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace usbport::test {

using topology::DeviceInfo;
using topology::PortAddress;

// In-memory USB host. Hub port status follows the features written to it:
// switching a port off hides the devices below it until it is switched on.
class FakeUsbBackend final : public usb::IUsbBackend {
public:
  struct Call {
    std::string op; // "feature", "rebind" or "authorize"
    std::string target;
    int port = 0;
    usb::HubFeature feature = usb::HubFeature::PortPower;
    bool set = false;
  };

  // Runs inside the primitive, outside the backend lock. Its status is
  // what the primitive returns.
  using Hook = std::function<core::Status(const Call&)>;

  static std::string sysname_for(const PortAddress& a) {
    if (a.is_bus()) return "usb" + std::to_string(a.bus());
    std::string s = std::to_string(a.bus()) + "-";
    bool first = true;
    for (int p : a.ports()) {
      if (!first) s += '.';
      s += std::to_string(p);
      first = false;
    }
    return s;
  }

  static std::uint16_t power_bit(int usb_level) {
    return usb_level >= 3 ? topology::USB_PORT_STAT_POWER_SS : topology::USB_PORT_STAT_POWER;
  }

  DeviceInfo& add_hub(const PortAddress& addr, int usb_level, int nports, std::uint16_t characteristics) {
    DeviceInfo d;
    d.vendor = 0x1d6b;
    d.product = static_cast<std::uint16_t>(usb_level);
    d.device_class = topology::USB_CLASS_HUB;
    d.usb_level = usb_level;
    d.driver = "usb";
    d.interfaces.push_back({0, "hub", {}});
    d.authorized = true;

    usb::HubState h;
    h.desc.nports = nports;
    h.desc.characteristics = characteristics;
    h.desc.usb_level = usb_level;
    h.port_status.assign(static_cast<std::size_t>(nports), power_bit(usb_level));

    std::lock_guard lk(mtx_);
    hubs_[addr] = std::move(h);
    return place_(addr, std::move(d));
  }

  DeviceInfo& add_device(const PortAddress& addr, DeviceInfo d) {
    std::lock_guard lk(mtx_);
    return place_(addr, std::move(d));
  }

  // A device the kernel lists but whose descriptors cannot be read yet.
  void add_unreadable(const PortAddress& addr) {
    std::lock_guard lk(mtx_);
    devices_[addr] = Entry{};
    set_connected_(addr, true);
  }

  void fail_hub_reads(const PortAddress& hub) {
    std::lock_guard lk(mtx_);
    unreadable_hubs_.insert(hub);
  }

  void fail_enumeration(bool fail) {
    std::lock_guard lk(mtx_);
    fail_enumeration_ = fail;
  }

  void reverse_enumeration(bool rev) {
    std::lock_guard lk(mtx_);
    reverse_ = rev;
  }

  void set_hook(Hook h) {
    std::lock_guard lk(mtx_);
    hook_ = std::move(h);
  }

  std::vector<Call> calls() const {
    std::lock_guard lk(mtx_);
    return calls_;
  }

  std::size_t primitive_calls() const {
    std::lock_guard lk(mtx_);
    return calls_.size();
  }

  int enumerations() const {
    std::lock_guard lk(mtx_);
    return enumerations_;
  }

  std::optional<DeviceInfo> device(const PortAddress& addr) const {
    std::lock_guard lk(mtx_);
    auto it = devices_.find(addr);
    if (it == devices_.end()) return std::nullopt;
    return it->second.info;
  }

  core::Result<std::vector<usb::UsbDeviceRecord>> enumerate() override {
    using R = core::Result<std::vector<usb::UsbDeviceRecord>>;
    std::lock_guard lk(mtx_);
    ++enumerations_;
    if (fail_enumeration_) return R::Fail(core::Status::Errno(EACCES, "list /sys/bus/usb/devices"));

    std::vector<usb::UsbDeviceRecord> out;
    for (const auto& [addr, e] : devices_) {
      if (e.detached) continue;
      out.push_back(usb::UsbDeviceRecord{addr, e.info});
    }
    if (reverse_) std::reverse(out.begin(), out.end());
    return R::Ok(std::move(out));
  }

  core::Result<usb::HubState> read_hub(const DeviceInfo& hub) override {
    using R = core::Result<usb::HubState>;
    std::lock_guard lk(mtx_);
    const auto addr = address_of_(hub.sysname);
    if (!addr) return R::Failf("{}: not a known hub", hub.sysname);
    if (unreadable_hubs_.count(*addr)) return R::Fail(core::Status::Errno(EACCES, "open " + hub.devnode()));

    auto it = hubs_.find(*addr);
    if (it == hubs_.end()) return R::Failf("{}: not a hub", hub.sysname);
    return R::Ok(it->second);
  }

  core::Status hub_feature(const DeviceInfo& hub, int port, usb::HubFeature feature, bool set) override {
    Call c{"feature", hub.sysname, port, feature, set};
    USBPORT_TRY(run_(c));

    std::lock_guard lk(mtx_);
    const auto addr = address_of_(hub.sysname);
    if (!addr) return core::Status::Failf("{}: gone", hub.sysname);
    auto& h = hubs_.at(*addr);

    if (feature == usb::HubFeature::PortPower) {
      const bool ganged = (h.desc.characteristics & topology::HUB_CHAR_LPSM) == topology::HUB_CHAR_LPSM_GANGED;
      for (int p = 1; p <= h.desc.nports; ++p) {
        if (ganged || p == port) switch_power_(*addr, h, p, set);
      }
    } else if (feature == usb::HubFeature::PortEnable && !set) {
      auto& st = h.port_status[static_cast<std::size_t>(port - 1)];
      st = static_cast<std::uint16_t>(st.value_or(0) & ~topology::USB_PORT_STAT_ENABLE);
    }
    return core::Status::Ok();
  }

  core::Status rebind_driver(const DeviceInfo& dev) override {
    Call c{"rebind", dev.sysname, 0, usb::HubFeature::PortReset, true};
    return run_(c);
  }

  core::Status set_authorized(const DeviceInfo& dev, bool authorized) override {
    Call c{"authorize", dev.sysname, 0, usb::HubFeature::PortPower, authorized};
    USBPORT_TRY(run_(c));

    std::lock_guard lk(mtx_);
    const auto addr = address_of_(dev.sysname);
    if (!addr) return core::Status::Failf("{}: gone", dev.sysname);
    auto& info = devices_.at(*addr).info;
    if (info) info->authorized = authorized;
    return core::Status::Ok();
  }

private:
  struct Entry {
    std::optional<DeviceInfo> info;
    bool detached = false;
  };

  DeviceInfo& place_(const PortAddress& addr, DeviceInfo d) {
    d.sysname = sysname_for(addr);
    d.busnum = addr.bus();
    d.devnum = next_devnum_++;
    auto& e = devices_[addr];
    e.info = std::move(d);
    set_connected_(addr, true);
    return *e.info;
  }

  void set_connected_(const PortAddress& addr, bool on) {
    if (addr.is_bus()) return;
    auto it = hubs_.find(addr.parent());
    if (it == hubs_.end()) return;
    const auto idx = static_cast<std::size_t>(addr.port() - 1);
    if (idx >= it->second.port_status.size()) return;

    constexpr std::uint16_t link = topology::USB_PORT_STAT_CONNECTION | topology::USB_PORT_STAT_ENABLE;
    auto& st = it->second.port_status[idx];
    st = static_cast<std::uint16_t>(on ? (st.value_or(0) | link) : (st.value_or(0) & ~link));
  }

  void switch_power_(const PortAddress& hub, usb::HubState& h, int port, bool on) {
    const auto child = hub.child(port);
    const std::uint16_t bit = power_bit(h.desc.usb_level);
    auto& st = h.port_status[static_cast<std::size_t>(port - 1)];
    st = static_cast<std::uint16_t>(on ? (st.value_or(0) | bit) : (st.value_or(0) & ~bit));

    bool attached = false;
    for (auto& [a, e] : devices_) {
      if (a != child && !child.is_ancestor_of(a)) continue;
      e.detached = !on;
      if (a == child) attached = on;
    }
    if (!on || attached) {
      constexpr std::uint16_t link = topology::USB_PORT_STAT_CONNECTION | topology::USB_PORT_STAT_ENABLE;
      st = static_cast<std::uint16_t>(on ? (*st | link) : (*st & ~link));
    }
  }

  std::optional<PortAddress> address_of_(const std::string& sysname) const {
    for (const auto& [a, e] : devices_) {
      if (e.info && e.info->sysname == sysname) return a;
    }
    return std::nullopt;
  }

  core::Status run_(const Call& c) {
    Hook h;
    {
      std::lock_guard lk(mtx_);
      calls_.push_back(c);
      h = hook_;
    }
    if (h) return h(c);
    return core::Status::Ok();
  }

  mutable std::mutex mtx_;
  std::map<PortAddress, Entry> devices_;
  std::map<PortAddress, usb::HubState> hubs_;
  std::set<PortAddress> unreadable_hubs_;
  std::vector<Call> calls_;
  Hook hook_;
  int next_devnum_ = 1;
  int enumerations_ = 0;
  bool fail_enumeration_ = false;
  bool reverse_ = false;
};

inline DeviceInfo make_device(std::uint16_t vid, std::uint16_t pid, std::optional<std::string> product,
                              std::optional<std::string> manufacturer, std::optional<std::string> serial,
                              std::string driver, std::vector<std::string> ttys = {}) {
  DeviceInfo d;
  d.vendor = vid;
  d.product = pid;
  d.product_name = std::move(product);
  d.manufacturer = std::move(manufacturer);
  d.serial = std::move(serial);
  d.driver = "usb";
  d.interfaces.push_back({0, std::move(driver), std::move(ttys)});
  d.authorized = true;
  return d;
}

// Bus 1: per-port switching root hub with
//   1-01 hub -> 1-01.04 hub -> 1-01.04.02 hub -> 1-01.04.02.04 FTDI serial adapter
//   1-02 ganged two-port hub -> 1-02.01 receiver
//   1-03 device without a bound driver or authorization attribute
//   1-04 empty
// Bus 2: USB 3 root hub without power switching, 2-01 network adapter.
inline void build_standard_tree(FakeUsbBackend& b) {
  b.add_hub(PortAddress{1}, 2, 4, topology::HUB_CHAR_LPSM_PORT);
  b.add_hub(PortAddress{1, 1}, 2, 4, topology::HUB_CHAR_LPSM_PORT);
  b.add_hub(PortAddress{1, 1, 4}, 2, 4, topology::HUB_CHAR_LPSM_PORT);
  b.add_hub(PortAddress{1, 1, 4, 2}, 2, 4, topology::HUB_CHAR_LPSM_PORT);
  b.add_device(PortAddress{1, 1, 4, 2, 4},
               make_device(0x0403, 0x6001, "FT232R USB UART", "FTDI", "A10KZP45", "ftdi_sio", {"ttyUSB0"}));

  b.add_hub(PortAddress{1, 2}, 2, 2, topology::HUB_CHAR_LPSM_GANGED);
  b.add_device(PortAddress{1, 2, 1}, make_device(0x046d, 0xc52b, "USB Receiver", "Logitech", std::nullopt, "usbhid"));

  auto& bare = b.add_device(PortAddress{1, 3}, make_device(0x1234, 0x5678, std::nullopt, std::nullopt, std::nullopt, ""));
  bare.driver.clear();
  bare.authorized.reset();

  b.add_hub(PortAddress{2}, 3, 2, 0x0002);
  auto& nic = b.add_device(PortAddress{2, 1}, make_device(0x0bda, 0x8153, "USB 10/100/1000 LAN", "Realtek", "000001", "r8152"));
  nic.usb_level = 3;
}

} // namespace usbport::test
