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

#include "platform/linux/linux_backend.hpp"

#include "platform/linux/usbfs_device.hpp"

#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

namespace usbport::linux {

core::Status LinuxUsbBackend::check_access() const {
  std::error_code ec;
  if (!std::filesystem::is_directory(cfg_.sysfs, ec)) {
    return core::Status::Failf("USB sysfs not available at {}", cfg_.sysfs.string());
  }
  return core::Status::Ok();
}

core::Result<std::vector<usb::UsbDeviceRecord>> LinuxUsbBackend::enumerate() {
  return enumerate_usb_devices_sysfs(cfg_.sysfs);
}

core::Result<usb::HubState> LinuxUsbBackend::read_hub(const topology::DeviceInfo& hub) {
  using R = core::Result<usb::HubState>;

  UsbFsDevice dev(hub.devnode(), cfg_.control_timeout_ms);
  if (auto st = dev.open(); !st) return R::Fail(std::move(st));

  auto dr = dev.hub_descriptor(hub.usb_level);
  if (!dr) return R::Fail(std::move(dr.st));

  usb::HubState out;
  out.desc = dr.value;
  out.port_status.reserve(static_cast<std::size_t>(out.desc.nports));
  for (int port = 1; port <= out.desc.nports; ++port) {
    auto sr = dev.port_status(port);
    if (!sr) {
      spdlog::debug("{} port {}: {}", hub.sysname, port, sr.st.msg);
      out.port_status.emplace_back(std::nullopt);
      continue;
    }
    out.port_status.emplace_back(sr.value);
  }
  return R::Ok(std::move(out));
}

core::Status LinuxUsbBackend::hub_feature(const topology::DeviceInfo& hub, int port,
                                          usb::HubFeature feature, bool set) {
  UsbFsDevice dev(hub.devnode(), cfg_.control_timeout_ms);
  USBPORT_TRY(dev.open());

  spdlog::debug("{}: {}_FEATURE({}) port {}", hub.sysname, set ? "SET" : "CLEAR", usb::to_string(feature), port);
  return dev.port_feature(port, static_cast<std::uint16_t>(feature), set);
}

core::Status LinuxUsbBackend::rebind_driver(const topology::DeviceInfo& info) {
  UsbFsDevice dev(info.devnode(), cfg_.control_timeout_ms);
  USBPORT_TRY(dev.open());

  std::vector<int> unbound;
  auto rebind = [&] {
    // The kernel usually rebinds on its own after a reset, so a failing
    // connect here is not an error.
    for (int ifc : unbound) {
      if (auto cs = dev.connect_driver(ifc); !cs) spdlog::warn("{}: {}", info.sysname, cs.msg);
    }
  };

  for (const auto& ifc : info.interfaces) {
    if (ifc.driver.empty()) continue;
    spdlog::debug("{}: unbinding {} from interface {}", info.sysname, ifc.driver, ifc.number);
    if (auto ds = dev.disconnect_driver(ifc.number); !ds) {
      rebind();
      return ds;
    }
    unbound.push_back(ifc.number);
  }

  const core::Status st = dev.reset();
  rebind();
  return st;
}

core::Status LinuxUsbBackend::set_authorized(const topology::DeviceInfo& dev, bool authorized) {
  return write_authorized(cfg_.sysfs, dev.sysname, authorized);
}

} // namespace usbport::linux
