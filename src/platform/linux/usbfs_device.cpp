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

#include "platform/linux/usbfs_device.hpp"

#include <array>
#include <cerrno>

#include <fcntl.h>
#include <linux/usb/ch11.h>
#include <linux/usb/ch9.h>
#include <linux/usbdevice_fs.h>

namespace usbport::linux {

namespace {

// Hub class descriptor up to and including wHubCharacteristics and the two
// timing bytes; enough for both the USB 2 and the SuperSpeed layout.
constexpr std::uint16_t kHubDescriptorLen = 7;

std::uint8_t hub_descriptor_type(int usb_level) noexcept {
  return usb_level >= 3 ? USB_DT_SS_HUB : USB_DT_HUB;
}

} // namespace

UsbFsDevice::UsbFsDevice(std::string devnode, int timeout_ms)
  : devnode_(std::move(devnode)), timeout_ms_(timeout_ms) {}

UsbFsDevice::~UsbFsDevice() { close(); }

core::Status UsbFsDevice::open() noexcept {
  close();
  fd_.reset(do_open(devnode_.c_str(), O_RDWR));
  if (!fd_.valid()) return core::Status::Errno(errno, "open " + devnode_);
  return core::Status::Ok();
}

void UsbFsDevice::close() noexcept { fd_.close(); }

core::Result<int> UsbFsDevice::control(const ControlSetup& setup, std::span<std::uint8_t> data) noexcept {
  usbdevfs_ctrltransfer ctrl{};
  ctrl.bRequestType = setup.bRequestType;
  ctrl.bRequest = setup.bRequest;
  ctrl.wValue = setup.wValue;
  ctrl.wIndex = setup.wIndex;
  ctrl.wLength = static_cast<std::uint16_t>(data.size());
  ctrl.timeout = static_cast<std::uint32_t>(timeout_ms_);
  ctrl.data = data.empty() ? nullptr : data.data();

  const int rc = do_ioctl(fd_, USBDEVFS_CONTROL, &ctrl);
  if (rc < 0) {
    return core::Result<int>::Fail(core::Status::Errno(
        errno, fmt::format("{}: control 0x{:02x}/0x{:02x}", devnode_, setup.bRequestType, setup.bRequest)));
  }
  return core::Result<int>::Ok(rc);
}

core::Result<topology::HubDescriptor> UsbFsDevice::hub_descriptor(int usb_level) noexcept {
  using R = core::Result<topology::HubDescriptor>;

  std::array<std::uint8_t, kHubDescriptorLen> buf{};
  ControlSetup s;
  s.bRequestType = USB_DIR_IN | USB_TYPE_CLASS | USB_RECIP_DEVICE;
  s.bRequest = USB_REQ_GET_DESCRIPTOR;
  s.wValue = static_cast<std::uint16_t>(hub_descriptor_type(usb_level) << 8);

  auto r = control(s, buf);
  if (!r) return R::Fail(std::move(r.st));
  if (r.value < 5) return R::Failf("{}: short hub descriptor ({} bytes)", devnode_, r.value);

  topology::HubDescriptor d;
  d.nports = buf[2];
  d.characteristics = static_cast<std::uint16_t>(buf[3] | (buf[4] << 8));
  d.usb_level = usb_level;
  return R::Ok(d);
}

core::Result<std::uint16_t> UsbFsDevice::port_status(int port) noexcept {
  using R = core::Result<std::uint16_t>;

  std::array<std::uint8_t, 4> buf{}; // wPortStatus, wPortChange
  ControlSetup s;
  s.bRequestType = USB_DIR_IN | USB_TYPE_CLASS | USB_RECIP_OTHER;
  s.bRequest = USB_REQ_GET_STATUS;
  s.wIndex = static_cast<std::uint16_t>(port);

  auto r = control(s, buf);
  if (!r) return R::Fail(std::move(r.st));
  if (r.value < 2) return R::Failf("{}: short port status ({} bytes)", devnode_, r.value);
  return R::Ok(static_cast<std::uint16_t>(buf[0] | (buf[1] << 8)));
}

core::Status UsbFsDevice::port_feature(int port, std::uint16_t feature, bool set) noexcept {
  ControlSetup s;
  s.bRequestType = USB_DIR_OUT | USB_TYPE_CLASS | USB_RECIP_OTHER;
  s.bRequest = set ? USB_REQ_SET_FEATURE : USB_REQ_CLEAR_FEATURE;
  s.wValue = feature;
  s.wIndex = static_cast<std::uint16_t>(port);

  auto r = control(s, {});
  return r.st;
}

core::Status UsbFsDevice::reset() noexcept {
  if (do_ioctl(fd_, USBDEVFS_RESET, nullptr) < 0) {
    return core::Status::Errno(errno, devnode_ + ": reset");
  }
  return core::Status::Ok();
}

core::Status UsbFsDevice::disconnect_driver(int ifc) noexcept {
  usbdevfs_ioctl cmd{};
  cmd.ifno = ifc;
  cmd.ioctl_code = USBDEVFS_DISCONNECT;
  cmd.data = nullptr;
  if (do_ioctl(fd_, USBDEVFS_IOCTL, &cmd) < 0) {
    return core::Status::Errno(errno, fmt::format("{}: unbind interface {}", devnode_, ifc));
  }
  return core::Status::Ok();
}

core::Status UsbFsDevice::connect_driver(int ifc) noexcept {
  usbdevfs_ioctl cmd{};
  cmd.ifno = ifc;
  cmd.ioctl_code = USBDEVFS_CONNECT;
  cmd.data = nullptr;
  if (do_ioctl(fd_, USBDEVFS_IOCTL, &cmd) < 0) {
    return core::Status::Errno(errno, fmt::format("{}: bind interface {}", devnode_, ifc));
  }
  return core::Status::Ok();
}

} // namespace usbport::linux
