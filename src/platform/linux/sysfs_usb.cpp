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

#include "platform/linux/sysfs_usb.hpp"

#include "core/str.hpp"
#include "topology/port_address.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <fstream>
#include <string>
#include <system_error>

#include <spdlog/spdlog.h>

#include <unistd.h>

namespace usbport::linux {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> read_text_file(const fs::path& p) {
  std::ifstream in(p);
  if (!in.is_open()) return std::nullopt;
  std::string s;
  std::getline(in, s);
  return std::string(core::trim(s));
}

template <class T>
std::optional<T> parse_num(const std::optional<std::string>& text, int base) {
  if (!text) return std::nullopt;
  const std::string_view s = *text;
  T v{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, base);
  if (ec != std::errc{}) return std::nullopt;
  if (ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

// Strings the device reports; sysfs leaves the file out when there is none.
std::optional<std::string> read_string_attr(const fs::path& p) {
  auto s = read_text_file(p);
  if (!s || s->empty()) return std::nullopt;
  return s;
}

std::string driver_name(const fs::path& dir) {
  std::error_code ec;
  const auto target = fs::read_symlink(dir / "driver", ec);
  if (ec) return {};
  return target.filename().string();
}

// "version" holds bcdUSB as text, e.g. " 2.00" or " 3.20".
int usb_level_of(const fs::path& dir) {
  const auto v = read_text_file(dir / "version");
  if (!v || v->empty()) return 2;
  int major = 0;
  const std::string_view s = *v;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), major, 10);
  if (ec != std::errc{} || major <= 0) return 2;
  return major;
}

// usb-serial drivers create ttyUSB<n> directly below the interface; cdc-acm
// and friends add a "tty" class directory holding ttyACM<n>.
std::vector<std::string> ttys_of(const fs::path& ifc_dir) {
  std::vector<std::string> out;
  std::error_code ec;
  for (const auto& e : fs::directory_iterator(ifc_dir, ec)) {
    const auto name = e.path().filename().string();
    if (name == "tty") {
      std::error_code ec2;
      for (const auto& t : fs::directory_iterator(e.path(), ec2)) {
        out.push_back(t.path().filename().string());
      }
    } else if (name.starts_with("tty") && e.is_directory(ec)) {
      out.push_back(name);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<topology::InterfaceInfo> interfaces_of(const fs::path& dir, const std::string& sysname) {
  std::vector<topology::InterfaceInfo> out;
  const std::string prefix = sysname + ":";

  std::error_code ec;
  for (const auto& e : fs::directory_iterator(dir, ec)) {
    const auto name = e.path().filename().string();
    if (!name.starts_with(prefix) || !e.is_directory(ec)) continue;

    const auto num = parse_num<int>(read_text_file(e.path() / "bInterfaceNumber"), 16);
    if (!num) continue;

    topology::InterfaceInfo ifc;
    ifc.number = *num;
    ifc.driver = driver_name(e.path());
    ifc.ttys = ttys_of(e.path());
    out.push_back(std::move(ifc));
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.number < b.number; });
  return out;
}

std::optional<bool> authorized_of(const fs::path& dir) {
  const fs::path p = dir / "authorized";
  const auto v = parse_num<int>(read_text_file(p), 10);
  if (!v) return std::nullopt;
  if (::access(p.c_str(), W_OK) != 0) return std::nullopt;
  return *v != 0;
}

} // namespace

std::optional<topology::DeviceInfo> load_device(const fs::path& dir, std::string sysname) {
  const auto vend = parse_num<std::uint16_t>(read_text_file(dir / "idVendor"), 16);
  const auto prod = parse_num<std::uint16_t>(read_text_file(dir / "idProduct"), 16);
  const auto bus = parse_num<int>(read_text_file(dir / "busnum"), 10);
  const auto dev = parse_num<int>(read_text_file(dir / "devnum"), 10);

  if (!vend || !prod || !bus || !dev) return std::nullopt;

  topology::DeviceInfo out;
  out.sysname = std::move(sysname);
  out.vendor = *vend;
  out.product = *prod;
  out.busnum = *bus;
  out.devnum = *dev;
  out.device_class = parse_num<std::uint8_t>(read_text_file(dir / "bDeviceClass"), 16).value_or(0);
  out.usb_level = usb_level_of(dir);

  out.serial = read_string_attr(dir / "serial");
  out.manufacturer = read_string_attr(dir / "manufacturer");
  out.product_name = read_string_attr(dir / "product");

  out.driver = driver_name(dir);
  out.interfaces = interfaces_of(dir, out.sysname);
  out.authorized = authorized_of(dir);

  return out;
}

core::Result<std::vector<usb::UsbDeviceRecord>> enumerate_usb_devices_sysfs(const fs::path& base) {
  using R = core::Result<std::vector<usb::UsbDeviceRecord>>;

  std::error_code ec;
  if (!fs::is_directory(base, ec)) {
    return R::Failf("USB sysfs not available at {}", base.string());
  }

  std::vector<usb::UsbDeviceRecord> out;
  fs::directory_iterator it(base, ec);
  if (ec) return R::Fail(core::Status::Errno(ec.value(), "list " + base.string()));

  for (const auto& entry : it) {
    const auto sysname = entry.path().filename().string();
    if (sysname.find(':') != std::string::npos) continue; // interface

    auto ar = topology::PortAddress::from_sysfs_name(sysname);
    if (!ar) {
      spdlog::debug("sysfs: skipping {}: {}", sysname, ar.st.msg);
      continue;
    }

    usb::UsbDeviceRecord rec;
    rec.address = std::move(ar.value);
    rec.info = load_device(entry.path(), sysname);

    if (rec.info) {
      spdlog::debug("sysfs: {} at {} ({:04x}:{:04x}, class 0x{:02x}, usb{})",
                    sysname, rec.address, rec.info->vendor, rec.info->product,
                    rec.info->device_class, rec.info->usb_level);
    } else {
      spdlog::debug("sysfs: {} at {} not readable yet", sysname, rec.address);
    }
    out.push_back(std::move(rec));
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.address < b.address; });
  return R::Ok(std::move(out));
}

core::Status write_authorized(const fs::path& base, const std::string& sysname, bool authorized) {
  const fs::path p = base / sysname / "authorized";
  std::ofstream out(p);
  if (!out.is_open()) return core::Status::Errno(errno, "open " + p.string());

  out << (authorized ? "1" : "0") << '\n';
  out.flush();
  if (!out) return core::Status::Errno(errno, "write " + p.string());

  spdlog::debug("sysfs: {} authorized={}", sysname, authorized ? 1 : 0);
  return core::Status::Ok();
}

} // namespace usbport::linux
