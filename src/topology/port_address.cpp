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

#include "topology/port_address.hpp"

#include "core/str.hpp"

#include <algorithm>
#include <charconv>
#include <optional>

namespace usbport::topology {

namespace {

using AddrResult = core::Result<PortAddress>;

std::optional<int> parse_component(std::string_view s) {
  if (s.empty()) return std::nullopt;
  if (!std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; })) return std::nullopt;

  // Leading zeros are allowed ("04"); anything that does not fit an int is
  // malformed, larger values simply name a port that does not exist.
  int v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, 10);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  if (v < 1) return std::nullopt;
  return v;
}

} // namespace

core::Result<PortAddress> PortAddress::parse(std::string_view text) {
  const std::string_view s = core::trim(text);
  if (s.empty()) return AddrResult::Fail("invalid port address: empty");

  std::vector<int> parts;

  const auto dash = s.find('-');
  const auto bus = parse_component(s.substr(0, dash));
  if (!bus) return AddrResult::Failf("invalid port address '{}': bad bus number", s);
  parts.push_back(*bus);

  if (dash != std::string_view::npos) {
    std::string_view rest = s.substr(dash + 1);
    for (;;) {
      const auto dot = rest.find('.');
      const auto port = parse_component(rest.substr(0, dot));
      if (!port) return AddrResult::Failf("invalid port address '{}': bad port number", s);
      parts.push_back(*port);
      if (dot == std::string_view::npos) break;
      rest = rest.substr(dot + 1);
    }
  }

  return AddrResult::Ok(PortAddress(std::move(parts)));
}

core::Result<PortAddress> PortAddress::from_sysfs_name(std::string_view sysname) {
  if (sysname.starts_with("usb")) {
    const auto bus = parse_component(sysname.substr(3));
    if (!bus) return AddrResult::Failf("not a usb root hub name: {}", sysname);
    return AddrResult::Ok(PortAddress(std::vector<int>{*bus}));
  }
  const auto colon = sysname.find(':');
  if (colon != std::string_view::npos) sysname = sysname.substr(0, colon);
  if (sysname.find('-') == std::string_view::npos) {
    return AddrResult::Failf("not a usb device name: {}", sysname);
  }
  return parse(sysname);
}

std::string PortAddress::str() const {
  if (parts_.empty()) return {};

  std::string out = fmt::format("{}", parts_.front());
  for (std::size_t i = 1; i < parts_.size(); ++i) {
    out += (i == 1) ? '-' : '.';
    out += fmt::format("{:02d}", parts_[i]);
  }
  return out;
}

PortAddress PortAddress::parent() const {
  if (parts_.size() <= 1) return *this;
  return PortAddress(std::vector<int>(parts_.begin(), parts_.end() - 1));
}

PortAddress PortAddress::child(int port) const {
  auto parts = parts_;
  parts.push_back(port);
  return PortAddress(std::move(parts));
}

bool PortAddress::is_ancestor_of(const PortAddress& other) const noexcept {
  if (parts_.size() >= other.parts_.size()) return false;
  return std::equal(parts_.begin(), parts_.end(), other.parts_.begin());
}

} // namespace usbport::topology
