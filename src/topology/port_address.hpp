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

#include "core/status.hpp"

#include <compare>
#include <cstddef>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace usbport::topology {

// Physical location of a USB port: bus number followed by the hub port
// chain. Text form is "bus-p1.p2...pn" with two-digit ports ("1-01.04.02"),
// or just "bus" for the bus root.
class PortAddress {
public:
  PortAddress() = default;
  PortAddress(std::initializer_list<int> parts) : parts_(parts) {}

  static core::Result<PortAddress> parse(std::string_view text);

  // Kernel device names: "usb3" (root hub of bus 3), "3-1.4", "3-1.4:1.0".
  static core::Result<PortAddress> from_sysfs_name(std::string_view sysname);

  std::string str() const;

  bool valid() const noexcept { return !parts_.empty(); }
  int bus() const noexcept { return parts_.empty() ? 0 : parts_.front(); }
  std::span<const int> ports() const noexcept {
    return parts_.empty() ? std::span<const int>{} : std::span<const int>(parts_).subspan(1);
  }
  std::size_t depth() const noexcept { return parts_.empty() ? 0 : parts_.size() - 1; }
  bool is_bus() const noexcept { return parts_.size() == 1; }

  // Last port number; 0 for the bus root.
  int port() const noexcept { return depth() ? parts_.back() : 0; }

  PortAddress parent() const;
  PortAddress child(int port) const;
  bool is_ancestor_of(const PortAddress& other) const noexcept;

  std::span<const int> parts() const noexcept { return parts_; }

  friend bool operator==(const PortAddress&, const PortAddress&) = default;
  friend auto operator<=>(const PortAddress& a, const PortAddress& b) { return a.parts_ <=> b.parts_; }

private:
  explicit PortAddress(std::vector<int> parts) : parts_(std::move(parts)) {}

  std::vector<int> parts_;
};

} // namespace usbport::topology

template <>
struct fmt::formatter<usbport::topology::PortAddress> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(const usbport::topology::PortAddress& a, FormatContext& ctx) const {
    const std::string s = a.str();
    return fmt::formatter<std::string_view>::format(std::string_view(s), ctx);
  }
};
