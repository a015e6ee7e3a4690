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
#include "topology/node.hpp"
#include "topology/port_address.hpp"
#include "usb/backend.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace usbport::topology {

struct ListEntry {
  PortAddress address;
  StatusFlags flags;
  std::optional<DeviceInfo> device;
  bool is_bus = false;
  bool is_hub = false;

  friend bool operator==(const ListEntry&, const ListEntry&) = default;
};

// One point-in-time view of every bus. Never modified after capture; the
// effect of a command is observed by capturing again.
class TopologySnapshot {
public:
  using Clock = std::chrono::steady_clock;

  TopologySnapshot(std::vector<TopologyNode> buses, std::uint64_t generation, Clock::time_point captured_at)
    : buses_(std::move(buses)), generation_(generation), captured_at_(captured_at) {}

  const std::vector<TopologyNode>& buses() const noexcept { return buses_; }
  std::uint64_t generation() const noexcept { return generation_; }
  Clock::time_point captured_at() const noexcept { return captured_at_; }

  const TopologyNode* find(const PortAddress& addr) const noexcept;

  // Depth-first, buses ascending, ports ascending.
  std::vector<ListEntry> entries() const;

  // The other ports of the hub that owns addr.
  std::vector<PortAddress> siblings_of(const PortAddress& addr) const;

private:
  std::vector<TopologyNode> buses_;
  std::uint64_t generation_ = 0;
  Clock::time_point captured_at_{};
};

using SnapshotPtr = std::shared_ptr<const TopologySnapshot>;

class Snapshotter {
public:
  explicit Snapshotter(usb::IUsbBackend& backend) : backend_(backend) {}

  // Fails only when the device enumeration itself fails; unreadable hubs
  // and devices are recorded as partial nodes.
  core::Result<SnapshotPtr> capture(std::uint64_t generation = 0);

private:
  usb::IUsbBackend& backend_;
};

} // namespace usbport::topology
