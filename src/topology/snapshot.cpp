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

#include "topology/snapshot.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

#include <spdlog/spdlog.h>

namespace usbport::topology {

namespace {

const TopologyNode* find_child(const std::vector<TopologyNode>& v, int port) noexcept {
  auto it = std::lower_bound(v.begin(), v.end(), port,
                             [](const TopologyNode& n, int p) { return n.address.port() < p; });
  if (it == v.end() || it->address.port() != port) return nullptr;
  return &*it;
}

void walk(const TopologyNode& n, std::vector<ListEntry>& out) {
  out.push_back(ListEntry{n.address, n.flags, n.device, n.is_bus(), n.is_hub()});
  for (const auto& c : n.children) walk(c, out);
}

class TreeBuilder {
public:
  TreeBuilder(usb::IUsbBackend& backend, const std::vector<usb::UsbDeviceRecord>& records)
    : backend_(backend)
  {
    for (const auto& r : records) {
      if (!r.address.valid()) continue;
      by_addr_.emplace(r.address, &r);
      buses_.insert(r.address.bus());

      // Register every link of the chain so that a device below a hub the
      // kernel did not report still hangs off the tree.
      PortAddress a = r.address;
      while (!a.is_bus()) {
        const PortAddress p = a.parent();
        children_[p].insert(a.port());
        a = p;
      }
    }
  }

  std::vector<TopologyNode> build() {
    std::vector<TopologyNode> out;
    for (int bus : buses_) out.push_back(node(PortAddress{bus}, StatusFlags{}, CapabilityMask{}));
    return out;
  }

private:
  TopologyNode node(const PortAddress& addr, StatusFlags flags, CapabilityMask caps) {
    TopologyNode n;
    n.address = addr;
    n.flags = flags;
    n.caps = caps;

    if (auto it = by_addr_.find(addr); it != by_addr_.end()) {
      if (it->second->info) {
        n.device = *it->second->info;
      } else {
        spdlog::debug("Snapshot: {} present but descriptors unreadable", addr);
        n.flags.set(StatusFlags::Resetting);
      }
    }

    std::set<int> ports;
    if (auto it = children_.find(addr); it != children_.end()) ports = it->second;

    CapabilityMask child_caps;
    std::vector<std::optional<std::uint16_t>> port_status;
    int usb_level = 2;

    if (n.is_hub()) {
      auto hr = backend_.read_hub(*n.device);
      if (hr) {
        const auto hub = resolve_hub(hr.value.desc);
        n.hub = hub;
        child_caps = mask_for(hub);
        usb_level = hub.usb_level;
        port_status = std::move(hr.value.port_status);
        for (int p = 1; p <= hub.nports; ++p) ports.insert(p);
        spdlog::debug("Snapshot: hub {} ports={} power={} caps={}", addr, hub.nports,
                      to_string(hub.power), describe(child_caps));
      } else {
        spdlog::warn("Snapshot: cannot read hub {} ({}): {}", addr, n.device->sysname, hr.st.msg);
      }
    }

    n.children.reserve(ports.size());
    for (int p : ports) {
      StatusFlags cf;
      const auto idx = static_cast<std::size_t>(p - 1);
      if (idx < port_status.size() && port_status[idx]) {
        cf = StatusFlags::from_port_status(*port_status[idx], usb_level);
      }
      n.children.push_back(node(addr.child(p), cf, child_caps));
    }
    return n;
  }

  usb::IUsbBackend& backend_;
  std::map<PortAddress, const usb::UsbDeviceRecord*> by_addr_;
  std::map<PortAddress, std::set<int>> children_;
  std::set<int> buses_;
};

} // namespace

const TopologyNode* TopologySnapshot::find(const PortAddress& addr) const noexcept {
  if (!addr.valid()) return nullptr;

  auto it = std::lower_bound(buses_.begin(), buses_.end(), addr.bus(),
                             [](const TopologyNode& n, int b) { return n.address.bus() < b; });
  if (it == buses_.end() || it->address.bus() != addr.bus()) return nullptr;

  const TopologyNode* cur = &*it;
  for (int p : addr.ports()) {
    cur = find_child(cur->children, p);
    if (!cur) return nullptr;
  }
  return cur;
}

std::vector<ListEntry> TopologySnapshot::entries() const {
  std::vector<ListEntry> out;
  for (const auto& b : buses_) walk(b, out);
  return out;
}

std::vector<PortAddress> TopologySnapshot::siblings_of(const PortAddress& addr) const {
  std::vector<PortAddress> out;
  if (addr.is_bus()) return out;
  const auto* parent = find(addr.parent());
  if (!parent) return out;
  for (const auto& c : parent->children) {
    if (c.address != addr) out.push_back(c.address);
  }
  return out;
}

core::Result<SnapshotPtr> Snapshotter::capture(std::uint64_t generation) {
  auto er = backend_.enumerate();
  if (!er) return core::Result<SnapshotPtr>::Fail(std::move(er.st));

  auto& records = er.value;
  std::sort(records.begin(), records.end(),
            [](const auto& a, const auto& b) { return a.address < b.address; });

  TreeBuilder tb(backend_, records);
  auto snap = std::make_shared<const TopologySnapshot>(tb.build(), generation, TopologySnapshot::Clock::now());
  spdlog::debug("Snapshot: captured {} device(s) on {} bus(es)", records.size(), snap->buses().size());
  return core::Result<SnapshotPtr>::Ok(std::move(snap));
}

} // namespace usbport::topology
