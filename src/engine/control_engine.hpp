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
#include "core/thread_pool.hpp"
#include "engine/outcome.hpp"
#include "engine/port_locks.hpp"
#include "topology/snapshot.hpp"
#include "usb/backend.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string_view>
#include <vector>

namespace usbport::engine {

struct EngineCfg {
  int lock_timeout_ms = 10'000;
  int primitive_timeout_ms = 10'000;

  // list() may reuse a snapshot this young; 0 always captures.
  int snapshot_max_age_ms = 0;

  std::size_t workers = 4;
};

// The single entry point of every front-end. Thread-safe.
class ControlEngine {
public:
  explicit ControlEngine(usb::IUsbBackend& backend, EngineCfg cfg = {},
                         PortLockRegistry& locks = PortLockRegistry::global());
  ~ControlEngine();

  ControlEngine(const ControlEngine&) = delete;
  ControlEngine& operator=(const ControlEngine&) = delete;

  // Lock-free read of the topology.
  core::Result<topology::SnapshotPtr> snapshot();
  core::Result<std::vector<topology::ListEntry>> list();

  Outcome execute(const topology::PortAddress& addr, Command cmd);
  Outcome execute(std::string_view addr_text, Command cmd);

  const EngineCfg& cfg() const noexcept { return cfg_; }

private:
  Outcome validate_(const topology::TopologySnapshot& snap, const topology::PortAddress& addr, Command cmd) const;
  core::Status actuate_(const topology::TopologySnapshot& snap, const topology::PortAddress& addr, Command cmd);

private:
  usb::IUsbBackend& backend_;
  EngineCfg cfg_;
  PortLockRegistry& locks_;
  topology::Snapshotter snapshotter_;

  // Bumped when an actuation starts and when it finishes; a cached snapshot
  // from an older generation is never served.
  std::atomic<std::uint64_t> generation_{0};

  std::mutex cache_mtx_;
  topology::SnapshotPtr cached_;

  // Declared last so it is destroyed first: queued and running actuations
  // finish while the rest of the engine is still alive.
  core::ThreadPool pool_;
};

} // namespace usbport::engine
