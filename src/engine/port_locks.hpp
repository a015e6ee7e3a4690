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

#include "topology/port_address.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>

namespace usbport::engine {

// Busy flag for one physical port. Unlike std::mutex it may be released by a
// thread other than the one that acquired it, which is what happens when the
// actuation outlives the caller's wait.
class PortLock {
public:
  bool try_acquire_for(std::chrono::milliseconds timeout);
  void release() noexcept;
  bool busy() noexcept;

private:
  std::mutex mtx_;
  std::condition_variable cv_;
  bool busy_ = false;
};

// Held PortLock; releases it when the last copy of the owning shared_ptr goes.
class PortLease {
public:
  explicit PortLease(std::shared_ptr<PortLock> lock) : lock_(std::move(lock)) {}
  ~PortLease() { if (lock_) lock_->release(); }

  PortLease(const PortLease&) = delete;
  PortLease& operator=(const PortLease&) = delete;

private:
  std::shared_ptr<PortLock> lock_;
};

// Process-wide table of port locks keyed by address value. Entries are never
// removed; an address that disappears from the bus keeps its (idle) lock.
class PortLockRegistry {
public:
  static PortLockRegistry& global();

  std::shared_ptr<PortLock> get(const topology::PortAddress& addr);
  std::size_t size();

private:
  std::mutex mtx_; // only held for lookup/insert
  std::map<topology::PortAddress, std::shared_ptr<PortLock>> locks_;
};

} // namespace usbport::engine
