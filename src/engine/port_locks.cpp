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

#include "engine/port_locks.hpp"

namespace usbport::engine {

bool PortLock::try_acquire_for(std::chrono::milliseconds timeout) {
  std::unique_lock lk(mtx_);
  if (!cv_.wait_for(lk, timeout, [&] { return !busy_; })) return false;
  busy_ = true;
  return true;
}

void PortLock::release() noexcept {
  {
    std::lock_guard lk(mtx_);
    busy_ = false;
  }
  cv_.notify_one();
}

bool PortLock::busy() noexcept {
  std::lock_guard lk(mtx_);
  return busy_;
}

PortLockRegistry& PortLockRegistry::global() {
  static PortLockRegistry reg;
  return reg;
}

std::shared_ptr<PortLock> PortLockRegistry::get(const topology::PortAddress& addr) {
  std::lock_guard lk(mtx_);
  auto& slot = locks_[addr];
  if (!slot) slot = std::make_shared<PortLock>();
  return slot;
}

std::size_t PortLockRegistry::size() {
  std::lock_guard lk(mtx_);
  return locks_.size();
}

} // namespace usbport::engine
