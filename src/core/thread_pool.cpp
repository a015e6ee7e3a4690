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


#include "core/thread_pool.hpp"

#include <algorithm>
#include <exception>
#include <new>
#include <utility>

#include <spdlog/spdlog.h>

namespace usbport::core {

ThreadPool::ThreadPool(std::size_t thread_count) {
  const std::size_t n = std::max<std::size_t>(thread_count, 1);
  workers_.reserve(n);
  for (std::size_t i = 0; i < n; ++i) workers_.emplace_back([this, i] { run_(i); });
}

// jthread joins on destruction; workers exit once the queue is empty.
ThreadPool::~ThreadPool() {
  stop();
  workers_.clear();
}

Status ThreadPool::submit(Task t) noexcept {
  if (!t) return Status::Ok();
  {
    std::lock_guard lk(mtx_);
    if (closed_) return Status::Fail("worker pool is shutting down");
    try {
      jobs_.push_back(std::move(t));
    } catch (const std::bad_alloc&) {
      return Status::Fail("worker pool: out of memory");
    }
  }
  wake_.notify_one();
  return Status::Ok();
}

void ThreadPool::stop() noexcept {
  {
    std::lock_guard lk(mtx_);
    closed_ = true;
  }
  wake_.notify_all();
}

std::size_t ThreadPool::pending() noexcept {
  std::lock_guard lk(mtx_);
  return jobs_.size();
}

bool ThreadPool::next_(Task& out) {
  std::unique_lock lk(mtx_);
  wake_.wait(lk, [&] { return closed_ || !jobs_.empty(); });
  if (jobs_.empty()) return false;

  out = std::move(jobs_.front());
  jobs_.pop_front();
  running_.fetch_add(1);
  return true;
}

void ThreadPool::run_(std::size_t index) noexcept {
  Task job;
  while (next_(job)) {
    try {
      job();
    } catch (const std::exception& e) {
      spdlog::error("worker {}: job threw: {}", index, e.what());
    }
    job = nullptr;
    running_.fetch_sub(1);
  }
  spdlog::trace("worker {} exiting", index);
}

} // namespace usbport::core
