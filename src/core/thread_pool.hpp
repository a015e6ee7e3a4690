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

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace usbport::core {

// Workers for jobs that must outlive the caller's wait, such as a hub
// request that keeps running after its requester timed out. Jobs report
// through their own channels; a std::exception escaping a job is logged.
// stop() refuses new jobs, but everything already queued still runs.
class ThreadPool {
public:
  using Task = std::function<void()>;

  explicit ThreadPool(std::size_t thread_count);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  Status submit(Task t) noexcept;
  void stop() noexcept;

  std::size_t size() const noexcept { return workers_.size(); }
  std::size_t active() const noexcept { return running_.load(); }
  std::size_t pending() noexcept;

private:
  bool next_(Task& out);
  void run_(std::size_t index) noexcept;

  std::mutex mtx_;
  std::condition_variable wake_;
  std::deque<Task> jobs_;
  bool closed_ = false;
  std::atomic<std::size_t> running_{0};

  std::vector<std::jthread> workers_;
};

} // namespace usbport::core
