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

#include "app/run.hpp"

#include "engine/control_engine.hpp"
#include "frontend/http/http_server.hpp"
#include "frontend/indi/indi_device.hpp"
#include "frontend/indi/indi_server.hpp"
#include "frontend/render.hpp"
#include "platform/linux/linux_backend.hpp"
#include "platform/posix-common/signal_shield.hpp"
#include "platform/posix-common/single_instance.hpp"

#include <atomic>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>

#include <spdlog/spdlog.h>

namespace usbport::app {

static constexpr const char* kInstanceLock = "usbport-engine";

namespace {

class StopSignal {
public:
  void request() {
    {
      std::lock_guard lk(m_);
      flag_.store(true);
    }
    cv_.notify_all();
  }

  void wait() {
    std::unique_lock lk(m_);
    cv_.wait(lk, [&] { return flag_.load(); });
  }

  const std::atomic<bool>& flag() const noexcept { return flag_; }

private:
  std::mutex m_;
  std::condition_variable cv_;
  std::atomic<bool> flag_{false};
};

engine::EngineCfg engine_cfg(const Options& opt) {
  engine::EngineCfg cfg;
  cfg.lock_timeout_ms = opt.lock_timeout_ms;
  cfg.primitive_timeout_ms = opt.primitive_timeout_ms;
  cfg.snapshot_max_age_ms = opt.cache_ms;
  cfg.workers = opt.workers;
  return cfg;
}

bool print_listing(engine::ControlEngine& engine) {
  auto lr = engine.list();
  if (!lr) {
    spdlog::error("{}", lr.st.msg);
    return false;
  }
  const std::string text = frontend::render_text(lr.value);
  if (!text.empty()) std::cout << text << "\n";
  return true;
}

RunResult run_list(const Options& opt) {
  linux::LinuxUsbBackend backend;
  if (auto st = backend.check_access(); !st) { spdlog::error("{}", st.msg); return RunResult::StartupFailed; }

  engine::ControlEngine engine(backend, engine_cfg(opt));
  return print_listing(engine) ? RunResult::Success : RunResult::StartupFailed;
}

RunResult run_command(const Options& opt) {
  auto lock = posix_common::SingleInstanceLock::try_acquire(kInstanceLock);
  if (!lock) { spdlog::error("{}", lock.st.msg); return RunResult::StartupFailed; }

  linux::LinuxUsbBackend backend;
  if (auto st = backend.check_access(); !st) { spdlog::error("{}", st.msg); return RunResult::StartupFailed; }

  engine::ControlEngine engine(backend, engine_cfg(opt));
  const engine::Outcome o = engine.execute(opt.location, *opt.command);
  if (!o.ok()) {
    std::cerr << o.describe() << "\n";
    return RunResult::CommandFailed;
  }
  if (!o.affected.empty()) std::cerr << o.describe() << "\n";

  (void)print_listing(engine);
  return RunResult::Success;
}

RunResult run_servers(const Options& opt) {
  StopSignal stop;

  // Before any other thread exists, so that every thread inherits the mask.
  auto shield = posix_common::SignalShield::enable([&stop](const char* sig_desc, int count) {
    if (count == 1) {
      spdlog::info("{}: shutting down", sig_desc);
    } else {
      spdlog::info("{}: still shutting down ({} times)", sig_desc, count);
    }
    stop.request();
  });
  if (!shield) spdlog::warn("signal handling unavailable, stop with SIGKILL");

  auto lock = posix_common::SingleInstanceLock::try_acquire(kInstanceLock);
  if (!lock) { spdlog::error("{}", lock.st.msg); return RunResult::StartupFailed; }

  linux::LinuxUsbBackend backend;
  if (auto st = backend.check_access(); !st) { spdlog::error("{}", st.msg); return RunResult::StartupFailed; }

  engine::ControlEngine engine(backend, engine_cfg(opt));

  std::optional<http::HttpServer> rest;
  if (opt.rest) {
    rest.emplace(engine, http::HttpServerCfg{opt.host, opt.rest_port});
    if (auto st = rest->start(); !st) { spdlog::error("{}", st.msg); return RunResult::StartupFailed; }
  }

  if (opt.indi) {
    indi::IndiDevice device(engine, indi::default_device_name());
    indi::IndiServerCfg cfg;
    cfg.host = opt.host;
    cfg.port = opt.indi_port;

    indi::IndiServer server(device, cfg);
    if (auto st = server.start(); !st) { spdlog::error("{}", st.msg); return RunResult::StartupFailed; }

    if (auto st = server.run(stop.flag()); !st) {
      spdlog::error("{}", st.msg);
      return RunResult::StartupFailed;
    }
  } else {
    stop.wait();
  }

  if (rest) rest->stop();
  return RunResult::Success;
}

} // namespace

RunResult run(const Options& opt) {
  if (opt.servers()) return run_servers(opt);
  if (opt.command) return run_command(opt);
  return run_list(opt);
}

} // namespace usbport::app
