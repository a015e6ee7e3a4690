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

#include "engine/control_engine.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace usbport::engine {

using topology::PortAddress;
using topology::TopologyNode;
using topology::TopologySnapshot;

namespace {

using ms = std::chrono::milliseconds;

// One queued actuation. The caller and the worker race on `mtx`: whichever
// comes first decides whether the primitive runs at all.
struct Actuation {
  std::mutex mtx;
  bool started = false;
  bool abandoned = false;
  std::shared_ptr<PortLease> lease;
  std::promise<core::Status> done;
};

bool is_hub_command(Command c) noexcept {
  return c == Command::HardReset || c == Command::Disable || c == Command::PowerUp ||
         c == Command::PowerDown;
}

// PowerUp of a device that was turned off at kernel level restores its
// authorization instead of touching the hub.
bool restores_authorization(const TopologyNode& n, Command c) noexcept {
  return c == Command::PowerUp && n.device && n.device->authorized == false;
}

} // namespace

ControlEngine::ControlEngine(usb::IUsbBackend& backend, EngineCfg cfg, PortLockRegistry& locks)
  : backend_(backend)
  , cfg_(cfg)
  , locks_(locks)
  , snapshotter_(backend)
  , pool_(cfg.workers)
{}

ControlEngine::~ControlEngine() = default;

core::Result<topology::SnapshotPtr> ControlEngine::snapshot() {
  using SnapResult = core::Result<topology::SnapshotPtr>;

  const auto gen = generation_.load();
  if (cfg_.snapshot_max_age_ms > 0) {
    std::lock_guard lk(cache_mtx_);
    if (cached_ && cached_->generation() == gen &&
        TopologySnapshot::Clock::now() - cached_->captured_at() < ms(cfg_.snapshot_max_age_ms)) {
      return SnapResult::Ok(cached_);
    }
  }

  auto sr = snapshotter_.capture(gen);
  if (!sr) return sr;

  if (cfg_.snapshot_max_age_ms > 0) {
    std::lock_guard lk(cache_mtx_);
    cached_ = sr.value;
  }
  return sr;
}

core::Result<std::vector<topology::ListEntry>> ControlEngine::list() {
  using ListResult = core::Result<std::vector<topology::ListEntry>>;
  auto sr = snapshot();
  if (!sr) return ListResult::Fail(std::move(sr.st));
  return ListResult::Ok(sr.value->entries());
}

Outcome ControlEngine::execute(std::string_view addr_text, Command cmd) {
  auto pr = PortAddress::parse(addr_text);
  if (!pr) {
    auto o = Outcome::Failure(FailureKind::InvalidAddress, cmd, std::nullopt, pr.st.msg);
    spdlog::warn("{}", o.describe());
    return o;
  }
  return execute(pr.value, cmd);
}

Outcome ControlEngine::execute(const PortAddress& addr, Command cmd) {
  auto lock = locks_.get(addr);
  if (!lock->try_acquire_for(ms(cfg_.lock_timeout_ms))) {
    auto o = Outcome::Failure(FailureKind::Timeout, cmd, addr,
                              fmt::format("port busy for more than {} ms", cfg_.lock_timeout_ms));
    spdlog::warn("{}", o.describe());
    return o;
  }
  auto lease = std::make_shared<PortLease>(std::move(lock));

  // Always a fresh capture: with the port lock held, no earlier command on
  // this port can still be in flight.
  auto sr = snapshotter_.capture(generation_.load());
  if (!sr) {
    auto o = Outcome::Failure(FailureKind::PrimitiveFailure, cmd, addr,
                              fmt::format("topology capture failed: {}", sr.st.msg));
    spdlog::error("{}", o.describe());
    return o;
  }
  topology::SnapshotPtr snap = std::move(sr.value);

  if (auto v = validate_(*snap, addr, cmd); !v.ok()) {
    spdlog::warn("{}", v.describe());
    return v;
  }

  auto job = std::make_shared<Actuation>();
  job->lease = std::move(lease);
  auto fut = job->done.get_future();

  spdlog::info("{} {}: starting", command_name(cmd), addr);
  generation_.fetch_add(1);

  auto st = pool_.submit([this, snap, addr, cmd, job] {
    std::shared_ptr<PortLease> held;
    {
      std::lock_guard lk(job->mtx);
      if (job->abandoned) return;
      job->started = true;
      held = std::move(job->lease);
    }

    core::Status r;
    try {
      r = actuate_(*snap, addr, cmd);
    } catch (const std::exception& e) {
      r = core::Status::Failf("{}", e.what());
    }
    generation_.fetch_add(1);
    held.reset();
    job->done.set_value(std::move(r));
  });
  if (!st) {
    generation_.fetch_add(1);
    auto o = Outcome::Failure(FailureKind::PrimitiveFailure, cmd, addr, st.msg);
    spdlog::error("{}", o.describe());
    return o;
  }

  if (fut.wait_for(ms(cfg_.primitive_timeout_ms)) != std::future_status::ready) {
    std::string why;
    bool cancelled = false;
    {
      std::lock_guard lk(job->mtx);
      if (job->started) {
        why = fmt::format("no completion within {} ms, still running", cfg_.primitive_timeout_ms);
      } else {
        // Never reached the hub: cancel it and free the port now.
        job->abandoned = true;
        job->lease.reset();
        cancelled = true;
        why = fmt::format("no free worker within {} ms, command not sent", cfg_.primitive_timeout_ms);
      }
    }
    if (cancelled) generation_.fetch_add(1);
    auto o = Outcome::Failure(FailureKind::Timeout, cmd, addr, std::move(why));
    spdlog::error("{}", o.describe());
    return o;
  }

  const core::Status r = fut.get();
  if (!r) {
    const auto kind = r.timed_out() ? FailureKind::Timeout : FailureKind::PrimitiveFailure;
    auto o = Outcome::Failure(kind, cmd, addr, r.msg);
    spdlog::error("{}", o.describe());
    return o;
  }

  auto o = Outcome::Success(cmd, addr);
  const auto* node = snap->find(addr);
  if ((cmd == Command::PowerUp || cmd == Command::PowerDown) && node && node->caps.ganged &&
      !restores_authorization(*node, cmd)) {
    o.message = fmt::format("hub {} switches power for all ports together", addr.parent());
    o.affected = snap->siblings_of(addr);
  }
  spdlog::info("{}", o.describe());
  return o;
}

Outcome ControlEngine::validate_(const TopologySnapshot& snap, const PortAddress& addr, Command cmd) const {
  const TopologyNode* node = snap.find(addr);
  if (!node) {
    return Outcome::Failure(FailureKind::AddressNotFound, cmd, addr, "port not found");
  }

  switch (cmd) {
    case Command::SoftReset:
      if (!node->device || !node->device->has_bound_driver()) {
        return Outcome::Failure(FailureKind::NoDeviceBound, cmd, addr,
                                "usb device not enumerated or plugged in, use the other commands");
      }
      return Outcome::Success(cmd, addr);

    case Command::Off:
      if (!node->device) {
        return Outcome::Failure(FailureKind::NoDeviceBound, cmd, addr, "no enumerated device at this port");
      }
      if (!node->device->authorized) {
        return Outcome::Failure(FailureKind::UnsupportedByHost, cmd, addr,
                                "kernel does not expose device authorization");
      }
      return Outcome::Success(cmd, addr);

    default:
      break;
  }

  if (restores_authorization(*node, cmd)) return Outcome::Success(cmd, addr);

  if (node->is_bus()) {
    return Outcome::Failure(FailureKind::UnsupportedByHub, cmd, addr, "bus root has no enclosing hub");
  }

  const auto& m = node->caps;
  const auto hub = addr.parent();
  switch (cmd) {
    case Command::HardReset:
      if (!m.hard_reset) {
        return Outcome::Failure(FailureKind::UnsupportedByHub, cmd, addr,
                                fmt::format("hub {} cannot reset its ports", hub));
      }
      break;
    case Command::Disable:
      if (!m.disable) {
        return Outcome::Failure(FailureKind::UnsupportedByHub, cmd, addr,
                                fmt::format("hub {} cannot disable its ports", hub));
      }
      break;
    case Command::PowerUp:
    case Command::PowerDown:
      if (!m.power_switch) {
        return Outcome::Failure(FailureKind::UnsupportedByHub, cmd, addr,
                                fmt::format("hub {} has no power switching", hub));
      }
      break;
    default:
      break;
  }
  return Outcome::Success(cmd, addr);
}

core::Status ControlEngine::actuate_(const TopologySnapshot& snap, const PortAddress& addr, Command cmd) {
  const TopologyNode* node = snap.find(addr);
  if (!node) return core::Status::Failf("port {} vanished", addr);

  if (cmd == Command::SoftReset) return backend_.rebind_driver(*node->device);
  if (cmd == Command::Off) return backend_.set_authorized(*node->device, false);
  if (restores_authorization(*node, cmd)) return backend_.set_authorized(*node->device, true);

  if (!is_hub_command(cmd)) return core::Status::Failf("unhandled command {}", command_name(cmd));

  const TopologyNode* hub = snap.find(addr.parent());
  if (!hub || !hub->device) return core::Status::Failf("hub {} was never enumerated", addr.parent());

  const int port = addr.port();
  switch (cmd) {
    case Command::HardReset: return backend_.hub_feature(*hub->device, port, usb::HubFeature::PortReset, true);
    case Command::Disable:   return backend_.hub_feature(*hub->device, port, usb::HubFeature::PortEnable, false);
    case Command::PowerUp:   return backend_.hub_feature(*hub->device, port, usb::HubFeature::PortPower, true);
    case Command::PowerDown: return backend_.hub_feature(*hub->device, port, usb::HubFeature::PortPower, false);
    default: break;
  }
  return core::Status::Failf("unhandled command {}", command_name(cmd));
}

} // namespace usbport::engine
