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


#include "platform/posix-common/signal_shield.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <thread>
#include <utility>

#include <pthread.h>
#include <signal.h>

#include <spdlog/spdlog.h>

namespace usbport::posix_common {

namespace {

// How often the watcher looks at its stop token between signals.
constexpr long kWatchSliceNs = 200'000'000;

constexpr int kShielded[] = {SIGINT, SIGTERM, SIGHUP};

sigset_t shielded_set() {
  sigset_t set;
  sigemptyset(&set);
  for (int s : kShielded) sigaddset(&set, s);
  return set;
}

const char* signal_name(int signo) {
  if (signo == SIGINT) return "SIGINT";
  if (signo == SIGTERM) return "SIGTERM";
  if (signo == SIGHUP) return "SIGHUP";
  return "signal";
}

void watch(const std::stop_token& stop, const SignalShield::Callback& cb) {
  const sigset_t set = shielded_set();
  const timespec slice{0, kWatchSliceNs};
  int count = 0;

  while (!stop.stop_requested()) {
    const int signo = ::sigtimedwait(&set, nullptr, &slice);
    if (signo < 0) {
      if (errno != EAGAIN && errno != EINTR) spdlog::debug("sigtimedwait: {}", std::strerror(errno));
      continue;
    }
    ++count;
    spdlog::debug("{} received ({})", signal_name(signo), count);
    if (cb) cb(signal_name(signo), count);
  }
}

} // namespace

struct SignalShield::Watcher {
  sigset_t previous{};
  std::jthread thread;

  ~Watcher() {
    thread.request_stop();
    if (thread.joinable()) thread.join();
    (void)::pthread_sigmask(SIG_SETMASK, &previous, nullptr);
  }
};

SignalShield::SignalShield(std::unique_ptr<Watcher> w) noexcept : w_(std::move(w)) {}
SignalShield::SignalShield(SignalShield&&) noexcept = default;
SignalShield& SignalShield::operator=(SignalShield&&) noexcept = default;
SignalShield::~SignalShield() = default;

std::optional<SignalShield> SignalShield::enable(Callback cb) {
  // Writes to a vanished INDI client must fail with EPIPE, not kill us.
  ::signal(SIGPIPE, SIG_IGN);

  auto w = std::make_unique<Watcher>();
  const sigset_t set = shielded_set();
  if (const int rc = ::pthread_sigmask(SIG_BLOCK, &set, &w->previous); rc != 0) {
    spdlog::warn("pthread_sigmask: error {}", rc);
    return std::nullopt;
  }

  w->thread = std::jthread([cb = std::move(cb)](std::stop_token stop) { watch(stop, cb); });
  return SignalShield(std::move(w));
}

} // namespace usbport::posix_common
