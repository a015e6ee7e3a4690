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

#include <functional>
#include <memory>
#include <optional>

namespace usbport::posix_common {

// Takes SIGINT, SIGTERM and SIGHUP away from asynchronous delivery and hands
// them to cb on a dedicated watcher thread, with a running count so repeated
// Ctrl+C can be reported. The mask is per thread and inherited, so enable
// must run before any other thread is started. Destruction stops the watcher
// and restores the previous mask.
class SignalShield {
public:
  using Callback = std::function<void(const char* sig_name, int count)>;

  SignalShield(SignalShield&&) noexcept;
  SignalShield& operator=(SignalShield&&) noexcept;
  ~SignalShield();

  // nullopt when the mask could not be installed.
  static std::optional<SignalShield> enable(Callback cb);

private:
  struct Watcher;

  explicit SignalShield(std::unique_ptr<Watcher> w) noexcept;

  std::unique_ptr<Watcher> w_;
};

} // namespace usbport::posix_common
