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

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace usbport::engine {

enum class Command { SoftReset, HardReset, Disable, PowerUp, PowerDown, Off };

// Wire name used by every front-end: reset, hard, disable, up, down, off.
const char* command_name(Command c) noexcept;

// Accepts the wire names case-insensitively, plus "on" for "up".
std::optional<Command> parse_command(std::string_view name);

enum class FailureKind {
  None,
  InvalidAddress,
  AddressNotFound,
  NoDeviceBound,
  UnsupportedByHub,
  UnsupportedByHost,
  Timeout,
  PrimitiveFailure,
};

const char* to_string(FailureKind k) noexcept;

struct Outcome {
  FailureKind kind = FailureKind::None;
  Command command = Command::SoftReset;
  std::optional<topology::PortAddress> address; // unset when the address did not parse
  std::string message;

  // Ports switched along with the target by a ganged hub.
  std::vector<topology::PortAddress> affected;

  bool ok() const noexcept { return kind == FailureKind::None; }
  explicit operator bool() const noexcept { return ok(); }

  // One line for logs and textual front-ends.
  std::string describe() const;

  static Outcome Success(Command c, topology::PortAddress a, std::string msg = {});
  static Outcome Failure(FailureKind k, Command c, std::optional<topology::PortAddress> a, std::string msg);
};

} // namespace usbport::engine
