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

#include "engine/outcome.hpp"

#include "core/str.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace usbport::engine {

const char* command_name(Command c) noexcept {
  switch (c) {
    case Command::SoftReset: return "reset";
    case Command::HardReset: return "hard";
    case Command::Disable:   return "disable";
    case Command::PowerUp:   return "up";
    case Command::PowerDown: return "down";
    case Command::Off:       return "off";
  }
  return "?";
}

std::optional<Command> parse_command(std::string_view name) {
  const std::string n = core::to_lower(core::trim(name));
  if (n == "reset") return Command::SoftReset;
  if (n == "hard") return Command::HardReset;
  if (n == "disable") return Command::Disable;
  if (n == "up" || n == "on") return Command::PowerUp;
  if (n == "down") return Command::PowerDown;
  if (n == "off") return Command::Off;
  return std::nullopt;
}

const char* to_string(FailureKind k) noexcept {
  switch (k) {
    case FailureKind::None:              return "ok";
    case FailureKind::InvalidAddress:    return "invalid address";
    case FailureKind::AddressNotFound:   return "address not found";
    case FailureKind::NoDeviceBound:     return "no device bound";
    case FailureKind::UnsupportedByHub:  return "unsupported by hub";
    case FailureKind::UnsupportedByHost: return "unsupported by host";
    case FailureKind::Timeout:           return "timeout";
    case FailureKind::PrimitiveFailure:  return "primitive failure";
  }
  return "?";
}

std::string Outcome::describe() const {
  const std::string where = address ? address->str() : std::string("?");
  std::string out;
  if (ok()) {
    out = fmt::format("{} {}: ok", command_name(command), where);
  } else {
    out = fmt::format("{} {}: {}", command_name(command), where, to_string(kind));
  }
  if (!message.empty()) out += fmt::format(" ({})", message);
  if (!affected.empty()) out += fmt::format("; also affects {}", fmt::join(affected, ", "));
  return out;
}

Outcome Outcome::Success(Command c, topology::PortAddress a, std::string msg) {
  Outcome o;
  o.command = c;
  o.address = std::move(a);
  o.message = std::move(msg);
  return o;
}

Outcome Outcome::Failure(FailureKind k, Command c, std::optional<topology::PortAddress> a, std::string msg) {
  Outcome o;
  o.kind = k;
  o.command = c;
  o.address = std::move(a);
  o.message = std::move(msg);
  return o;
}

} // namespace usbport::engine
