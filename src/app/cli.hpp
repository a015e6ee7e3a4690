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
#include "engine/outcome.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace usbport::app {

struct Options {
  bool help = false;
  bool version = false;
  bool verbose = false;

  // One command at most; none means "print the listing".
  std::optional<engine::Command> command;
  std::string location;

  bool rest = false;
  bool indi = false;
  std::string host = "0.0.0.0";
  std::uint16_t rest_port = 80;
  std::uint16_t indi_port = 7624;

  int primitive_timeout_ms = 10'000;
  int lock_timeout_ms = 10'000;
  int cache_ms = 0;
  std::size_t workers = 4;

  bool servers() const noexcept { return rest || indi; }
};

core::Result<Options> parse_cli(int argc, char** argv) noexcept;
std::string usage_text();

} // namespace usbport::app
