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

#include "topology/snapshot.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace usbport::frontend {

// "<address:13> [<flags>] <vvvv:pppp> <ttys> - <manufacturer> <product> (<serial>)",
// right-trimmed. nullopt for hubs and bus roots, which are not listed.
std::optional<std::string> render_line(const topology::ListEntry& e);

std::vector<std::string> render_listing(std::span<const topology::ListEntry> entries);

// Lines joined with '\n', no trailing newline.
std::string render_text(std::span<const topology::ListEntry> entries);

} // namespace usbport::frontend
