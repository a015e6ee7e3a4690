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

#include "frontend/render.hpp"

#include "core/str.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace usbport::frontend {

namespace {

std::string product_text(const topology::DeviceInfo& d) {
  std::string s = d.product_name.value_or("?");
  if (d.serial) s = fmt::format("{} ({})", s, *d.serial);
  if (d.manufacturer) s = fmt::format("{} {}", *d.manufacturer, s);

  const auto ttys = d.ttys();
  if (!ttys.empty()) s = fmt::format("{} - {}", fmt::join(ttys, " "), s);
  return s;
}

} // namespace

std::optional<std::string> render_line(const topology::ListEntry& e) {
  if (e.is_bus || e.is_hub) return std::nullopt;

  const std::string flags = "[" + e.flags.letters() + "]";
  std::string vidpid;
  std::string product;
  if (e.device) {
    vidpid = fmt::format("{:04x}:{:04x}", e.device->vendor, e.device->product);
    product = product_text(*e.device);
  }

  const std::string line = fmt::format("{:13} {:5} {} {}", e.address.str(), flags, vidpid, product);
  return std::string(core::trim(line));
}

std::vector<std::string> render_listing(std::span<const topology::ListEntry> entries) {
  std::vector<std::string> out;
  for (const auto& e : entries) {
    if (auto line = render_line(e)) out.push_back(std::move(*line));
  }
  return out;
}

std::string render_text(std::span<const topology::ListEntry> entries) {
  return fmt::format("{}", fmt::join(render_listing(entries), "\n"));
}

} // namespace usbport::frontend
