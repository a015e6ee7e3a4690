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

#include "engine/control_engine.hpp"
#include "engine/outcome.hpp"

#include <string>
#include <string_view>

namespace usbport::http {

struct HttpReply {
  int status = 200;
  std::string body; // text/plain
};

int status_for(engine::FailureKind k) noexcept;

// GET / and POST / list; POST /<command> executes the command on the
// address given as body and lists on success. Everything else is 404.
HttpReply route(engine::ControlEngine& engine, std::string_view method, std::string_view path,
                std::string_view body);

} // namespace usbport::http
