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
#include "engine/control_engine.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

namespace usbport::http {

struct HttpServerCfg {
  std::string host = "0.0.0.0";
  std::uint16_t port = 80;
};

// cpp-httplib server on its own thread; requests are handled concurrently
// by the library's worker threads.
class HttpServer {
public:
  HttpServer(engine::ControlEngine& engine, HttpServerCfg cfg);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds and starts serving in the background.
  core::Status start();
  void stop() noexcept;

  std::uint16_t port() const noexcept { return port_; }

private:
  engine::ControlEngine& engine_;
  HttpServerCfg cfg_;
  std::unique_ptr<httplib::Server> server_;
  std::thread thread_;
  std::uint16_t port_ = 0;
};

} // namespace usbport::http
