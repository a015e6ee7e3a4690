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
#include "frontend/indi/indi_device.hpp"
#include "frontend/indi/xml.hpp"
#include "platform/posix-common/tcp_transport.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace usbport::indi {

struct IndiServerCfg {
  std::string host = "0.0.0.0";
  std::uint16_t port = 7624;
  int poll_ms = 200;
  int send_timeout_ms = 2000;
};

// Single-threaded poll loop: every message from any client is handled to
// completion before the next one is read, and replies go to all clients.
class IndiServer {
public:
  IndiServer(IndiDevice& device, IndiServerCfg cfg);

  core::Status start();

  // Serves until stop becomes true; start() must have succeeded.
  core::Status run(const std::atomic<bool>& stop);

  std::uint16_t port() const noexcept { return listener_.port(); }
  std::size_t clients() const noexcept { return clients_.size(); }

private:
  struct Client {
    posix_common::TcpConnection conn;
    XmlStreamParser parser;
    bool dead = false;
  };

  void accept_();
  void service_(Client& c);
  void broadcast_(const std::vector<XmlElement>& msgs);

private:
  IndiDevice& device_;
  IndiServerCfg cfg_;
  posix_common::TcpListener listener_;
  std::vector<std::unique_ptr<Client>> clients_;
};

} // namespace usbport::indi
