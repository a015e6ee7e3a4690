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

#include "frontend/indi/indi_server.hpp"

#include <algorithm>
#include <string>
#include <cerrno>
#include <cstring>

#include <poll.h>

#include <spdlog/spdlog.h>

namespace usbport::indi {

IndiServer::IndiServer(IndiDevice& device, IndiServerCfg cfg) : device_(device), cfg_(std::move(cfg)) {}

core::Status IndiServer::start() {
  USBPORT_TRY(listener_.bind_and_listen(cfg_.host, cfg_.port));
  spdlog::info("INDI server for {} on {}:{}", device_.name(), cfg_.host, listener_.port());
  return core::Status::Ok();
}

core::Status IndiServer::run(const std::atomic<bool>& stop) {
  std::vector<pollfd> fds;

  while (!stop.load()) {
    fds.clear();
    fds.push_back(pollfd{listener_.fd(), POLLIN, 0});
    for (const auto& c : clients_) fds.push_back(pollfd{c->conn.fd(), POLLIN, 0});

    const int pr = ::poll(fds.data(), fds.size(), cfg_.poll_ms);
    if (pr < 0) {
      const int e = errno;
      if (e == EINTR) continue;
      return core::Status::Errno(e, "INDI poll");
    }
    if (pr == 0) continue;

    // clients_ may grow in accept_(); only the ones polled are serviced.
    const std::size_t polled = fds.size() - 1;
    for (std::size_t i = 0; i < polled; ++i) {
      if (fds[i + 1].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) service_(*clients_[i]);
    }
    if (fds[0].revents & POLLIN) accept_();

    std::erase_if(clients_, [](const auto& c) {
      if (c->dead) spdlog::info("INDI client {} disconnected", c->conn.peer_label());
      return c->dead;
    });
  }

  spdlog::info("INDI server stopped");
  return core::Status::Ok();
}

void IndiServer::accept_() {
  for (;;) {
    auto ar = listener_.accept_one();
    if (!ar) {
      if (ar.st.err != EAGAIN && ar.st.err != EWOULDBLOCK) spdlog::warn("INDI: {}", ar.st.msg);
      return;
    }

    auto c = std::make_unique<Client>();
    c->conn = std::move(ar.value);
    c->conn.set_timeout_ms(cfg_.send_timeout_ms);
    spdlog::info("INDI client {} connected", c->conn.peer_label());
    clients_.push_back(std::move(c));
  }
}

void IndiServer::service_(Client& c) {
  if (c.dead) return;

  std::string chunk;
  auto rr = c.conn.recv_some(chunk);
  if (!rr) {
    spdlog::debug("INDI client {}: {}", c.conn.peer_label(), rr.st.msg);
    c.dead = true;
    return;
  }
  if (rr.value == 0) return;

  for (const auto& msg : c.parser.feed(chunk)) {
    spdlog::debug("INDI <{} device='{}' name='{}'> from {}", msg.tag, msg.attr_or("device"), msg.attr_or("name"),
                  c.conn.peer_label());
    broadcast_(device_.handle(msg));
  }
}

void IndiServer::broadcast_(const std::vector<XmlElement>& msgs) {
  if (msgs.empty()) return;

  std::string payload;
  for (const auto& m : msgs) payload += to_xml(m);

  for (auto& c : clients_) {
    if (c->dead) continue;
    if (auto st = c->conn.send_all(payload); !st) {
      spdlog::warn("INDI client {}: {}", c->conn.peer_label(), st.msg);
      c->dead = true;
    }
  }
}

} // namespace usbport::indi
