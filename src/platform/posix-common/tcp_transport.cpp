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


#include "platform/posix-common/tcp_transport.hpp"

#include <cerrno>
#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>

#include <spdlog/spdlog.h>

namespace usbport::posix_common {

namespace {

std::string endpoint_name(const sockaddr* sa, socklen_t len) {
  char host[NI_MAXHOST]{};
  char serv[NI_MAXSERV]{};
  if (::getnameinfo(sa, len, host, sizeof(host), serv, sizeof(serv), NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
    return "?";
  }
  if (sa->sa_family == AF_INET6) return fmt::format("[{}]:{}", host, serv);
  return fmt::format("{}:{}", host, serv);
}

std::uint16_t bound_port(int fd) {
  sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) != 0) return 0;
  if (ss.ss_family == AF_INET6) return ntohs(reinterpret_cast<const sockaddr_in6*>(&ss)->sin6_port);
  return ntohs(reinterpret_cast<const sockaddr_in*>(&ss)->sin_port);
}

using AddrList = std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)>;

} // namespace

TcpConnection::TcpConnection(FileHandle fd, std::string peer) : fd_(std::move(fd)), peer_(std::move(peer)) {
  const int on = 1;
  (void)do_setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on));
  (void)do_setsockopt(fd_, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
}

core::Result<std::size_t> TcpConnection::recv_some(std::string& sink) {
  using R = core::Result<std::size_t>;
  if (!fd_.valid()) return R::Fail("connection closed");

  char buf[4096];
  std::size_t total = 0;
  for (;;) {
    const ssize_t n = do_recv(fd_, buf, sizeof(buf), MSG_DONTWAIT);
    if (n > 0) {
      sink.append(buf, static_cast<std::size_t>(n));
      total += static_cast<std::size_t>(n);
      if (static_cast<std::size_t>(n) < sizeof(buf)) break;
      continue;
    }
    if (n == 0) {
      if (total) break;
      return R::Fail("peer closed the connection");
    }
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) break;
    return R::Fail(core::Status::Errno(errno, "recv"));
  }
  return R::Ok(total);
}

core::Status TcpConnection::send_all(std::string_view text) {
  using clock = std::chrono::steady_clock;
  if (!fd_.valid()) return core::Status::Fail("connection closed");

  auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms_);
  while (!text.empty()) {
    const ssize_t n = do_send(fd_, text.data(), text.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
    if (n > 0) {
      text.remove_prefix(static_cast<std::size_t>(n));
      deadline = clock::now() + std::chrono::milliseconds(timeout_ms_);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) return core::Status::Errno(errno, "send");

    // Peer is not draining; wait for room until the deadline.
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
    if (left <= 0) return core::Status(false, "send: peer stopped reading", ETIMEDOUT);

    pollfd p{fd_.get(), POLLOUT, 0};
    const int pr = ::poll(&p, 1, static_cast<int>(left));
    if (pr < 0 && errno != EINTR) return core::Status::Errno(errno, "poll");
    if (pr > 0 && (p.revents & (POLLERR | POLLHUP | POLLNVAL))) return core::Status::Fail("peer closed the connection");
  }
  return core::Status::Ok();
}

core::Status TcpListener::bind_and_listen(const std::string& host, std::uint16_t port, int backlog) {
  fd_.close();

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

  addrinfo* raw = nullptr;
  const std::string service = std::to_string(port);
  if (const int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &raw); rc != 0) {
    return core::Status::Failf("cannot resolve listen address '{}': {}", host, ::gai_strerror(rc));
  }
  AddrList list(raw, &::freeaddrinfo);

  core::Status last = core::Status::Failf("no usable address for '{}'", host);
  for (const addrinfo* ai = list.get(); ai; ai = ai->ai_next) {
    FileHandle s(do_socket(ai->ai_family, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0));
    if (!s.valid()) {
      last = core::Status::Errno(errno, "socket");
      continue;
    }
    const int on = 1;
    (void)do_setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

    if (do_bind(s, ai->ai_addr, ai->ai_addrlen) != 0) {
      last = core::Status::Errno(errno, "bind " + endpoint_name(ai->ai_addr, ai->ai_addrlen));
      continue;
    }
    if (do_listen(s, backlog) != 0) {
      last = core::Status::Errno(errno, "listen");
      continue;
    }

    port_ = bound_port(s.get());
    spdlog::debug("listening on {} (port {})", endpoint_name(ai->ai_addr, ai->ai_addrlen), port_);
    fd_ = std::move(s);
    return core::Status::Ok();
  }
  return last;
}

core::Result<TcpConnection> TcpListener::accept_one() {
  using R = core::Result<TcpConnection>;
  if (!fd_.valid()) return R::Fail("not listening");

  for (;;) {
    sockaddr_storage peer{};
    socklen_t len = sizeof(peer);
    FileHandle c(do_accept(fd_, reinterpret_cast<sockaddr*>(&peer), &len, SOCK_CLOEXEC | SOCK_NONBLOCK));
    if (c.valid()) return R::Ok(TcpConnection(std::move(c), endpoint_name(reinterpret_cast<sockaddr*>(&peer), len)));

    const int e = errno;
    if (e == EINTR || e == ECONNABORTED) continue;
    return R::Fail(core::Status::Errno(e, "accept"));
  }
}

} // namespace usbport::posix_common
