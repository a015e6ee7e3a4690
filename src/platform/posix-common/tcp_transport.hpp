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
#include "platform/posix-common/filehandle.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace usbport::posix_common {

// Accepted client of a text protocol. The socket is non-blocking; reads
// return what is there, writes wait up to timeout_ms for each bit of progress.
class TcpConnection {
public:
  TcpConnection() = default;
  TcpConnection(FileHandle fd, std::string peer);

  TcpConnection(TcpConnection&&) noexcept = default;
  TcpConnection& operator=(TcpConnection&&) noexcept = default;

  int fd() const noexcept { return fd_.get(); }
  bool open() const noexcept { return fd_.valid(); }

  void set_timeout_ms(int ms) noexcept { timeout_ms_ = ms > 0 ? ms : 1; }

  // Appends whatever is readable to sink and returns the count (0 when
  // nothing is pending). Fails once the peer has closed.
  core::Result<std::size_t> recv_some(std::string& sink);

  core::Status send_all(std::string_view text);

  const std::string& peer_label() const noexcept { return peer_; }

private:
  FileHandle fd_;
  std::string peer_;
  int timeout_ms_ = 1000;
};

// Listening socket for a host name or literal address, IPv4 or IPv6.
class TcpListener {
public:
  // Port 0 binds an ephemeral port; port() reports the real one.
  core::Status bind_and_listen(const std::string& host, std::uint16_t port, int backlog = 8);

  // Never blocks; "no client" is reported as a failure with err == EAGAIN.
  core::Result<TcpConnection> accept_one();

  int fd() const noexcept { return fd_.get(); }
  std::uint16_t port() const noexcept { return port_; }

private:
  FileHandle fd_;
  std::uint16_t port_ = 0;
};

} // namespace usbport::posix_common
