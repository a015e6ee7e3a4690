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


#include "platform/posix-common/single_instance.hpp"

#include <cerrno>
#include <cstddef>
#include <utility>

#include <sys/socket.h>
#include <sys/un.h>

#include <spdlog/spdlog.h>

namespace usbport::posix_common {

namespace {

struct AbstractName {
  sockaddr_un addr{};
  socklen_t len = 0;
};

// Abstract unix names live outside the filesystem: a leading NUL, then the
// name bytes, no terminator. The kernel drops the name with the last fd.
core::Result<AbstractName> abstract_name(const std::string& name) {
  using R = core::Result<AbstractName>;
  AbstractName out;
  out.addr.sun_family = AF_UNIX;
  if (name.empty() || name.size() >= sizeof(out.addr.sun_path)) return R::Failf("bad lock name '{}'", name);

  name.copy(out.addr.sun_path + 1, name.size());
  out.len = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + 1 + name.size());
  return R::Ok(out);
}

} // namespace

SingleInstanceLock::~SingleInstanceLock() {
  if (fd_.valid()) spdlog::debug("released instance lock @{}", name_);
}

SingleInstanceLock::SingleInstanceLock(SingleInstanceLock&& o) noexcept
  : fd_(std::move(o.fd_)), name_(std::move(o.name_)) {}

SingleInstanceLock& SingleInstanceLock::operator=(SingleInstanceLock&& o) noexcept {
  fd_ = std::move(o.fd_);
  name_ = std::move(o.name_);
  return *this;
}

core::Result<SingleInstanceLock> SingleInstanceLock::try_acquire(std::string name) {
  using R = core::Result<SingleInstanceLock>;

  auto an = abstract_name(name);
  if (!an) return R::Fail(std::move(an.st));

  FileHandle sock(do_socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0));
  if (!sock.valid()) return R::Fail(core::Status::Errno(errno, "instance lock socket"));

  if (do_bind(sock, reinterpret_cast<const sockaddr*>(&an.value.addr), an.value.len) != 0) {
    const int e = errno;
    if (e == EADDRINUSE) {
      return R::Failf("usbport is already running (instance lock @{} is held)", name);
    }
    return R::Fail(core::Status::Errno(e, "instance lock bind"));
  }

  spdlog::debug("acquired instance lock @{}", name);
  return R::Ok(SingleInstanceLock(std::move(sock), std::move(name)));
}

} // namespace usbport::posix_common
