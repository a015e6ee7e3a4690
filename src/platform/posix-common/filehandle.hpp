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

#include <cerrno>
#include <cstring>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace usbport {

// Owns one descriptor; closes it on destruction or reset.
class FileHandle {
public:
  FileHandle() = default;
  explicit FileHandle(int fd) noexcept : fd_(fd) {}

  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  FileHandle(FileHandle&& o) noexcept : fd_(std::exchange(o.fd_, -1)) {}
  FileHandle& operator=(FileHandle&& o) noexcept {
    if (this != &o) reset(std::exchange(o.fd_, -1));
    return *this;
  }

  ~FileHandle() { reset(); }

  int get() const noexcept { return fd_; }
  bool valid() const noexcept { return fd_ >= 0; }

  void reset(int fd = -1) noexcept {
    if (fd_ >= 0 && fd_ != fd) ::close(fd_);
    fd_ = fd;
  }

  void close() noexcept { reset(); }

private:
  int fd_ = -1;
};

namespace detail {

inline bool is_transient(int e) noexcept { return e == EAGAIN || e == EWOULDBLOCK || e == EINTR; }

// Runs one syscall. A failure is logged at `lvl` (transient errnos at debug)
// and errno is preserved for the caller.
template <class Rc, class Fn>
Rc logged_syscall(spdlog::level::level_enum lvl, std::string_view call, std::string_view args, Fn&& fn) noexcept {
  const Rc rc = fn();
  if (rc < 0) {
    const int e = errno;
    spdlog::log(is_transient(e) ? spdlog::level::debug : lvl, "{}({}): {}", call, args, std::strerror(e));
    errno = e;
  }
  return rc;
}

template <class Rc, class Fn>
Rc on_handle(const FileHandle& h, spdlog::level::level_enum lvl, std::string_view call, std::string_view args,
             Fn&& fn) noexcept {
  if (!h.valid()) {
    errno = EBADF;
    return Rc(-1);
  }
  return logged_syscall<Rc>(lvl, call, args, std::forward<Fn>(fn));
}

} // namespace detail

} // namespace usbport

// The macros stringize the flag and request names so a failure in the log
// reads like the call site.

#define do_open(path, flags)                                                                      \
  (::usbport::detail::logged_syscall<int>(spdlog::level::debug, "open", #flags,                   \
                                          [&] { return ::open((path), (flags) | O_CLOEXEC); }))

#define do_socket(domain, type, protocol)                                                         \
  (::usbport::detail::logged_syscall<int>(spdlog::level::err, "socket", #domain ", " #type,       \
                                          [&] { return ::socket((domain), (type), (protocol)); }))

#define do_setsockopt(h, sockopt_level, optname, optval, optlen)                                  \
  (::usbport::detail::on_handle<int>((h), spdlog::level::err, "setsockopt", #sockopt_level ", " #optname, \
                                     [&] { return ::setsockopt((h).get(), (sockopt_level), (optname), (optval), (optlen)); }))

#define do_bind(h, addr, addrlen)                                                                 \
  (::usbport::detail::on_handle<int>((h), spdlog::level::err, "bind", "",                          \
                                     [&] { return ::bind((h).get(), (addr), (addrlen)); }))

#define do_listen(h, backlog)                                                                     \
  (::usbport::detail::on_handle<int>((h), spdlog::level::err, "listen", #backlog,                  \
                                     [&] { return ::listen((h).get(), (backlog)); }))

#define do_accept(h, addr, addrlen, flags)                                                        \
  (::usbport::detail::on_handle<int>((h), spdlog::level::err, "accept4", #flags,                   \
                                     [&] { return ::accept4((h).get(), (addr), (addrlen), (flags)); }))

#define do_send(h, buf, len, flags)                                                               \
  (::usbport::detail::on_handle<ssize_t>((h), spdlog::level::err, "send", #flags,                  \
                                         [&] { return ::send((h).get(), (buf), (len), (flags)); }))

#define do_recv(h, buf, len, flags)                                                               \
  (::usbport::detail::on_handle<ssize_t>((h), spdlog::level::err, "recv", #flags,                  \
                                         [&] { return ::recv((h).get(), (buf), (len), (flags)); }))

// usbfs requests fail routinely on stalled or unplugged hubs; callers decide
// how loud to be.
#define do_ioctl(h, request, arg)                                                                 \
  (::usbport::detail::on_handle<int>((h), spdlog::level::debug, "ioctl", #request,                 \
                                     [&] { return ::ioctl((h).get(), (request), (arg)); }))
