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

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace usbport::core {

// Outcome of an operation that produces nothing. `err` carries the errno of
// a failing system call (0 otherwise) so callers can tell timeouts and
// permission problems apart without parsing `msg`.
struct Status {
  bool ok = true;
  std::string msg;
  int err = 0;

  Status() = default;
  Status(bool ok_, std::string msg_, int err_ = 0) : ok(ok_), msg(std::move(msg_)), err(err_) {}

  static Status Ok() { return {}; }
  static Status Fail(std::string why) { return {false, std::move(why)}; }

  template <class... Args>
  static Status Failf(fmt::format_string<Args...> f, Args&&... args) {
    return Fail(fmt::format(f, std::forward<Args>(args)...));
  }

  // "<what>: <strerror(e)>", keeping e.
  static Status Errno(int e, std::string what) {
    what += ": ";
    what += std::strerror(e);
    return {false, std::move(what), e};
  }

  bool timed_out() const noexcept { return !ok && err == ETIMEDOUT; }

  explicit operator bool() const noexcept { return ok; }
};

// Status plus a value that exists only on success. T needs no default
// constructor; `value` is live exactly when has_value is set.
template <class T>
struct Result {
  Status st{false, {}};
  bool has_value = false;

  union {
    char none_;
    T value;
  };

  Result() noexcept : none_(0) {}
  ~Result() { drop_(); }

  Result(const Result&) = delete;
  Result& operator=(const Result&) = delete;

  Result(Result&& o) noexcept(std::is_nothrow_move_constructible_v<T>) : none_(0) { steal_(o); }

  Result& operator=(Result&& o) noexcept(std::is_nothrow_move_constructible_v<T>) {
    if (this != &o) {
      drop_();
      steal_(o);
    }
    return *this;
  }

  static Result Ok(T v) {
    Result r;
    r.st = Status::Ok();
    r.emplace_(std::move(v));
    return r;
  }

  static Result Fail(Status why) {
    Result r;
    r.st = std::move(why);
    r.st.ok = false;
    return r;
  }

  static Result Fail(std::string why) { return Fail(Status::Fail(std::move(why))); }

  template <class... Args>
  static Result Failf(fmt::format_string<Args...> f, Args&&... args) {
    return Fail(Status::Failf(f, std::forward<Args>(args)...));
  }

  explicit operator bool() const noexcept { return st.ok; }

private:
  void emplace_(T&& v) {
    std::construct_at(std::addressof(value), std::move(v));
    has_value = true;
  }

  void steal_(Result& o) {
    st = std::move(o.st);
    if (o.has_value) {
      emplace_(std::move(o.value));
      o.drop_();
    }
  }

  void drop_() noexcept {
    if (!has_value) return;
    std::destroy_at(std::addressof(value));
    has_value = false;
  }
};

} // namespace usbport::core

// Returns early from a Status-returning function when `expr` fails.
#define USBPORT_TRY(expr)                  \
  do {                                     \
    auto usbport_st_ = (expr);             \
    if (!usbport_st_.ok) return usbport_st_; \
  } while (0)
