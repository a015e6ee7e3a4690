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

#include "app/cli.hpp"
#include "app/version.hpp"

#include <charconv>
#include <limits>
#include <string_view>

namespace usbport::app {

static bool is_opt(std::string_view a, std::string_view opt) {
  return a == opt || (a.size() > opt.size() + 1 && a.starts_with(opt) && a[opt.size()] == '=');
}

static std::optional<std::string_view> opt_value(std::string_view a, std::string_view opt) {
  if (a == opt) return std::nullopt;
  if (a.starts_with(opt) && a.size() > opt.size() + 1 && a[opt.size()] == '=') return a.substr(opt.size() + 1);
  return std::nullopt;
}

static core::Result<std::string_view> read_string_value(int& i, int argc, char** argv,
                                                        std::string_view a, std::string_view opt) noexcept
{
  if (auto ov = opt_value(a, opt)) return core::Result<std::string_view>::Ok(*ov);
  if (i + 1 >= argc) return core::Result<std::string_view>::Fail(std::string(opt) + " requires value");
  return core::Result<std::string_view>::Ok(std::string_view(argv[++i]));
}

static core::Result<long> read_int_value(int& i, int argc, char** argv, std::string_view a, std::string_view opt,
                                         long lo, long hi) noexcept
{
  auto vr = read_string_value(i, argc, argv, a, opt);
  if (!vr) return core::Result<long>::Fail(std::move(vr.st));

  const std::string_view s = vr.value;
  long v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, 10);
  if (ec != std::errc{} || ptr != s.data() + s.size() || v < lo || v > hi) {
    return core::Result<long>::Failf("{}: expected a number in [{}, {}], got '{}'", opt, lo, hi, s);
  }
  return core::Result<long>::Ok(v);
}

struct CommandFlag {
  std::string_view flag;
  engine::Command command;
};

static constexpr CommandFlag kCommandFlags[] = {
  {"--reset", engine::Command::SoftReset},
  {"--hard", engine::Command::HardReset},
  {"--disable", engine::Command::Disable},
  {"--up", engine::Command::PowerUp},
  {"--on", engine::Command::PowerUp},
  {"--down", engine::Command::PowerDown},
  {"--off", engine::Command::Off},
};

std::string usage_text() {
  std::string out;
  out.reserve(2048);

  out += "usbport v";
  out += version_string();
  out += "\n\n";

  out += R"(Usage:
  usbport                          print the port listing
  usbport --reset|--hard|--disable|--up|--down|--off LOCATION
  usbport --rest [--rest-port N] [--indi [--indi-port N]] [--host H]

Commands (LOCATION is bus-port.port..., e.g. 1-01.04.02):
  --reset LOCATION       soft reset: rebind the device's drivers and reset it
  --hard LOCATION        ask the enclosing hub to reset the port
  --disable LOCATION     ask the enclosing hub to disable the port
  --up LOCATION          switch port power on (alias --on); re-authorizes a device turned off
  --down LOCATION        switch port power off at the hub
  --off LOCATION         turn the device off at kernel level (deauthorize)

Servers:
  --rest                 start the HTTP server
  --indi                 start the INDI server
  --host H               listen address (default 0.0.0.0)
  --rest-port N          HTTP port (default 80)
  --indi-port N          INDI port (default 7624)

Tuning:
  --timeout MS           wait at most MS for a primitive (default 10000)
  --lock-timeout MS      wait at most MS for a busy port (default 10000)
  --cache MS             reuse a listing up to MS old (default 0, always fresh)
  --workers N            actuation threads (default 4)

  --verbose, -v          enable verbose logging
  --help, -h
  --version
)";
  return out;
}

core::Result<Options> parse_cli(int argc, char** argv) noexcept {
  using R = core::Result<Options>;
  Options o;

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];

    if (a == "--help" || a == "-h") { o.help = true; continue; }
    if (a == "--version") { o.version = true; continue; }
    if (a == "--verbose" || a == "-v") { o.verbose = true; continue; }

    if (a == "--rest") { o.rest = true; continue; }
    if (a == "--indi") { o.indi = true; continue; }

    bool matched = false;
    for (const auto& cf : kCommandFlags) {
      if (!is_opt(a, cf.flag)) continue;
      matched = true;

      auto vr = read_string_value(i, argc, argv, a, cf.flag);
      if (!vr) return R::Fail(std::move(vr.st));
      if (o.command) return R::Failf("only one command per invocation ({} given after --{})", cf.flag, engine::command_name(*o.command));
      o.command = cf.command;
      o.location = std::string(vr.value);
      break;
    }
    if (matched) continue;

    if (is_opt(a, "--host")) {
      auto vr = read_string_value(i, argc, argv, a, "--host");
      if (!vr) return R::Fail(std::move(vr.st));
      o.host = std::string(vr.value);
      continue;
    }
    if (is_opt(a, "--rest-port")) {
      auto vr = read_int_value(i, argc, argv, a, "--rest-port", 1, std::numeric_limits<std::uint16_t>::max());
      if (!vr) return R::Fail(std::move(vr.st));
      o.rest_port = static_cast<std::uint16_t>(vr.value);
      continue;
    }
    if (is_opt(a, "--indi-port")) {
      auto vr = read_int_value(i, argc, argv, a, "--indi-port", 1, std::numeric_limits<std::uint16_t>::max());
      if (!vr) return R::Fail(std::move(vr.st));
      o.indi_port = static_cast<std::uint16_t>(vr.value);
      continue;
    }
    if (is_opt(a, "--timeout")) {
      auto vr = read_int_value(i, argc, argv, a, "--timeout", 1, std::numeric_limits<int>::max());
      if (!vr) return R::Fail(std::move(vr.st));
      o.primitive_timeout_ms = static_cast<int>(vr.value);
      continue;
    }
    if (is_opt(a, "--lock-timeout")) {
      auto vr = read_int_value(i, argc, argv, a, "--lock-timeout", 0, std::numeric_limits<int>::max());
      if (!vr) return R::Fail(std::move(vr.st));
      o.lock_timeout_ms = static_cast<int>(vr.value);
      continue;
    }
    if (is_opt(a, "--cache")) {
      auto vr = read_int_value(i, argc, argv, a, "--cache", 0, std::numeric_limits<int>::max());
      if (!vr) return R::Fail(std::move(vr.st));
      o.cache_ms = static_cast<int>(vr.value);
      continue;
    }
    if (is_opt(a, "--workers")) {
      auto vr = read_int_value(i, argc, argv, a, "--workers", 1, 64);
      if (!vr) return R::Fail(std::move(vr.st));
      o.workers = static_cast<std::size_t>(vr.value);
      continue;
    }

    if (a.starts_with("-")) {
      return R::Fail("Unknown option: " + std::string(a));
    }

    return R::Fail("Positional arguments are not supported: " + std::string(a));
  }

  if (o.command && o.servers()) return R::Fail("a command cannot be combined with --rest/--indi");

  return R::Ok(std::move(o));
}

} // namespace usbport::app
