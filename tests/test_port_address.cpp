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


#include "topology/port_address.hpp"

#include <cstdio>
#include <string>
#include <vector>

#include <fmt/format.h>

using usbport::topology::PortAddress;

static int g_pass = 0;
static int g_fail = 0;

template <class T>
static void check_eq(const char* label, T got, T expected) {
  if (got == expected) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

// ----- parsing -----

static void test_parse_full_chain() {
  auto r = PortAddress::parse("1-01.04.02.04");
  check_eq("chain_ok", static_cast<bool>(r), true);
  if (!r) return;
  check_eq("chain_bus", r.value.bus(), 1);
  check_eq("chain_depth", r.value.depth(), std::size_t{4});
  check_eq("chain_port", r.value.port(), 4);
  check_eq("chain_value", r.value, PortAddress{1, 1, 4, 2, 4});
}

static void test_parse_bus_only() {
  auto r = PortAddress::parse("3");
  check_eq("bus_ok", static_cast<bool>(r), true);
  if (!r) return;
  check_eq("bus_is_bus", r.value.is_bus(), true);
  check_eq("bus_port", r.value.port(), 0);
  check_eq("bus_str", r.value.str(), std::string("3"));
}

static void test_parse_unpadded_and_whitespace() {
  auto r = PortAddress::parse("  1-1.4.2.4\n");
  check_eq("unpadded_ok", static_cast<bool>(r), true);
  if (!r) return;
  check_eq("unpadded_canonical", r.value.str(), std::string("1-01.04.02.04"));

  auto z = PortAddress::parse("001-0004");
  check_eq("zeros_ok", static_cast<bool>(z), true);
  if (z) check_eq("zeros_value", z.value, PortAddress{1, 4});
}

static void test_parse_rejects_malformed() {
  const std::vector<std::string> bad = {
    "", "   ", "-", "1-", "-1", "1-.2", "1-2.", "1--2", "1-2..3", "a-1", "1-x",
    "1-2.x", "1.2", "1-2-3", "0", "1-0", "1-04.00", "1-99999999999", "1-+2", "1 -2",
  };
  for (const auto& s : bad) {
    auto r = PortAddress::parse(s);
    if (r) {
      std::fprintf(stderr, "FAIL parse accepted '%s'\n", s.c_str());
      ++g_fail;
    } else {
      ++g_pass;
    }
  }
}

static void test_large_components_parse() {
  // Range is not a syntax question: 1-256 is well-formed and is reported
  // as a missing port by whoever looks it up.
  auto r = PortAddress::parse("1-256");
  check_eq("large_ok", static_cast<bool>(r), true);
  if (r) check_eq("large_value", r.value, PortAddress{1, 256});
  auto bus = PortAddress::parse("300");
  check_eq("large_bus_ok", static_cast<bool>(bus), true);
  if (bus) check_eq("large_bus_str", bus.value.str(), std::string("300"));
}

static void test_failure_message_names_input() {
  auto r = PortAddress::parse("1-x");
  check_eq("msg_fail", static_cast<bool>(r), false);
  check_eq("msg_has_text", r.st.msg.find("1-x") != std::string::npos, true);
}

// Canonical text pads every port to two digits and never pads the bus, so
// "1-1.4" prints as "1-01.04". Input may carry any leading zeros.
static void test_roundtrip_canonical_text() {
  check_eq("canon_padded", PortAddress{1, 1, 4}.str(), std::string("1-01.04"));
  check_eq("canon_wide_port", PortAddress{1, 123}.str(), std::string("1-123"));
  auto z = PortAddress::parse("01-001.4");
  check_eq("canon_from_zeros", z ? z.value.str() : std::string(), std::string("1-01.04"));

  const std::vector<std::string> good = {"1", "12", "1-01", "2-10.03", "1-01.04.02.04", "4-255.99.01", "1-256"};
  for (const auto& s : good) {
    auto r = PortAddress::parse(s);
    if (!r || r.value.str() != s) {
      std::fprintf(stderr, "FAIL roundtrip '%s'\n", s.c_str());
      ++g_fail;
      continue;
    }
    auto again = PortAddress::parse(r.value.str());
    check_eq("roundtrip_value", static_cast<bool>(again) && again.value == r.value, true);
  }
}

// ----- sysfs names -----

static void test_sysfs_names() {
  auto root = PortAddress::from_sysfs_name("usb3");
  check_eq("usb3_ok", static_cast<bool>(root), true);
  if (root) check_eq("usb3_value", root.value, PortAddress{3});

  auto dev = PortAddress::from_sysfs_name("3-1.4");
  check_eq("dev_ok", static_cast<bool>(dev), true);
  if (dev) check_eq("dev_value", dev.value, PortAddress{3, 1, 4});

  auto ifc = PortAddress::from_sysfs_name("3-1.4:1.0");
  check_eq("ifc_ok", static_cast<bool>(ifc), true);
  if (ifc) check_eq("ifc_value", ifc.value, PortAddress{3, 1, 4});

  check_eq("usb_alone", static_cast<bool>(PortAddress::from_sysfs_name("usb")), false);
  check_eq("no_dash", static_cast<bool>(PortAddress::from_sysfs_name("1")), false);
  check_eq("driver_dir", static_cast<bool>(PortAddress::from_sysfs_name("port")), false);
}

// ----- structure -----

static void test_parent_child() {
  const PortAddress a{1, 1, 4, 2};
  check_eq("parent", a.parent(), PortAddress{1, 1, 4});
  check_eq("child", a.child(4), PortAddress{1, 1, 4, 2, 4});
  check_eq("bus_parent", PortAddress{2}.parent(), PortAddress{2});
  check_eq("ancestor", PortAddress{1, 1}.is_ancestor_of(a), true);
  check_eq("bus_ancestor", PortAddress{1}.is_ancestor_of(a), true);
  check_eq("not_self", a.is_ancestor_of(a), false);
  check_eq("not_sibling", PortAddress{1, 2}.is_ancestor_of(a), false);
  check_eq("default_invalid", PortAddress{}.valid(), false);
}

static void test_ordering_is_depth_first() {
  check_eq("bus_before_port", PortAddress{1} < PortAddress{1, 1}, true);
  check_eq("parent_before_child", PortAddress{1, 1} < PortAddress{1, 1, 4}, true);
  check_eq("subtree_before_sibling", PortAddress{1, 1, 4} < PortAddress{1, 2}, true);
  check_eq("bus_order", PortAddress{1, 9} < PortAddress{2}, true);
  check_eq("numeric_not_text", PortAddress{1, 2} < PortAddress{1, 10}, true);
}

static void test_formatter() {
  check_eq("fmt_plain", fmt::format("{}", PortAddress{1, 1, 4}), std::string("1-01.04"));
  check_eq("fmt_padded", fmt::format("[{:8}]", PortAddress{1, 2}), std::string("[1-02    ]"));
}

int main() {
  test_parse_full_chain();
  test_parse_bus_only();
  test_parse_unpadded_and_whitespace();
  test_parse_rejects_malformed();
  test_failure_message_names_input();
  test_large_components_parse();
  test_roundtrip_canonical_text();
  test_sysfs_names();
  test_parent_child();
  test_ordering_is_depth_first();
  test_formatter();

  std::fprintf(stdout, "port_address: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
