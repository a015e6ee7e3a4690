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


#include "fake_usb_backend.hpp"

#include "engine/control_engine.hpp"
#include "frontend/indi/indi_device.hpp"
#include "frontend/indi/indi_server.hpp"
#include "frontend/indi/xml.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace usbport;
using indi::XmlElement;
using indi::XmlStreamParser;
using test::FakeUsbBackend;
using topology::PortAddress;

using namespace std::chrono_literals;

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

static const XmlElement* find_msg(const std::vector<XmlElement>& v, std::string_view tag, std::string_view name) {
  for (const auto& e : v) {
    if (e.tag == tag && e.attr_or("name") == name) return &e;
  }
  return nullptr;
}

static std::size_t count_tag(const std::vector<XmlElement>& v, std::string_view tag) {
  return static_cast<std::size_t>(std::count_if(v.begin(), v.end(), [&](const auto& e) { return e.tag == tag; }));
}

static std::string child_text(const XmlElement* e, std::string_view tag, std::string_view name) {
  if (!e) return "<missing>";
  const auto* c = e->child_named(tag, name);
  return c ? c->text : "<missing>";
}

static XmlElement new_text(const std::string& device, const std::string& prop, const std::string& command) {
  XmlElement v("newTextVector");
  v.set("device", device).set("name", prop);
  XmlElement c("oneText");
  c.set("name", "COMMAND");
  c.text = command;
  v.add(std::move(c));
  return v;
}

// ----- XML stream -----

static void test_fragmented_stream() {
  XmlStreamParser p;
  const std::string msg = "<newTextVector device='D' name='P'>\n  <oneText name='COMMAND'>reset</oneText>\n</newTextVector>";

  std::size_t got = 0;
  for (char c : msg) got += p.feed(std::string_view(&c, 1)).size();
  check_eq("frag_one_element", got, std::size_t{1});
  check_eq("frag_drained", p.buffered(), std::size_t{0});

  auto all = p.feed("<getProperties version='1.7'/>\n<getProperties device='D'/>");
  check_eq("batch_count", all.size(), std::size_t{2});
  if (all.size() == 2) {
    check_eq("batch_version", all[0].attr_or("version"), std::string("1.7"));
    check_eq("batch_device", all[1].attr_or("device"), std::string("D"));
  }
}

static void test_element_contents() {
  XmlStreamParser p;
  auto v = p.feed("<newTextVector device=\"D\" name=\"PORT_1_01\">"
                  "<oneText name=\"INFO\">ignored</oneText>"
                  "<oneText name=\"COMMAND\">\n  down \n</oneText>"
                  "</newTextVector>");
  check_eq("contents_count", v.size(), std::size_t{1});
  if (v.empty()) return;
  check_eq("contents_tag", v[0].tag, std::string("newTextVector"));
  check_eq("contents_attrs", v[0].attrs.size(), std::size_t{2});
  check_eq("contents_children", v[0].children.size(), std::size_t{2});
  check_eq("contents_command", child_text(&v[0], "oneText", "COMMAND"), std::string("down"));
  check_eq("contents_missing", v[0].child_named("oneText", "OTHER") == nullptr, true);
}

static void test_entities() {
  XmlStreamParser p;
  auto v = p.feed("<message message='1 &lt; 2 &amp;&amp; 3 &gt; 2'/>");
  check_eq("attr_entities", v.size() == 1 && v[0].attr_or("message") == "1 < 2 && 3 > 2", true);
}

static void test_malformed_is_skipped() {
  XmlStreamParser p;
  auto v = p.feed("<a><b></a>");
  check_eq("malformed_none", v.empty(), true);
  check_eq("malformed_counted", p.malformed() >= 1, true);

  v = p.feed("<getProperties version='1.7'/>");
  check_eq("recovered_count", v.size(), std::size_t{1});
  if (!v.empty()) check_eq("recovered_tag", v.back().tag, std::string("getProperties"));

  XmlStreamParser q;
  (void)q.feed("<a x='1'>");
  (void)q.feed(std::string(XmlStreamParser::kMaxBuffered + 16, 'x'));
  check_eq("overflow_counted", q.malformed() >= 1, true);
  check_eq("overflow_restarted", q.buffered() < XmlStreamParser::kMaxBuffered, true);
  auto after = q.feed("<getProperties/>");
  check_eq("overflow_recovered", after.size(), std::size_t{1});
}

static void test_writer() {
  XmlElement v("setTextVector");
  v.set("device", "D").set("name", "P").set("message", "a<b & \"c\"");
  XmlElement t("oneText");
  t.set("name", "INFO");
  t.text = "1-01 [P]";
  XmlElement empty("oneText");
  empty.set("name", "COMMAND");
  v.add(std::move(t)).add(std::move(empty));

  const std::string text = indi::to_xml(v);
  check_eq("to_xml_root", text.rfind("<setTextVector", 0) == 0, true);
  check_eq("to_xml_escaped", text.find("a<b") == std::string::npos, true);
  check_eq("to_xml_newline", !text.empty() && text.back() == '\n', true);

  // What the writer produces, the reader accepts unchanged.
  XmlStreamParser p;
  auto back = p.feed(text);
  check_eq("reread_count", back.size(), std::size_t{1});
  if (back.size() == 1) {
    check_eq("reread_message", back[0].attr_or("message"), std::string("a<b & \"c\""));
    check_eq("reread_info", child_text(&back[0], "oneText", "INFO"), std::string("1-01 [P]"));
    check_eq("reread_empty", child_text(&back[0], "oneText", "COMMAND"), std::string());
    check_eq("reread_order", back[0].attrs.front().first, std::string("device"));
  }

  check_eq("set_replaces", XmlElement("x").set("a", "1").set("a", "2").attrs.size(), std::size_t{1});
}

// ----- naming -----

static void test_names() {
  check_eq("prop_name", indi::property_name(PortAddress{1, 1, 4, 2, 4}), std::string("PORT_1_01_04_02_04"));
  check_eq("prop_bus", indi::property_name(PortAddress{3}), std::string("PORT_3"));

  const std::string dev = indi::default_device_name();
  check_eq("dev_prefix", dev.rfind("USBPORT_", 0) == 0, true);
  check_eq("dev_chars", std::all_of(dev.begin(), dev.end(), [](char c) {
             return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
           }), true);
}

// ----- device -----

struct Rig {
  FakeUsbBackend backend;
  engine::PortLockRegistry locks;
  std::unique_ptr<engine::ControlEngine> engine;
  std::unique_ptr<indi::IndiDevice> device;

  Rig() {
    test::build_standard_tree(backend);
    engine = std::make_unique<engine::ControlEngine>(backend, engine::EngineCfg{}, locks);
    device = std::make_unique<indi::IndiDevice>(*engine, "USBPORT_TEST");
  }

  std::vector<XmlElement> get_properties() {
    XmlElement g("getProperties");
    g.set("version", indi::kProtocolVersion);
    return device->handle(g);
  }
};

static void test_get_properties() {
  Rig r;
  auto v = r.get_properties();
  check_eq("def_count", v.size(), std::size_t{16});
  check_eq("def_all", count_tag(v, "defTextVector"), std::size_t{16});
  if (!v.empty()) check_eq("def_first", v.front().attr_or("name"), std::string("PORT_1_01_01"));

  const auto* ftdi = find_msg(v, "defTextVector", "PORT_1_01_04_02_04");
  check_eq("def_ftdi", ftdi != nullptr, true);
  if (ftdi) {
    check_eq("def_device", ftdi->attr_or("device"), std::string("USBPORT_TEST"));
    check_eq("def_group", ftdi->attr_or("group"), std::string("1-01.04.02.04"));
    check_eq("def_perm", ftdi->attr_or("perm"), std::string("rw"));
    check_eq("def_info", child_text(ftdi, "defText", "INFO"),
             std::string("1-01.04.02.04 [PCE] 0403:6001 ttyUSB0 - FTDI FT232R USB UART (A10KZP45)"));
    check_eq("def_command_empty", child_text(ftdi, "defText", "COMMAND"), std::string(""));
  }

  check_eq("hub_not_defined", find_msg(v, "defTextVector", "PORT_1_01") == nullptr, true);

  XmlElement other("getProperties");
  other.set("device", "SOMEONE_ELSE");
  check_eq("other_device", r.device->handle(other).empty(), true);

  XmlElement one("getProperties");
  one.set("device", "USBPORT_TEST").set("name", "PORT_2_01");
  auto single = r.device->handle(one);
  check_eq("one_count", single.size(), std::size_t{1});
}

static void test_command_executes_and_refreshes() {
  Rig r;
  (void)r.get_properties();

  auto v = r.device->handle(new_text("USBPORT_TEST", "PORT_1_01_04_02_04", " Down "));
  check_eq("cmd_call", r.backend.primitive_calls(), std::size_t{1});

  const auto* target = find_msg(v, "setTextVector", "PORT_1_01_04_02_04");
  check_eq("cmd_target_set", target != nullptr, true);
  if (target) {
    check_eq("cmd_state", target->attr_or("state"), std::string("Ok"));
    check_eq("cmd_message", target->attr_or("message"), std::string("down 1-01.04.02.04: ok"));
    check_eq("cmd_info", child_text(target, "oneText", "INFO"), std::string("1-01.04.02.04 []"));
  }

  const auto* other = find_msg(v, "setTextVector", "PORT_2_01");
  check_eq("other_idle", other && other->attr_or("state") == "Idle" && !other->attr("message"), true);
  check_eq("refresh_all", count_tag(v, "setTextVector"), std::size_t{16});
  check_eq("no_redefine", count_tag(v, "defTextVector"), std::size_t{0});
}

static void test_command_failure_and_unknown() {
  Rig r;
  (void)r.get_properties();

  auto fail = r.device->handle(new_text("USBPORT_TEST", "PORT_2_01", "up"));
  const auto* t = find_msg(fail, "setTextVector", "PORT_2_01");
  check_eq("fail_alert", t && t->attr_or("state") == "Alert", true);
  check_eq("fail_message", t && t->attr_or("message").find("unsupported by hub") != std::string::npos, true);

  auto unknown = r.device->handle(new_text("USBPORT_TEST", "PORT_2_01", "explode"));
  const auto* u = find_msg(unknown, "setTextVector", "PORT_2_01");
  check_eq("unknown_alert", u && u->attr_or("state") == "Alert", true);
  check_eq("unknown_message", u && u->attr_or("message") == "command not recognized", true);

  auto refresh = r.device->handle(new_text("USBPORT_TEST", "PORT_2_01", "  "));
  const auto* f = find_msg(refresh, "setTextVector", "PORT_2_01");
  check_eq("refresh_ok", f && f->attr_or("state") == "Ok", true);

  check_eq("no_hardware_touched", r.backend.primitive_calls(), std::size_t{0});

  auto noprop = r.device->handle(new_text("USBPORT_TEST", "PORT_9_09", "reset"));
  check_eq("noprop_message", noprop.size() == 1 && noprop[0].tag == "message" &&
                               noprop[0].attr_or("message") == "PORT_9_09: no such property", true);

  check_eq("wrong_device", r.device->handle(new_text("ELSEWHERE", "PORT_2_01", "reset")).empty(), true);

  XmlElement blob("enableBLOB");
  blob.set("device", "USBPORT_TEST");
  check_eq("ignored_tag", r.device->handle(blob).empty(), true);
}

static void test_ports_appear_and_vanish() {
  Rig r;
  (void)r.get_properties();

  r.backend.add_device(PortAddress{3, 1}, test::make_device(0x2341, 0x0043, "Uno", "Arduino", "7563", "cdc_acm", {"ttyACM0"}));
  r.backend.fail_hub_reads(PortAddress{1, 2});

  auto v = r.device->handle(new_text("USBPORT_TEST", "PORT_2_01", ""));
  check_eq("appeared", find_msg(v, "defTextVector", "PORT_3_01") != nullptr, true);
  check_eq("vanished", find_msg(v, "delProperty", "PORT_1_02_02") != nullptr, true);
  check_eq("vanished_not_set", find_msg(v, "setTextVector", "PORT_1_02_02") == nullptr, true);

  // Deletions first, then definitions, then values.
  if (!v.empty()) check_eq("del_first", v.front().tag, std::string("delProperty"));

  // A later refresh has nothing new to define or delete.
  auto again = r.device->handle(new_text("USBPORT_TEST", "PORT_2_01", ""));
  check_eq("stable_defs", count_tag(again, "defTextVector") + count_tag(again, "delProperty"), std::size_t{0});
}

static void test_listing_failure() {
  Rig r;
  (void)r.get_properties();
  r.backend.fail_enumeration(true);

  auto v = r.device->handle(new_text("USBPORT_TEST", "PORT_1_01_04_02_04", "reset"));
  check_eq("lf_message", count_tag(v, "message"), std::size_t{1});
  const auto* t = find_msg(v, "setTextVector", "PORT_1_01_04_02_04");
  check_eq("lf_alert", t && t->attr_or("state") == "Alert", true);
  check_eq("lf_no_delete", count_tag(v, "delProperty"), std::size_t{0});
}

// ----- server -----

static std::string read_until(int fd, std::string_view needle, std::chrono::milliseconds limit) {
  std::string got;
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (got.find(needle) == std::string::npos && std::chrono::steady_clock::now() < deadline) {
    pollfd pfd{fd, POLLIN, 0};
    if (::poll(&pfd, 1, 50) <= 0) continue;
    char buf[4096];
    const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n <= 0) break;
    got.append(buf, static_cast<std::size_t>(n));
  }
  return got;
}

static int connect_local(std::uint16_t port) {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) return -1;
  sockaddr_in a{};
  a.sin_family = AF_INET;
  a.sin_port = htons(port);
  ::inet_pton(AF_INET, "127.0.0.1", &a.sin_addr);
  if (::connect(fd, reinterpret_cast<const sockaddr*>(&a), sizeof(a)) != 0) {
    ::close(fd);
    return -1;
  }
  return fd;
}

static void test_server_loopback() {
  Rig r;
  indi::IndiServerCfg cfg;
  cfg.host = "127.0.0.1";
  cfg.port = 0;
  cfg.poll_ms = 20;
  indi::IndiServer server(*r.device, cfg);

  auto st = server.start();
  check_eq("server_start", static_cast<bool>(st), true);
  if (!st) return;
  check_eq("server_port", server.port() != 0, true);

  std::atomic<bool> stop{false};
  std::thread loop([&] { (void)server.run(stop); });

  const int a = connect_local(server.port());
  const int b = connect_local(server.port());
  check_eq("clients_connected", a >= 0 && b >= 0, true);

  if (a >= 0 && b >= 0) {
    std::this_thread::sleep_for(100ms);

    // Split across two writes.
    const std::string req = "<getProperties version='1.7'/>";
    (void)::send(a, req.data(), 10, MSG_NOSIGNAL);
    std::this_thread::sleep_for(20ms);
    (void)::send(a, req.data() + 10, req.size() - 10, MSG_NOSIGNAL);

    const std::string last = "PORT_2_02";
    XmlStreamParser pa;
    XmlStreamParser pb;
    // The needle sits in the opening tag; give the rest of the vector time to land.
    const auto drain = [&](int fd) {
      std::string got = read_until(fd, last, 3000ms);
      return got + read_until(fd, "\x01", 200ms);
    };
    const auto ma = pa.feed(drain(a));
    const auto mb = pb.feed(drain(b));
    const XmlElement* ftdi = find_msg(ma, "defTextVector", "PORT_1_01_04_02_04");
    check_eq("a_defs", ftdi != nullptr && ftdi->attr_or("device") == "USBPORT_TEST", true);
    check_eq("b_broadcast", find_msg(mb, "defTextVector", last) != nullptr, true);
  }

  if (a >= 0) ::close(a);
  if (b >= 0) ::close(b);

  stop = true;
  loop.join();
}

int main() {
  test_fragmented_stream();
  test_element_contents();
  test_entities();
  test_malformed_is_skipped();
  test_writer();
  test_names();
  test_get_properties();
  test_command_executes_and_refreshes();
  test_command_failure_and_unknown();
  test_ports_appear_and_vanish();
  test_listing_failure();
  test_server_loopback();

  std::fprintf(stdout, "indi: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
