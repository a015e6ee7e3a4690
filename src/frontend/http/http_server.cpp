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

#include "frontend/http/http_server.hpp"

#include "frontend/http/http_routes.hpp"

#include <exception>

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace usbport::http {

HttpServer::HttpServer(engine::ControlEngine& engine, HttpServerCfg cfg) : engine_(engine), cfg_(std::move(cfg)) {}

HttpServer::~HttpServer() { stop(); }

core::Status HttpServer::start() {
  if (server_) return core::Status::Fail("HTTP server already running");

  server_ = std::make_unique<httplib::Server>();

  auto handler = [this](const httplib::Request& req, httplib::Response& res) {
    const HttpReply r = route(engine_, req.method, req.path, req.body);
    spdlog::info("HTTP {} {} {} -> {}", req.remote_addr, req.method, req.path, r.status);
    res.status = r.status;
    res.set_content(r.body, "text/plain");
  };
  server_->Get(R"(/.*)", handler);
  server_->Post(R"(/.*)", handler);

  server_->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    std::string what = "unknown error";
    try {
      if (ep) std::rethrow_exception(ep);
    } catch (const std::exception& e) {
      what = e.what();
    }
    spdlog::error("HTTP {} {}: {}", req.method, req.path, what);
    res.status = 500;
    res.set_content(what + "\n", "text/plain");
  });

  if (cfg_.port == 0) {
    const int p = server_->bind_to_any_port(cfg_.host);
    if (p < 0) {
      server_.reset();
      return core::Status::Failf("HTTP: cannot bind {}", cfg_.host);
    }
    port_ = static_cast<std::uint16_t>(p);
  } else {
    if (!server_->bind_to_port(cfg_.host, cfg_.port)) {
      server_.reset();
      return core::Status::Failf("HTTP: cannot bind {}:{}", cfg_.host, cfg_.port);
    }
    port_ = cfg_.port;
  }

  thread_ = std::thread([srv = server_.get()] {
    if (!srv->listen_after_bind()) spdlog::error("HTTP server stopped listening");
  });
  server_->wait_until_ready();

  spdlog::info("HTTP server on {}:{}", cfg_.host, port_);
  return core::Status::Ok();
}

void HttpServer::stop() noexcept {
  if (!server_) return;
  server_->stop();
  if (thread_.joinable()) thread_.join();
  server_.reset();
  spdlog::info("HTTP server stopped");
}

} // namespace usbport::http
