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

#include "frontend/http/http_routes.hpp"

#include "core/str.hpp"
#include "frontend/render.hpp"

namespace usbport::http {

namespace {

HttpReply listing(engine::ControlEngine& engine) {
  auto lr = engine.list();
  if (!lr) return {500, lr.st.msg + "\n"};

  std::string text = frontend::render_text(lr.value);
  if (!text.empty()) text += '\n';
  return {200, std::move(text)};
}

} // namespace

int status_for(engine::FailureKind k) noexcept {
  switch (k) {
    case engine::FailureKind::None:              return 200;
    case engine::FailureKind::InvalidAddress:    return 400;
    case engine::FailureKind::AddressNotFound:   return 404;
    case engine::FailureKind::NoDeviceBound:     return 409;
    case engine::FailureKind::UnsupportedByHub:  return 409;
    case engine::FailureKind::UnsupportedByHost: return 501;
    case engine::FailureKind::Timeout:           return 504;
    case engine::FailureKind::PrimitiveFailure:  return 500;
  }
  return 500;
}

HttpReply route(engine::ControlEngine& engine, std::string_view method, std::string_view path,
                std::string_view body) {
  const bool get = method == "GET";
  const bool post = method == "POST";

  if (path == "/" && (get || post)) return listing(engine);
  if (!post || path.size() < 2 || path.front() != '/') return {404, "Not Found\n"};

  const auto cmd = engine::parse_command(path.substr(1));
  if (!cmd) return {404, "Not Found\n"};

  const engine::Outcome o = engine.execute(core::trim(body), *cmd);
  if (!o.ok()) return {status_for(o.kind), o.describe() + "\n"};

  HttpReply r = listing(engine);
  if (r.status == 200 && !o.affected.empty()) r.body = o.describe() + "\n" + r.body;
  return r;
}

} // namespace usbport::http
