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

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <lilxml.h>

namespace usbport::indi {

// One parsed or to-be-written INDI message. INDI never mixes text and child
// elements, so text is kept as a single string.
struct XmlElement {
  std::string tag;
  std::vector<std::pair<std::string, std::string>> attrs;
  std::string text;
  std::vector<XmlElement> children;

  XmlElement() = default;
  explicit XmlElement(std::string tag_) : tag(std::move(tag_)) {}

  const std::string* attr(std::string_view name) const noexcept;
  std::string attr_or(std::string_view name, std::string_view def = {}) const;

  XmlElement& set(std::string name, std::string value);
  XmlElement& add(XmlElement child);

  // First child with the given tag and "name" attribute.
  const XmlElement* child_named(std::string_view tag, std::string_view name) const noexcept;
};

// Serialized with libindi's sprXMLEle, newline terminated.
std::string to_xml(const XmlElement& e);

// Splits a client byte stream into top-level elements with a LilXML reader.
// Bytes may arrive in any fragmentation. A malformed element is logged and
// skipped; so is one that grows past kMaxBuffered bytes without closing.
class XmlStreamParser {
public:
  static constexpr std::size_t kMaxBuffered = 1u << 20;

  XmlStreamParser();

  std::vector<XmlElement> feed(std::string_view chunk);

  // Bytes consumed since the last complete element.
  std::size_t buffered() const noexcept { return pending_; }
  std::size_t malformed() const noexcept { return malformed_; }

private:
  void restart_();

  std::unique_ptr<LilXML, void (*)(LilXML*)> lp_;
  std::size_t pending_ = 0;
  std::size_t malformed_ = 0;
};

} // namespace usbport::indi
