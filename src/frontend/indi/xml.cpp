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


#include "frontend/indi/xml.hpp"

#include "core/str.hpp"

#include <spdlog/spdlog.h>

namespace usbport::indi {

namespace {

// lilxml formats its diagnostics into a caller buffer of this size.
constexpr std::size_t kLilErrSize = 2048;

using EleHandle = std::unique_ptr<XMLEle, void (*)(XMLEle*)>;

XmlElement from_lil(XMLEle* e) {
  XmlElement out(tagXMLEle(e));
  for (XMLAtt* a = nextXMLAtt(e, 1); a; a = nextXMLAtt(e, 0)) out.attrs.emplace_back(nameXMLAtt(a), valuXMLAtt(a));

  // prXMLEle puts text on its own line; the surrounding whitespace is layout.
  out.text = std::string(core::trim(pcdataXMLEle(e)));
  for (XMLEle* c = nextXMLEle(e, 1); c; c = nextXMLEle(e, 0)) out.children.push_back(from_lil(c));
  return out;
}

void to_lil(const XmlElement& src, XMLEle* dst) {
  for (const auto& [k, v] : src.attrs) addXMLAtt(dst, k.c_str(), v.c_str());
  if (!src.text.empty()) editXMLEle(dst, src.text.c_str());
  for (const auto& c : src.children) to_lil(c, addXMLEle(dst, c.tag.c_str()));
}

} // namespace

const std::string* XmlElement::attr(std::string_view name) const noexcept {
  for (const auto& [k, v] : attrs) {
    if (k == name) return &v;
  }
  return nullptr;
}

std::string XmlElement::attr_or(std::string_view name, std::string_view def) const {
  const auto* v = attr(name);
  return v ? *v : std::string(def);
}

XmlElement& XmlElement::set(std::string name, std::string value) {
  for (auto& [k, v] : attrs) {
    if (k == name) {
      v = std::move(value);
      return *this;
    }
  }
  attrs.emplace_back(std::move(name), std::move(value));
  return *this;
}

XmlElement& XmlElement::add(XmlElement child) {
  children.push_back(std::move(child));
  return *this;
}

const XmlElement* XmlElement::child_named(std::string_view t, std::string_view name) const noexcept {
  for (const auto& c : children) {
    if (c.tag != t) continue;
    const auto* n = c.attr("name");
    if (n && *n == name) return &c;
  }
  return nullptr;
}

std::string to_xml(const XmlElement& e) {
  EleHandle root(addXMLEle(nullptr, e.tag.c_str()), &delXMLEle);
  to_lil(e, root.get());

  std::string out(static_cast<std::size_t>(sprlXMLEle(root.get(), 0)) + 1, '\0');
  out.resize(static_cast<std::size_t>(sprXMLEle(out.data(), root.get(), 0)));
  return out;
}

XmlStreamParser::XmlStreamParser() : lp_(newLilXML(), &delLilXML) {}

void XmlStreamParser::restart_() {
  lp_.reset(newLilXML());
  pending_ = 0;
}

std::vector<XmlElement> XmlStreamParser::feed(std::string_view chunk) {
  std::vector<XmlElement> out;
  char err[kLilErrSize];

  for (char c : chunk) {
    err[0] = '\0';
    EleHandle ele(readXMLEle(lp_.get(), static_cast<unsigned char>(c), err), &delXMLEle);
    ++pending_;

    if (ele) {
      out.push_back(from_lil(ele.get()));
      pending_ = 0;
    } else if (err[0]) {
      ++malformed_;
      spdlog::warn("INDI: malformed XML dropped: {}", core::trim(err));
      restart_();
    } else if (pending_ > kMaxBuffered) {
      ++malformed_;
      spdlog::warn("INDI: element larger than {} bytes dropped", kMaxBuffered);
      restart_();
    }
  }
  return out;
}

} // namespace usbport::indi
