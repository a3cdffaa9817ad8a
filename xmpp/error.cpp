// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <charconv>
#include <optional>
#include <string>

#include "error.hh"
#include "node.hh"
#include "ns.hh"
#include "../logger.hh"

namespace {

    std::optional<int> parse_code(const std::string& s) {
        int value = 0;
        auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc() || end != s.data() + s.size())
            return {};
        return value;
    }

}

void xmpp::stanza_error::decode(xml::reader& reader, const xml::start_element& start) {
    if (auto attr = start.get_attr("code")) {
        if (auto value = parse_code(*attr))
            code = *value;
        else
            iqcodec::log().debug("error", "ignoring bad error code '{}'", *attr);
    }
    if (auto attr = start.get_attr("type"))
        type = *attr;

    const std::string_view stanzas = urn::ietf::params::xml::ns::xmpp_stanzas().ns();
    read_children(reader, [&](const xml::start_element& child) {
        node elt;
        elt.decode(reader, child);

        if (elt.tag.space != stanzas) {
            iqcodec::log().debug("error", "dropping {{{}}}{}", elt.tag.space, elt.tag.local);
            return;
        }
        if (elt.tag.local == "text")
            text = elt.text;
        else
            reason = elt.tag.local;
    });
}

void xmpp::stanza_error::encode(xml::writer& writer) const {
    if (empty())
        return;

    writer.start_element("error");
    writer.attribute("code", std::to_string(code));
    if (!type.empty())
        writer.attribute("type", type);

    if (!reason.empty()) {
        writer.start_element(xmlns::name<urn::ietf::params::xml::ns::xmpp_stanzas>(reason));
        writer.end_element();
    }

    if (!text.empty()) {
        writer.start_element(xmlns::name<urn::ietf::params::xml::ns::xmpp_stanzas>("text"));
        writer.text(text);
        writer.end_element();
    }

    writer.end_element();
}
