// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <utility>

#include "node.hh"

xmpp::node::node(xml::qname tag, std::vector<xml::attribute> attributes)
    : tag(std::move(tag)), attributes(std::move(attributes)) {
}

void xmpp::node::decode(xml::reader& reader, const xml::start_element& start) {
    tag = start.name;
    attributes.clear();
    children.clear();

    for (auto& attr : start.attributes) {
        if (!(attr.is_declaration() && attr.name.local == "xmlns"))
            attributes.push_back(attr);
    }

    text = read_children(reader, [&](const xml::start_element& child) {
        children.emplace_back().decode(reader, child);
    });
}

void xmpp::node::encode(xml::writer& writer) const {
    writer.start_element(tag);
    // declarations first so the prefixes they bind get reused
    for (auto& attr : attributes)
        if (attr.is_declaration())
            writer.attribute(attr);
    for (auto& attr : attributes)
        if (!attr.is_declaration())
            writer.attribute(attr);
    for (auto& child : children)
        child.encode(writer);
    writer.end_element();
}
