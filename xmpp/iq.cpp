// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <stdexcept>
#include <utility>
#include <fmt/core.h>

#include "iq.hh"
#include "../config.hh"
#include "../logger.hh"

xmpp::iq::iq(std::string type, std::string from, std::string to,
             std::string id, std::string lang)
    : id(std::move(id))
    , from(std::move(from))
    , to(std::move(to))
    , type(std::move(type))
    , lang(std::move(lang)) {
}

void xmpp::iq::add_payload(payload_ptr p) {
    if (!p)
        throw std::invalid_argument("iq payload must not be null");
    payloads.push_back(std::move(p));
}

xmpp::iq xmpp::iq::make_error(stanza_error err) const {
    iq reply = *this;
    reply.type = iq_type::error;
    std::swap(reply.from, reply.to);
    reply.error = std::move(err);
    return reply;
}

xmpp::iq xmpp::iq::decode(xml::reader& reader, const xml::start_element& start,
                          const registry& table, bool capture_raw) {
    iq result;
    result.tag = start.name;
    result.id = start.get_attr("id").value_or("");
    result.type = start.get_attr("type").value_or("");
    result.to = start.get_attr("to").value_or("");
    result.from = start.get_attr("from").value_or("");
    result.lang = start.get_attr("lang").value_or("");

    if (capture_raw)
        result.raw = reader.inner_xml();

    read_children(reader, [&](const xml::start_element& child) {
        if (child.name.local == "error" && child.name.space == start.name.space) {
            result.error = stanza_error();
            result.error.decode(reader, child);
            return;
        }

        std::unique_ptr<payload> p = table.resolve(child.name);
        iqcodec::log().debug("iq", "{}: {{{}}}{} -> {}", result.id,
                             child.name.space, child.name.local,
                             dynamic_cast<node*>(p.get()) ? "node" : "typed payload");
        p->decode(reader, child);
        result.payloads.push_back(std::move(p));
    });

    return result;
}

xmpp::iq xmpp::iq::parse(std::string_view text, const registry& table) {
    bool capture_raw = iqcodec::config::instance && iqcodec::config::instance->capture_raw();
    return parse(text, table, capture_raw);
}

xmpp::iq xmpp::iq::parse(std::string_view text, const registry& table, bool capture_raw) {
    xml::reader reader(text);
    auto start = reader.next_element();
    if (!start)
        throw xml::error("no element in input");
    if (start->name.local != "iq")
        throw std::invalid_argument(
            fmt::format("Expected iq, got {}", start->name.local));
    return decode(reader, *start, table, capture_raw);
}

void xmpp::iq::encode(xml::writer& writer) const {
    writer.start_element(tag);
    if (!id.empty())
        writer.attribute("id", id);
    if (!type.empty())
        writer.attribute("type", type);
    if (!to.empty())
        writer.attribute("to", to);
    if (!from.empty())
        writer.attribute("from", from);
    if (!lang.empty())
        writer.attribute("xml:lang", lang);

    for (auto& p : payloads)
        p->encode(writer);

    error.encode(writer);

    writer.end_element();
}

std::string xmpp::iq::str() const {
    xml::writer writer;
    encode(writer);
    return writer.str();
}
