// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <stdexcept>
#include <string>
#include <fmt/core.h>

#include "registry.hh"
#include "node.hh"
#include "rfc-6120.inl"
#include "xep-0030.inl"
#include "xep-0325.inl"
#include "../logger.hh"

void xmpp::registry::add(std::string_view space, std::string_view local, factory make) {
    if (!make)
        throw std::invalid_argument(
            fmt::format("Empty factory for {{{}}}{}", space, local));

    xml::qname key { std::string(space), std::string(local) };
    bool inserted = m_factories.insert_or_assign(std::move(key), std::move(make)).second;
    if (inserted)
        iqcodec::log().debug("registry", "registered {{{}}}{}", space, local);
    else
        iqcodec::log().info("registry", "replaced {{{}}}{}", space, local);
}

std::unique_ptr<xmpp::payload> xmpp::registry::resolve(std::string_view space, std::string_view local) const {
    auto it = m_factories.find(xml::qname { std::string(space), std::string(local) });
    if (it == m_factories.end())
        return std::make_unique<node>();

    std::unique_ptr<payload> instance;
    try {
        instance = it->second();
    }
    catch (const std::exception& ex) {
        iqcodec::log().warn("registry", "factory for {{{}}}{} failed: {}", space, local, ex.what());
    }
    if (!instance) {
        iqcodec::log().warn("registry", "no payload for {{{}}}{}, using node", space, local);
        return std::make_unique<node>();
    }
    return instance;
}

bool xmpp::registry::contains(std::string_view space, std::string_view local) const {
    return m_factories.contains(xml::qname { std::string(space), std::string(local) });
}

xmpp::registry xmpp::registry::standard() {
    registry table;
    table.add<xep0030::info>();
    table.add<xep0030::items>();
    table.add<rfc6120::bind>();
    table.add<xep0325::set>();
    return table;
}

xmpp::registry& xmpp::registry::global() {
    static registry instance = standard();
    return instance;
}
