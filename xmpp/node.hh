// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "payload.hh"

namespace xmpp {

    // Schema-less element tree, the payload for anything nobody registered.
    //
    // Character data is kept in `text` but encode() only replays attributes
    // and children, so an element holding nothing but text comes back empty.
    class node : public payload {
    public:
        node() = default;
        explicit node(xml::qname tag, std::vector<xml::attribute> attributes = {});

        xml::qname tag;
        // never holds the default xmlns declaration, tag.space carries it
        std::vector<xml::attribute> attributes;
        std::string text;
        std::vector<node> children;

        xml::qname name() const override { return tag; }

        inline std::optional<std::string>
        get_attr(std::string_view key) const {
            for (auto& attr : attributes)
                if (attr.key == key)
                    return attr.value;
            return {};
        }

        inline std::vector<std::reference_wrapper<const node>>
        get_children(std::string_view local) const {
            std::vector<std::reference_wrapper<const node>> list;
            for (auto& child : children)
                if (child.tag.local == local)
                    list.push_back(std::cref(child));
            return list;
        }

        void decode(xml::reader& reader, const xml::start_element& start) override;
        void encode(xml::writer& writer) const override;
    };

}
