// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

#include <memory>
#include <string>
#include <variant>

#include "../xml/xml.hh"
#include "../xml/reader.hh"
#include "../xml/writer.hh"

namespace xmpp {

    // Anything that may be carried as a first-level child of an <iq>.
    class payload {
    public:
        virtual ~payload() = default;

        virtual xml::qname name() const = 0;

        // Called with the element's start tag already consumed; must consume
        // up to and including the matching end tag.
        virtual void decode(xml::reader& reader, const xml::start_element& start) = 0;

        virtual void encode(xml::writer& writer) const = 0;
    };

    typedef std::shared_ptr<payload> payload_ptr;

    // Hands each child element of the current element to visit, which must
    // consume it (decode it or reader.skip()), then consumes the end tag.
    // Returns the character data found directly inside the element.
    template<typename Visit>
    inline std::string read_children(xml::reader& reader, Visit&& visit) {
        std::string text;
        for (;;) {
            auto tok = reader.expect();
            if (auto *child = std::get_if<xml::start_element>(&tok))
                visit(*child);
            else if (auto *data = std::get_if<xml::char_data>(&tok))
                text += data->text;
            else
                return text;
        }
    }

    inline std::string read_text(xml::reader& reader) {
        return read_children(reader, [&](const xml::start_element&) {
            reader.skip();
        });
    }

}
