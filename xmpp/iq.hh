// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "payload.hh"
#include "node.hh"
#include "error.hh"
#include "registry.hh"
#include "ns.hh"
#include "rfc-6120.inl"
#include "xep-0030.inl"
#include "xep-0325.inl"

namespace xmpp {

    namespace iq_type {
        constexpr auto get = "get";
        constexpr auto set = "set";
        constexpr auto result = "result";
        constexpr auto error = "error";
    }

    class iq {
    public:
        iq() = default;
        iq(std::string type, std::string from, std::string to,
           std::string id, std::string lang = {});

        xml::qname tag = xmlns::name<jabber::client>("iq");

        std::string id;
        std::string from;
        std::string to;
        std::string type;
        std::string lang;

        // first-level children in document order, <error/> excluded
        std::vector<payload_ptr> payloads;
        // inner markup as received, only filled when asked for
        std::string raw;
        stanza_error error;

        void add_payload(payload_ptr p);

        template<typename T>
        inline std::shared_ptr<T> get_payload() const {
            for (auto& p : payloads)
                if (auto typed = std::dynamic_pointer_cast<T>(p))
                    return typed;
            return {};
        }

        // Reply addressed back to the sender, carrying err. The payloads go
        // along unchanged.
        iq make_error(stanza_error err) const;

        // start is the <iq> start tag, already consumed from reader.
        static iq decode(xml::reader& reader, const xml::start_element& start,
                         const registry& table = registry::global(),
                         bool capture_raw = false);

        // capture_raw follows the configuration.
        static iq parse(std::string_view text, const registry& table = registry::global());
        static iq parse(std::string_view text, const registry& table, bool capture_raw);

        void encode(xml::writer& writer) const;
        std::string str() const;
    };

}
