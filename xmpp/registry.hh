// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string_view>
#include <type_traits>

#include "payload.hh"

namespace xmpp {

    // Maps a qualified element name to the payload type that decodes it.
    //
    // Fill it before decoding starts: lookups are const and may run from any
    // number of threads, add() must not race with them.
    class registry {
    public:
        typedef std::function<std::unique_ptr<payload>()> factory;

        registry() = default;

        // A later registration for the same name replaces the earlier one.
        void add(std::string_view space, std::string_view local, factory make);

        template<typename T>
        inline void add() {
            static_assert(std::is_base_of_v<payload, T>, "registered types must derive from xmpp::payload");
            const xml::qname key = T().name();
            add(key.space, key.local, [] { return std::make_unique<T>(); });
        }

        // Never null: unknown names, and factories that throw or come back
        // empty, yield a fresh xmpp::node.
        std::unique_ptr<payload> resolve(std::string_view space, std::string_view local) const;
        inline std::unique_ptr<payload> resolve(const xml::qname& name) const {
            return resolve(name.space, name.local);
        }

        bool contains(std::string_view space, std::string_view local) const;
        inline std::size_t size() const { return m_factories.size(); }

        // disco#info, disco#items, resource binding and iot control set.
        static registry standard();

        // Process-wide table, starts out as standard().
        static registry& global();

    private:
        std::map<xml::qname, factory> m_factories;
    };

}
