// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

#include <string>

#include "payload.hh"
#include "ns.hh"

namespace xmpp {

    /* Core: Resource Binding */
    struct rfc6120 {
        class bind : public payload {
        public:
            std::string resource;
            std::string jid;

            xml::qname name() const override {
                return xmlns::name<urn::ietf::params::xml::ns::xmpp_bind>("bind");
            }

            void decode(xml::reader& reader, const xml::start_element&) override {
                resource.clear();
                jid.clear();
                read_children(reader, [&](const xml::start_element& child) {
                    if (child.name == xmlns::name<urn::ietf::params::xml::ns::xmpp_bind>("resource"))
                        resource = read_text(reader);
                    else if (child.name == xmlns::name<urn::ietf::params::xml::ns::xmpp_bind>("jid"))
                        jid = read_text(reader);
                    else
                        reader.skip();
                });
            }

            void encode(xml::writer& writer) const override {
                writer.start_element(name());
                if (!resource.empty()) {
                    writer.start_element("resource");
                    writer.text(resource);
                    writer.end_element();
                }
                if (!jid.empty()) {
                    writer.start_element("jid");
                    writer.text(jid);
                    writer.end_element();
                }
                writer.end_element();
            }
        };
    };

    typedef rfc6120::bind bind_bind;

}
