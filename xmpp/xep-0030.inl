// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

#include <string>
#include <vector>

#include "payload.hh"
#include "ns.hh"

namespace xmpp {

    /* Service Discovery */
    struct xep0030 {
        struct identity {
            std::string category;
            std::string type;
            std::string name;
            std::string lang;
        };

        struct feature {
            std::string var;
        };

        struct item {
            std::string jid;
            std::string name;
            std::string node;
        };

        class info : public payload {
        public:
            std::string node;
            std::vector<identity> identities;
            std::vector<feature> features;

            xml::qname name() const override {
                return xmlns::name<jabber_org::protocol::disco::info>("query");
            }

            void decode(xml::reader& reader, const xml::start_element& start) override {
                node = start.get_attr("node").value_or("");
                identities.clear();
                features.clear();
                read_children(reader, [&](const xml::start_element& child) {
                    if (child.name == xmlns::name<jabber_org::protocol::disco::info>("identity"))
                        identities.push_back({
                            child.get_attr("category").value_or(""),
                            child.get_attr("type").value_or(""),
                            child.get_attr("name").value_or(""),
                            child.get_attr("lang").value_or(""),
                        });
                    else if (child.name == xmlns::name<jabber_org::protocol::disco::info>("feature"))
                        features.push_back({ child.get_attr("var").value_or("") });
                    reader.skip();
                });
            }

            void encode(xml::writer& writer) const override {
                writer.start_element(name());
                if (!node.empty())
                    writer.attribute("node", node);
                for (auto& id : identities) {
                    writer.start_element("identity");
                    writer.attribute("category", id.category);
                    writer.attribute("type", id.type);
                    if (!id.name.empty())
                        writer.attribute("name", id.name);
                    if (!id.lang.empty())
                        writer.attribute("xml:lang", id.lang);
                    writer.end_element();
                }
                for (auto& f : features) {
                    writer.start_element("feature");
                    writer.attribute("var", f.var);
                    writer.end_element();
                }
                writer.end_element();
            }
        };

        class items : public payload {
        public:
            std::string node;
            std::vector<item> list;

            xml::qname name() const override {
                return xmlns::name<jabber_org::protocol::disco::items>("query");
            }

            void decode(xml::reader& reader, const xml::start_element& start) override {
                node = start.get_attr("node").value_or("");
                list.clear();
                read_children(reader, [&](const xml::start_element& child) {
                    if (child.name == xmlns::name<jabber_org::protocol::disco::items>("item"))
                        list.push_back({
                            child.get_attr("jid").value_or(""),
                            child.get_attr("name").value_or(""),
                            child.get_attr("node").value_or(""),
                        });
                    reader.skip();
                });
            }

            void encode(xml::writer& writer) const override {
                writer.start_element(name());
                if (!node.empty())
                    writer.attribute("node", node);
                for (auto& i : list) {
                    writer.start_element("item");
                    if (!i.jid.empty())
                        writer.attribute("jid", i.jid);
                    if (!i.name.empty())
                        writer.attribute("name", i.name);
                    if (!i.node.empty())
                        writer.attribute("node", i.node);
                    writer.end_element();
                }
                writer.end_element();
            }
        };
    };

    typedef xep0030::info disco_info;
    typedef xep0030::items disco_items;

}
