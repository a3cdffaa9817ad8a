// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "payload.hh"
#include "ns.hh"

namespace xmpp {

    /* Internet of Things - Control */
    struct xep0325 {
        struct field {
            // element name: boolean, color, date, dateTime, double, duration, int, long, string, time
            std::string type;
            std::string name;
            std::string value;
        };

        class set : public payload {
        public:
            std::vector<field> fields;

            xml::qname name() const override {
                return xmlns::name<urn::xmpp::iot::control>("set");
            }

            std::optional<std::string> get(std::string_view field_name, std::string_view type = {}) const {
                for (auto& f : fields)
                    if (f.name == field_name && (type.empty() || f.type == type))
                        return f.value;
                return {};
            }

            void decode(xml::reader& reader, const xml::start_element&) override {
                fields.clear();
                read_children(reader, [&](const xml::start_element& child) {
                    fields.push_back({
                        child.name.local,
                        child.get_attr("name").value_or(""),
                        child.get_attr("value").value_or(""),
                    });
                    reader.skip();
                });
            }

            void encode(xml::writer& writer) const override {
                writer.start_element(name());
                for (auto& f : fields) {
                    writer.start_element(f.type);
                    if (!f.name.empty())
                        writer.attribute("name", f.name);
                    if (!f.value.empty())
                        writer.attribute("value", f.value);
                    writer.end_element();
                }
                writer.end_element();
            }
        };

        class set_response : public payload {
        public:
            xml::qname name() const override {
                return xmlns::name<urn::xmpp::iot::control>("setResponse");
            }

            void decode(xml::reader& reader, const xml::start_element&) override {
                read_children(reader, [&](const xml::start_element&) {
                    reader.skip();
                });
            }

            void encode(xml::writer& writer) const override {
                writer.start_element(name());
                writer.end_element();
            }
        };
    };

    typedef xep0325::set control_set;
    typedef xep0325::set_response control_set_response;

}
