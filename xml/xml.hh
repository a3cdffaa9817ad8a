// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

namespace xml {

    // bound by definition to the xml: and xmlns: prefixes
    constexpr auto xml_uri = "http://www.w3.org/XML/1998/namespace";
    constexpr auto xmlns_uri = "http://www.w3.org/2000/xmlns/";

    class error : virtual public std::runtime_error {
    public:
        explicit inline error(const std::string_view subject)
            : std::runtime_error(std::string(subject)) {
        }
        virtual ~error() throw () {}
    };

    struct qname {
        std::string space;
        std::string local;

        inline bool operator ==(const qname& other) const {
            return space == other.space && local == other.local;
        }

        inline bool operator <(const qname& other) const {
            return std::tie(space, local) < std::tie(other.space, other.local);
        }
    };

    struct attribute {
        qname name;
        // as written, prefix included ("xml:lang", "xmlns:p")
        std::string key;
        std::string value;

        inline bool is_declaration() const { return name.space == xmlns_uri; }
    };

    struct start_element {
        qname name;
        std::vector<attribute> attributes;

        inline std::optional<std::string>
        get_attr(std::string_view local) const {
            for (auto& attr : attributes)
                if (!attr.is_declaration() && attr.name.local == local)
                    return attr.value;
            return {};
        }
    };

    struct end_element {
        qname name;
    };

    struct char_data {
        std::string text;
    };

    typedef std::variant<start_element, end_element, char_data> token;

    template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };

}
