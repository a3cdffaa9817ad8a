// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "xml.hh"

#include <libxml/xmlwriter.h>

namespace xml {

    class writer {
    public:
        // Buffers output in memory, see str().
        writer();
        explicit writer(std::ostream& output);
        ~writer();

        writer(const writer &other) = delete;
        writer& operator =(const writer &other) = delete;

        // Declares the default namespace only where it differs from the
        // enclosing element's.
        void start_element(const qname& name);
        // Stays in the enclosing default namespace.
        void start_element(std::string_view local);
        void attribute(std::string_view key, std::string_view value);
        // Written by namespace rather than by key: a prefix in scope is
        // reused, otherwise one is declared on the current element.
        void attribute(const xml::attribute& attr);
        void text(std::string_view s);
        void end_element();

        void flush();
        std::string str();

    private:
        struct element_scope {
            std::string space;
            // prefix -> uri, declared on this element
            std::map<std::string, std::string> prefixes;
        };

        void check(int ret, const char *what);
        std::string_view scope() const;
        void push_scope(std::string space);
        void declare(const std::string& prefix, const std::string& uri);
        std::optional<std::string> bound(const std::string& prefix) const;
        std::optional<std::string> prefix_for(const std::string& uri) const;

        std::unique_ptr<xmlBuffer, decltype(&xmlBufferFree)> m_buffer;
        std::unique_ptr<xmlTextWriter, decltype(&xmlFreeTextWriter)> m_ptr;
        std::vector<element_scope> m_scope;
    };

}
