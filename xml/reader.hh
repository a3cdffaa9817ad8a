// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "xml.hh"

#include <libxml/xmlreader.h>

namespace xml {

    // One-time libxml2 setup; readers and writers call it themselves.
    void initialize();

    // Pull tokenizer over libxml2's streaming reader. Empty elements yield a
    // start_element immediately followed by its end_element.
    class reader {
    public:
        explicit reader(std::string_view text);
        explicit reader(std::istream& input);
        ~reader();

        reader(const reader &other) = delete;
        reader& operator =(const reader &other) = delete;

        // std::nullopt at a clean end of input; throws xml::error on malformed input.
        std::optional<token> next();

        // As next(), but running out of input is an error.
        token expect();

        // Next start_element, skipping character data. Throws on an end_element.
        std::optional<start_element> next_element();

        // Consumes everything up to and including the end of the element
        // whose start_element was just returned.
        void skip();

        // Raw markup between the tags of the element whose start_element was
        // just returned. Does not advance.
        std::string inner_xml();

    private:
        void check_open();
        qname current_name();

        std::string m_text;
        std::unique_ptr<xmlTextReader, decltype(&xmlFreeTextReader)> m_ptr;
        std::optional<end_element> m_pending_end;
        std::string m_error;
    };

}
