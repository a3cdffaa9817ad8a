// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

#include <string>

#include "payload.hh"

namespace xmpp {

    // The <error/> child of an error-typed stanza. code == 0 means there is
    // no error and nothing gets written.
    struct stanza_error {
        int code = 0;
        // cancel, continue, modify, auth or wait, not enforced
        std::string type;
        // local name of the condition element, e.g. "item-not-found"
        std::string reason;
        std::string text;

        inline bool empty() const { return code == 0; }

        bool operator ==(const stanza_error& other) const = default;

        void decode(xml::reader& reader, const xml::start_element& start);
        void encode(xml::writer& writer) const;
    };

}
