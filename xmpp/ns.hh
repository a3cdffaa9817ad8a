// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

#include <string>
#include <string_view>

#include "../xml/xml.hh"

class xmlns {
private:
    const char *const _uri;
protected:
    inline xmlns(const char *uri) : _uri(uri) {}
public:
    inline const char *ns() const { return _uri; }
    inline operator const char *() const { return _uri; }

    template<typename X>
    static xml::qname name(std::string_view local) {
        return { X().ns(), std::string(local) };
    }
};

struct jabber_org {
    struct protocol {
        struct disco {
            struct info : public xmlns { info() : xmlns("http://jabber.org/protocol/disco#info") {} };
            struct items : public xmlns { items() : xmlns("http://jabber.org/protocol/disco#items") {} };
        };
    };
};
struct jabber {
    struct client : public xmlns { client() : xmlns("jabber:client") {} };
};
struct urn {
    struct ietf {
        struct params {
            struct xml {
                struct ns {
                    struct xmpp_bind : public xmlns { xmpp_bind() : xmlns("urn:ietf:params:xml:ns:xmpp-bind") {} };
                    struct xmpp_stanzas : public xmlns { xmpp_stanzas() : xmlns("urn:ietf:params:xml:ns:xmpp-stanzas") {} };
                };
            };
        };
    };
    struct xmpp {
        struct iot {
            struct control : public xmlns { control() : xmlns("urn:xmpp:iot:control") {} };
        };
    };
};
