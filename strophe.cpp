// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <cstddef>

#include "strophe.hh"
#include "config.hh"
#include "logger.hh"

libstrophe::context::context(const xmpp_log_t *log)
    : context_type(xmpp_ctx_new(nullptr, log)) {
    if (!*this)
        throw std::runtime_error("Strophe Error: xmpp_ctx_new failed");
}

libstrophe::stanza libstrophe::stanza::from_string(xmpp_ctx_t *context, std::string_view text) {
    std::string buffer(text);
    stanza result(xmpp_stanza_new_from_string(context, buffer.c_str()));
    if (!result)
        throw std::runtime_error("Strophe Error: could not parse stanza");
    return result;
}

std::string libstrophe::stanza::name() const {
    const char *result = xmpp_stanza_get_name(**this);
    if (result)
        return result;
    else
        return {};
}

std::string libstrophe::stanza::to_text(xmpp_ctx_t *context) {
    char *buf = nullptr;
    size_t buflen = 0;
    call_checked<decltype(xmpp_stanza_to_text), xmpp_stanza_to_text>(&buf, &buflen);
    std::shared_ptr<char> text {
        buf,
        [=](auto x) { xmpp_free(context, x); }
    };
    return std::string(text.get(), buflen);
}

libstrophe::stanza xmpp::to_stanza(xmpp_ctx_t *context, const iq& value) {
    auto text = value.str();
    iqcodec::log().debug("iq", "to libstrophe: {}", text);
    return libstrophe::stanza::from_string(context, text);
}

xmpp::iq xmpp::from_stanza(xmpp_ctx_t *context, xmpp_stanza_t *stanza,
                           const registry& table) {
    bool capture_raw = iqcodec::config::instance && iqcodec::config::instance->capture_raw();
    return from_stanza(context, stanza, table, capture_raw);
}

xmpp::iq xmpp::from_stanza(xmpp_ctx_t *context, xmpp_stanza_t *stanza,
                           const registry& table, bool capture_raw) {
    if (!stanza)
        throw std::invalid_argument("null stanza");

    // borrowed: take a reference of our own for the wrapper to drop
    libstrophe::stanza borrowed(xmpp_stanza_clone(stanza));
    auto text = borrowed.to_text(context);
    iqcodec::log().debug("iq", "from libstrophe: {}", text);
    return iq::parse(text, table, capture_raw);
}
