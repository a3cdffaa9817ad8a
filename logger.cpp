// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <cstdio>
#include <stdexcept>

#include "logger.hh"

iqcodec::logger::logger(xmpp_log_level_t level, sink_callback sink)
    : level(level), sink(std::move(sink)) {
    this->handler = [] (void *const userdata, const xmpp_log_level_t level,
                        const char *const area, const char *const msg) {
        auto& self = *static_cast<logger*>(userdata);
        if (self.enabled(level))
            self.emit(level, area ? area : "", msg ? msg : "");
    };
    this->userdata = this;
}

void iqcodec::logger::emit(xmpp_log_level_t at, std::string_view area, std::string_view msg) const {
    if (sink) {
        sink(at, area, msg);
        return;
    }
    fmt::print(stderr, "{} {}: {}\n", area, format_level(at), msg);
}

xmpp_log_level_t iqcodec::logger::parse_level(std::string_view s) {
    if (s == "debug")
        return XMPP_LEVEL_DEBUG;
    else if (s == "info")
        return XMPP_LEVEL_INFO;
    else if (s == "warn")
        return XMPP_LEVEL_WARN;
    else if (s == "error")
        return XMPP_LEVEL_ERROR;
    throw std::invalid_argument(
        fmt::format("Bad log level: {}", s));
}

std::string_view iqcodec::logger::format_level(xmpp_log_level_t e) {
    switch (e) {
    case XMPP_LEVEL_DEBUG:
        return "debug";
    case XMPP_LEVEL_INFO:
        return "info";
    case XMPP_LEVEL_WARN:
        return "warn";
    case XMPP_LEVEL_ERROR:
        return "error";
    default:
        return "";
    }
}

iqcodec::logger& iqcodec::logger::instance() {
    static logger global;
    return global;
}
