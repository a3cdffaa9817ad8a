// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/core.h>
#include <strophe.h>

namespace iqcodec {

    // Usable wherever libstrophe expects an xmpp_log_t, so the codec and
    // the library report through the same sink.
    class logger : public xmpp_log_t {
    public:
        typedef std::function<void(xmpp_log_level_t level, std::string_view area,
                                   std::string_view msg)> sink_callback;

        explicit logger(xmpp_log_level_t level = XMPP_LEVEL_WARN, sink_callback sink = {});

        logger(const logger &other) = delete;
        logger& operator =(const logger &other) = delete;

        xmpp_log_level_t level;
        sink_callback sink;

        inline bool enabled(xmpp_log_level_t at) const { return at >= level; }

        void emit(xmpp_log_level_t at, std::string_view area, std::string_view msg) const;

        template<typename... Args>
        inline void debug(std::string_view area, fmt::format_string<Args...> format, Args&&... args) {
            if (enabled(XMPP_LEVEL_DEBUG))
                emit(XMPP_LEVEL_DEBUG, area, fmt::format(format, std::forward<Args>(args)...));
        }

        template<typename... Args>
        inline void info(std::string_view area, fmt::format_string<Args...> format, Args&&... args) {
            if (enabled(XMPP_LEVEL_INFO))
                emit(XMPP_LEVEL_INFO, area, fmt::format(format, std::forward<Args>(args)...));
        }

        template<typename... Args>
        inline void warn(std::string_view area, fmt::format_string<Args...> format, Args&&... args) {
            if (enabled(XMPP_LEVEL_WARN))
                emit(XMPP_LEVEL_WARN, area, fmt::format(format, std::forward<Args>(args)...));
        }

        template<typename... Args>
        inline void error(std::string_view area, fmt::format_string<Args...> format, Args&&... args) {
            if (enabled(XMPP_LEVEL_ERROR))
                emit(XMPP_LEVEL_ERROR, area, fmt::format(format, std::forward<Args>(args)...));
        }

        static xmpp_log_level_t parse_level(std::string_view s);
        static std::string_view format_level(xmpp_log_level_t e);

        static logger& instance();
    };

    inline logger& log() { return logger::instance(); }

}
