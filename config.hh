// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <strophe.h>

#include "config/option.hh"

namespace iqcodec
{
    class config {
    public:
        typedef std::function<std::optional<std::string>(std::string_view name)> lookup_fn;

        struct {
            config_option level;
        } logging;

        struct {
            config_option capture_raw;
        } decode;

    public:
        config();

        static std::optional<config> instance;

        xmpp_log_level_t log_level() const;
        bool capture_raw() const;

        // Unset variables leave an option at its default. Returns false if
        // any value was refused.
        bool read(const lookup_fn& lookup = environment);
        // Pushes the log level into the shared logger.
        void apply() const;

        static std::optional<std::string> environment(std::string_view name);

    public:
        static bool init();
    };
}
