// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <cstdlib>
#include <functional>
#include <stdexcept>

#include "config.hh"
#include "logger.hh"

std::optional<iqcodec::config> iqcodec::config::instance;

iqcodec::config::config()
    : logging {
        config_option("log_level",
                      "minimum severity reported: debug, info, warn or error",
                      "warn",
                      [](std::string_view value) {
                          try {
                              logger::parse_level(value);
                              return true;
                          }
                          catch (const std::invalid_argument&) {
                              return false;
                          }
                      }),
    }
    , decode {
        config_option("capture_raw",
                      "keep the raw inner markup of every decoded iq",
                      "off",
                      &config_option::is_boolean),
    } {
}

xmpp_log_level_t iqcodec::config::log_level() const {
    return logger::parse_level(logging.level.string());
}

bool iqcodec::config::capture_raw() const {
    return decode.capture_raw.boolean();
}

bool iqcodec::config::read(const lookup_fn& lookup) {
    bool rc = true;

    auto options = {
        std::ref(logging.level),
        std::ref(decode.capture_raw),
    };

    for (auto option : options) {
        auto& opt = option.get();
        auto value = lookup(opt.env_name());
        if (!value) {
            opt.clear();
            continue;
        }
        if (!opt.set(*value)) {
            opt.clear();
            iqcodec::log().warn("config", "invalid value '{}' for {}, using '{}'",
                                *value, opt.env_name(), opt.string());
            rc = false;
        }
    }

    apply();
    return rc;
}

void iqcodec::config::apply() const {
    logger::instance().level = log_level();
}

std::optional<std::string> iqcodec::config::environment(std::string_view name) {
    const char *value = std::getenv(std::string(name).c_str());
    if (value)
        return value;
    else
        return {};
}

bool iqcodec::config::init() {
    instance.emplace();
    return instance->read();
}
