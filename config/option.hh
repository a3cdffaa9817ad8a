// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

#include <cctype>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace iqcodec
{
    struct config_option {
        config_option(std::string name, std::string description, std::string default_value,
                      std::function<bool(std::string_view)> check_value = {})
            : name(std::move(name))
            , description(std::move(description))
            , default_value(std::move(default_value))
            , check_value(std::move(check_value))
            , m_value(this->default_value) {
        }

        std::string name;
        std::string description;
        std::string default_value;
        std::function<bool(std::string_view)> check_value;

        // false, and the old value kept, when check_value refuses it
        bool set(std::string_view value) {
            if (check_value && !check_value(value))
                return false;
            m_value = value;
            return true;
        }
        void clear() { m_value = default_value; }

        std::string_view string() const { return m_value; }
        bool boolean() const { return is_true(m_value); }

        // log_level -> IQCODEC_LOG_LEVEL
        std::string env_name() const {
            std::string env = "IQCODEC_";
            for (char c : name)
                env += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            return env;
        }

        static bool is_true(std::string_view s) {
            return s == "on" || s == "true" || s == "yes" || s == "1";
        }
        static bool is_boolean(std::string_view s) {
            return is_true(s) || s == "off" || s == "false" || s == "no" || s == "0";
        }

    private:
        std::string m_value;
    };
}
