// This Source Code Form is subject to the terms of the Mozilla Public
// License, version 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

#include <fmt/core.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <strophe.h>

#include "xmpp/iq.hh"

namespace libstrophe {

    template<typename T, typename DFun, DFun &f_destroy>
    class type {
    private:
        T *_ptr;

    protected:
        typedef T* pointer_type;

        template<typename Fun, Fun &func, int success = 0, typename... Args>
        inline void call_checked(Args&&... args) {
            int ret = func(_ptr, std::forward<Args>(args)...);
            if (ret != success) throw std::runtime_error(
                fmt::format("Strophe Error: expected {}, was {}", success, ret));
        }

    public:
        inline explicit type(T *ptr = nullptr) : _ptr(ptr) {
        }

        inline ~type() {
            reset();
        }

        type(const type &other) = delete; /* no copy construction */
        inline type(type &&other) noexcept : _ptr(std::exchange(other._ptr, nullptr)) {
        }

        type& operator =(const type &other) = delete; /* no copy assignment */
        inline type& operator =(type &&other) noexcept {
            if (this != &other)
                reset(std::exchange(other._ptr, nullptr));
            return *this;
        }

        inline void reset(T *ptr = nullptr) {
            if (_ptr)
                f_destroy(_ptr);
            _ptr = ptr;
        }

        inline T* release() { return std::exchange(_ptr, nullptr); }

        inline explicit operator bool() const { return _ptr; }

        inline T* operator *() const { return _ptr; }

        inline operator T*() const { return _ptr; }
    };

    inline auto initialize = xmpp_initialize;
    inline auto shutdown = xmpp_shutdown;

    typedef type<xmpp_ctx_t, decltype(xmpp_ctx_free), xmpp_ctx_free> context_type;
    class context : public context_type {
    public:
        // log must outlive the context
        explicit context(const xmpp_log_t *log = nullptr);
    };

    typedef type<xmpp_stanza_t, decltype(xmpp_stanza_release), xmpp_stanza_release> stanza_type;
    class stanza : public stanza_type {
    public:
        using stanza_type::stanza_type;

        static stanza from_string(xmpp_ctx_t *context, std::string_view text);

        std::string name() const;
        std::string to_text(xmpp_ctx_t *context);
    };
}

namespace xmpp {

    // Outbound: a stanza ready for xmpp_send().
    libstrophe::stanza to_stanza(xmpp_ctx_t *context, const iq& value);

    // Inbound, from an "iq" handler. capture_raw follows the configuration.
    iq from_stanza(xmpp_ctx_t *context, xmpp_stanza_t *stanza,
                   const registry& table = registry::global());
    iq from_stanza(xmpp_ctx_t *context, xmpp_stanza_t *stanza,
                   const registry& table, bool capture_raw);

}
