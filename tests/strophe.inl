#include <doctest/doctest.h>

#include <stdexcept>

#include "../strophe.hh"
#include "../logger.hh"

TEST_CASE("libstrophe bridge")
{
    libstrophe::initialize();
    {
        iqcodec::logger log(XMPP_LEVEL_ERROR);
        libstrophe::context ctx(&log);
        REQUIRE(static_cast<bool>(ctx));

        xmpp::iq request(xmpp::iq_type::get, "romeo@montague.net/orchard", "plays.shakespeare.lit", "info1");
        auto info = std::make_shared<xmpp::disco_info>();
        info->features.push_back({ "urn:xmpp:ping" });
        request.add_payload(info);

        auto stanza = xmpp::to_stanza(ctx, request);
        REQUIRE(static_cast<bool>(stanza));
        CHECK(stanza.name() == "iq");
        CHECK(stanza.to_text(ctx).find("urn:xmpp:ping") != std::string::npos);

        SUBCASE("stanza back to iq")
        {
            auto back = xmpp::from_stanza(ctx, stanza, xmpp::registry::standard(), true);
            CHECK(back.id == "info1");
            CHECK(back.type == "get");
            CHECK(back.to == "plays.shakespeare.lit");
            CHECK(back.from == "romeo@montague.net/orchard");
            CHECK_FALSE(back.raw.empty());
            auto features = back.get_payload<xmpp::disco_info>();
            REQUIRE(features);
            REQUIRE(features->features.size() == 1);
            CHECK(features->features[0].var == "urn:xmpp:ping");
        }

        SUBCASE("error reply through libstrophe")
        {
            xmpp::stanza_error err;
            err.code = 503;
            err.type = "cancel";
            err.reason = "service-unavailable";
            auto reply = xmpp::to_stanza(ctx, request.make_error(err));
            auto back = xmpp::from_stanza(ctx, reply, xmpp::registry::standard(), false);
            CHECK(back.type == "error");
            CHECK(back.to == "romeo@montague.net/orchard");
            CHECK(back.error == err);
        }

        SUBCASE("bad input")
        {
            CHECK_THROWS_AS(libstrophe::stanza::from_string(ctx, "<iq"), std::runtime_error);
            CHECK_THROWS_AS(xmpp::from_stanza(ctx, nullptr, xmpp::registry::standard(), false),
                            std::invalid_argument);
        }
    }
    libstrophe::shutdown();
}
