#include <doctest/doctest.h>

#include <stdexcept>

#include "../xmpp/iq.hh"

TEST_CASE("iq decode with disco items")
{
    auto iq = xmpp::iq::parse(
        "<iq type='set' id='1'>"
        "<query xmlns='http://jabber.org/protocol/disco#items'/>"
        "</iq>", xmpp::registry::standard());

    CHECK(iq.type == xmpp::iq_type::set);
    CHECK(iq.id == "1");
    CHECK(iq.tag.local == "iq");
    CHECK(iq.error.empty());
    REQUIRE(iq.payloads.size() == 1);
    auto items = iq.get_payload<xmpp::disco_items>();
    REQUIRE(items);
    CHECK(items->list.empty());
    CHECK(iq.raw.empty());
}

TEST_CASE("iq construction")
{
    xmpp::iq iq(xmpp::iq_type::get, "romeo@example.net/orchard", "example.net", "disco1");
    CHECK(iq.tag.space == "jabber:client");
    CHECK(iq.tag.local == "iq");
    CHECK(iq.from == "romeo@example.net/orchard");
    CHECK(iq.to == "example.net");
    CHECK(iq.id == "disco1");
    CHECK(iq.payloads.empty());

    SUBCASE("payloads keep insertion order and duplicates")
    {
        auto info = std::make_shared<xmpp::disco_info>();
        iq.add_payload(info);
        iq.add_payload(std::make_shared<xmpp::disco_items>());
        iq.add_payload(info);
        REQUIRE(iq.payloads.size() == 3);
        CHECK(iq.payloads[0] == info);
        CHECK(iq.payloads[2] == info);
        CHECK(std::dynamic_pointer_cast<xmpp::disco_items>(iq.payloads[1]));
    }

    SUBCASE("null payload is refused")
    {
        CHECK_THROWS_AS(iq.add_payload(nullptr), std::invalid_argument);
        CHECK(iq.payloads.empty());
    }
}

TEST_CASE("iq make_error")
{
    xmpp::iq request(xmpp::iq_type::set, "juliet@example.com/balcony", "example.com", "bind_1");
    request.add_payload(std::make_shared<xmpp::bind_bind>());

    xmpp::stanza_error err;
    err.code = 409;
    err.type = "cancel";
    err.reason = "conflict";

    auto reply = request.make_error(err);
    CHECK(reply.type == xmpp::iq_type::error);
    CHECK(reply.from == request.to);
    CHECK(reply.to == request.from);
    CHECK(reply.id == request.id);
    CHECK(reply.error == err);
    CHECK(reply.payloads == request.payloads);

    CHECK(request.type == xmpp::iq_type::set);
    CHECK(request.error.empty());

    SUBCASE("error element follows the payloads")
    {
        auto out = reply.str();
        auto bind_at = out.find("<bind");
        auto error_at = out.find("<error code=\"409\" type=\"cancel\">");
        REQUIRE(bind_at != std::string::npos);
        REQUIRE(error_at != std::string::npos);
        CHECK(bind_at < error_at);
        CHECK(out.find("<conflict xmlns=\"urn:ietf:params:xml:ns:xmpp-stanzas\"/>") != std::string::npos);

        auto again = xmpp::iq::parse(out, xmpp::registry::standard());
        CHECK(again.error == err);
        CHECK(again.type == "error");
        REQUIRE(again.payloads.size() == 1);
        CHECK(again.get_payload<xmpp::bind_bind>());
    }
}

TEST_CASE("iq encode")
{
    xmpp::iq iq(xmpp::iq_type::result, "example.com", "juliet@example.com/balcony", "r1", "en");

    SUBCASE("attribute order and no error")
    {
        // namespace declarations land after the attributes
        CHECK(iq.str() == "<iq id=\"r1\" type=\"result\" to=\"juliet@example.com/balcony\""
                          " from=\"example.com\" xml:lang=\"en\" xmlns=\"jabber:client\"/>");
    }

    SUBCASE("payload namespaces are declared once per change")
    {
        auto items = std::make_shared<xmpp::disco_items>();
        items->list.push_back({ "conference.example.com", "Chatrooms", "" });
        iq.add_payload(items);
        auto out = iq.str();
        CHECK(out.find("<query xmlns=\"http://jabber.org/protocol/disco#items\">"
                       "<item jid=\"conference.example.com\" name=\"Chatrooms\"/>"
                       "</query>") != std::string::npos);
        CHECK(out.find("<error") == std::string::npos);
    }
}

TEST_CASE("iq decode of first level children")
{
    auto table = xmpp::registry::standard();
    auto iq = xmpp::iq::parse(
        "<iq type='result' id='x' to='a@example.org' from='b@example.org' xml:lang='de'>"
        "<unknown xmlns='urn:example:one'><query xmlns='http://jabber.org/protocol/disco#info'/></unknown>"
        "<query xmlns='http://jabber.org/protocol/disco#info' node='n'>"
        "<identity category='client' type='pc' name='Gajim'/>"
        "<feature var='urn:xmpp:ping'/>"
        "</query>"
        "<second xmlns='urn:example:two'/>"
        "</iq>", table);

    CHECK(iq.to == "a@example.org");
    CHECK(iq.from == "b@example.org");
    CHECK(iq.lang == "de");

    REQUIRE(iq.payloads.size() == 3);

    SUBCASE("nested registered names stay generic")
    {
        auto outer = std::dynamic_pointer_cast<xmpp::node>(iq.payloads[0]);
        REQUIRE(outer);
        CHECK(outer->tag.local == "unknown");
        REQUIRE(outer->children.size() == 1);
        CHECK(outer->children[0].tag.space == "http://jabber.org/protocol/disco#info");
    }

    SUBCASE("document order")
    {
        auto info = std::dynamic_pointer_cast<xmpp::disco_info>(iq.payloads[1]);
        REQUIRE(info);
        CHECK(info->node == "n");
        REQUIRE(info->identities.size() == 1);
        CHECK(info->identities[0].name == "Gajim");
        auto second = std::dynamic_pointer_cast<xmpp::node>(iq.payloads[2]);
        REQUIRE(second);
        CHECK(second->tag.local == "second");
    }
}

TEST_CASE("iq error child in a foreign namespace is a payload")
{
    auto iq = xmpp::iq::parse(
        "<iq type='error' id='e'><error xmlns='urn:example:app' code='1'/></iq>",
        xmpp::registry::standard());
    CHECK(iq.error.empty());
    REQUIRE(iq.payloads.size() == 1);
    CHECK(std::dynamic_pointer_cast<xmpp::node>(iq.payloads[0]));
}

TEST_CASE("iq raw capture")
{
    const char *input =
        "<iq type='get' id='raw'><ping xmlns='urn:xmpp:ping'/></iq>";

    auto without = xmpp::iq::parse(input, xmpp::registry::standard(), false);
    CHECK(without.raw.empty());

    auto with = xmpp::iq::parse(input, xmpp::registry::standard(), true);
    CHECK(with.raw.find("ping") != std::string::npos);
    CHECK(with.raw.find("urn:xmpp:ping") != std::string::npos);
    REQUIRE(with.payloads.size() == 1);
    CHECK(std::dynamic_pointer_cast<xmpp::node>(with.payloads[0])->tag.local == "ping");
}

TEST_CASE("iq parse failures")
{
    SUBCASE("other root element")
    {
        CHECK_THROWS_AS(xmpp::iq::parse("<message id='m'/>"), std::invalid_argument);
    }

    SUBCASE("no element")
    {
        CHECK_THROWS_AS(xmpp::iq::parse(""), xml::error);
    }

    SUBCASE("malformed payload")
    {
        CHECK_THROWS_AS(xmpp::iq::parse("<iq id='1'><query xmlns='urn:a'></iq>"), xml::error);
    }
}

TEST_CASE("iq error without namespaces")
{
    auto iq = xmpp::iq::parse(
        "<iq type='error' id='b'>"
        "<error code='404' type='cancel'>"
        "<item-not-found xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'/>"
        "</error></iq>", xmpp::registry::standard());

    CHECK(iq.tag.space.empty());
    CHECK(iq.error.code == 404);
    CHECK(iq.error.type == "cancel");
    CHECK(iq.error.reason == "item-not-found");
    CHECK(iq.error.text.empty());
    CHECK(iq.payloads.empty());
}

TEST_CASE("iq attributes ignore namespace declarations")
{
    auto iq = xmpp::iq::parse(
        "<iq xmlns:type='urn:t' xmlns:id='urn:i' type='get' id='4'/>",
        xmpp::registry::standard());
    CHECK(iq.type == "get");
    CHECK(iq.id == "4");
    CHECK(iq.payloads.empty());
}
