#include <doctest/doctest.h>

#include "../xmpp/iq.hh"

namespace {

    xmpp::stanza_error decode_error(std::string_view text) {
        xml::reader reader(text);
        auto start = reader.next_element();
        REQUIRE(start);
        xmpp::stanza_error result;
        result.decode(reader, *start);
        return result;
    }

    std::string encode_error(const xmpp::stanza_error& e) {
        xml::writer writer;
        writer.start_element(xml::qname { "jabber:client", "iq" });
        e.encode(writer);
        writer.end_element();
        return writer.str();
    }

}

TEST_CASE("stanza error decode")
{
    auto e = decode_error(
        "<error xmlns='jabber:client' code='404' type='cancel'>"
        "<item-not-found xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'/>"
        "<text xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'>gone</text>"
        "</error>");

    CHECK(e.code == 404);
    CHECK(e.type == "cancel");
    CHECK(e.reason == "item-not-found");
    CHECK(e.text == "gone");
    CHECK_FALSE(e.empty());
}

TEST_CASE("stanza error round trip")
{
    xmpp::stanza_error e;
    e.code = 503;
    e.type = "wait";
    e.reason = "service-unavailable";
    e.text = "try <later>";

    auto out = encode_error(e);
    xml::reader reader(out);
    REQUIRE(reader.next_element());
    auto start = reader.next_element();
    REQUIRE(start);
    CHECK(start->name.local == "error");
    CHECK(start->name.space == "jabber:client");

    xmpp::stanza_error again;
    again.decode(reader, *start);
    CHECK(again == e);
}

TEST_CASE("stanza error without code writes nothing")
{
    xmpp::stanza_error e;
    e.type = "cancel";
    e.reason = "conflict";
    CHECK(e.empty());
    CHECK(encode_error(e) == "<iq xmlns=\"jabber:client\"/>");
}

TEST_CASE("stanza error edge cases")
{
    SUBCASE("non numeric code is ignored")
    {
        auto e = decode_error("<error code='4o4' type='modify'/>");
        CHECK(e.code == 0);
        CHECK(e.type == "modify");
    }

    SUBCASE("last condition wins")
    {
        auto e = decode_error(
            "<error code='400' xmlns:s='urn:ietf:params:xml:ns:xmpp-stanzas'>"
            "<s:bad-request/><s:not-acceptable/>"
            "</error>");
        CHECK(e.reason == "not-acceptable");
    }

    SUBCASE("foreign children are dropped")
    {
        auto e = decode_error(
            "<error code='409'>"
            "<conflict xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'/>"
            "<detail xmlns='urn:example:app'>extra</detail>"
            "</error>");
        CHECK(e.reason == "conflict");
        CHECK(e.text.empty());
    }

    SUBCASE("truncated input throws")
    {
        xml::reader reader("<error code='500'><internal-server-error xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'/>");
        auto start = reader.next_element();
        REQUIRE(start);
        xmpp::stanza_error e;
        CHECK_THROWS_AS(e.decode(reader, *start), xml::error);
    }
}
