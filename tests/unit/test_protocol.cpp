#include <catch2/catch_test_macros.hpp>
#include "network/protocol.hpp"

using namespace astv::network;

TEST_CASE("Protocol: tokens are fixed", "[protocol]") {
    REQUIRE(QByteArray(token(Message::Up)) == "astv_up");
    REQUIRE(QByteArray(token(Message::Down)) == "astv_down");
    REQUIRE(QByteArray(token(Message::Left)) == "astv_left");
    REQUIRE(QByteArray(token(Message::Right)) == "astv_right");
    REQUIRE(QByteArray(token(Message::Disconnect)) == "astv_disconnect");
    REQUIRE(QByteArray(token(Message::Discover)) == "astv_discover");
    REQUIRE(QByteArray(token(Message::Handshake)) == "astv_shake");
    REQUIRE(QByteArray(token(Message::Acknowledge)) == "astv_ack");
}

TEST_CASE("Protocol: encode produces the bare ASCII token", "[protocol]") {
    REQUIRE(encode(Message::Handshake) == QByteArray("astv_shake"));
    REQUIRE(encode(Message::Discover).size() == 13);
}

TEST_CASE("Protocol: decode rejects invalid UTF-8", "[protocol]") {
    REQUIRE(decode(QByteArray("astv_ack")) == QStringLiteral("astv_ack"));
    REQUIRE(decode(QByteArray()) == QString());
    REQUIRE_FALSE(decode(QByteArray("\xff\xfe" "astv_shake", 12)).has_value());
}

TEST_CASE("Protocol: matching is by substring", "[protocol]") {
    REQUIRE(matches(QByteArray("astv_shake"), Message::Handshake));
    REQUIRE(matches(QByteArray("\nastv_shake\r\n"), Message::Handshake));
    REQUIRE_FALSE(matches(QByteArray("astv_ack"), Message::Handshake));
    REQUIRE_FALSE(matches(QByteArray("\xc3\x28 astv_shake", 13), Message::Handshake));
}

TEST_CASE("Protocol: identify picks the first known token", "[protocol]") {
    REQUIRE(identify(QByteArray("astv_disconnect")) == Message::Disconnect);
    REQUIRE(identify(QByteArray("xx astv_ack xx")) == Message::Acknowledge);
    REQUIRE_FALSE(identify(QByteArray("hello")).has_value());
}

TEST_CASE("Protocol: commands parse by name or token", "[protocol]") {
    REQUIRE(message_from_name(u"up") == Message::Up);
    REQUIRE(message_from_name(u"  LEFT ") == Message::Left);
    REQUIRE(message_from_name(u"astv_right") == Message::Right);
    REQUIRE(message_from_name(u"handshake") == Message::Handshake);
    REQUIRE_FALSE(message_from_name(u"jump").has_value());
    REQUIRE_FALSE(message_from_name(u"").has_value());
}

TEST_CASE("Protocol: every encoded message matches itself", "[protocol]") {
    for (const auto message : kAllMessages) {
        REQUIRE(matches(encode(message), message));
        REQUIRE(identify(encode(message)) == message);
    }
    for (const auto message : kAllMessages) {
        REQUIRE_FALSE(matches(QByteArray("astv"), message));
    }
}
