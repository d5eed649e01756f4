#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "network/protocol.hpp"

using namespace astv::network;

namespace rc {

template<>
struct Arbitrary<Message> {
    static Gen<Message> arbitrary() {
        return gen::elementOf(kAllMessages);
    }
};

} // namespace rc

TEST_CASE("Property: tokens survive surrounding ASCII text", "[property][protocol]") {
    rc::check("matches() finds the token inside printable framing",
        [](Message message) {
            const auto printable = rc::gen::container<std::string>(rc::gen::inRange<char>(' ', '~'));
            const auto prefix = *printable;
            const auto suffix = *printable;
            const QByteArray payload = QByteArray::fromStdString(prefix) + encode(message) +
                                       QByteArray::fromStdString(suffix);
            RC_ASSERT(matches(payload, message));
            return true;
        }
    );
}

TEST_CASE("Property: names and tokens parse back", "[property][protocol]") {
    rc::check("message_from_name(name) and message_from_name(token) agree",
        [](Message message) {
            RC_ASSERT(message_from_name(QString::fromLatin1(name(message))) == message);
            RC_ASSERT(message_from_name(QString::fromLatin1(token(message)).toUpper()) == message);
            return true;
        }
    );
}

TEST_CASE("Property: payloads without the prefix match nothing", "[property][protocol]") {
    rc::check("identify() is empty when 'astv_' is absent",
        [](const std::string& text) {
            const auto payload = QByteArray::fromStdString(text);
            RC_PRE(!payload.contains("astv_"));
            RC_ASSERT(!identify(payload).has_value());
            return true;
        }
    );
}
