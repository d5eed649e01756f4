#include "network/protocol.hpp"

#include <QStringDecoder>

namespace astv::network {

const char* token(Message message) noexcept {
    switch (message) {
        case Message::Up: return "astv_up";
        case Message::Down: return "astv_down";
        case Message::Left: return "astv_left";
        case Message::Right: return "astv_right";
        case Message::Disconnect: return "astv_disconnect";
        case Message::Discover: return "astv_discover";
        case Message::Handshake: return "astv_shake";
        case Message::Acknowledge: return "astv_ack";
    }
    return "";
}

const char* name(Message message) noexcept {
    switch (message) {
        case Message::Up: return "up";
        case Message::Down: return "down";
        case Message::Left: return "left";
        case Message::Right: return "right";
        case Message::Disconnect: return "disconnect";
        case Message::Discover: return "discover";
        case Message::Handshake: return "handshake";
        case Message::Acknowledge: return "acknowledge";
    }
    return "";
}

QByteArray encode(Message message) {
    return QByteArray(token(message));
}

std::optional<QString> decode(const QByteArray& payload) {
    QStringDecoder decoder(QStringDecoder::Utf8, QStringDecoder::Flag::Stateless);
    QString text = decoder.decode(payload);
    if (decoder.hasError()) {
        return std::nullopt;
    }
    return text;
}

bool matches(const QByteArray& payload, Message message) {
    const auto text = decode(payload);
    if (!text) {
        return false;
    }
    return text->contains(QLatin1String(token(message)));
}

std::optional<Message> identify(const QByteArray& payload) {
    const auto text = decode(payload);
    if (!text) {
        return std::nullopt;
    }
    for (const auto message : kAllMessages) {
        if (text->contains(QLatin1String(token(message)))) {
            return message;
        }
    }
    return std::nullopt;
}

std::optional<Message> message_from_name(QStringView text) {
    const auto trimmed = text.trimmed();
    for (const auto message : kAllMessages) {
        if (trimmed.compare(QLatin1String(name(message)), Qt::CaseInsensitive) == 0 ||
            trimmed.compare(QLatin1String(token(message)), Qt::CaseInsensitive) == 0) {
            return message;
        }
    }
    return std::nullopt;
}

} // namespace astv::network
