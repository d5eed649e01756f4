#pragma once

#include <QByteArray>
#include <QString>
#include <QStringView>
#include <array>
#include <optional>

namespace astv::network {

/**
 * Message - the fixed tokens of the astv wire protocol.
 *
 * Each message travels as its ASCII token in a single UDP datagram:
 *
 *   Up          astv_up           move up
 *   Down        astv_down         move down
 *   Left        astv_left         move left
 *   Right       astv_right        move right
 *   Disconnect  astv_disconnect   end the session (and shut the peer down)
 *   Discover    astv_discover     greeting, repeated until a handshake arrives
 *   Handshake   astv_shake        peer confirms the session
 *   Acknowledge astv_ack          peer acknowledges a message
 *
 * Receivers match by substring so that framing bytes added by a transport
 * do not break recognition.
 */
enum class Message {
    Up,
    Down,
    Left,
    Right,
    Disconnect,
    Discover,
    Handshake,
    Acknowledge
};

inline constexpr std::array<Message, 8> kAllMessages = {
    Message::Up,        Message::Down,     Message::Left,      Message::Right,
    Message::Disconnect, Message::Discover, Message::Handshake, Message::Acknowledge
};

/// Wire token, e.g. "astv_shake".
[[nodiscard]] const char* token(Message message) noexcept;

/// Symbolic name, e.g. "handshake".
[[nodiscard]] const char* name(Message message) noexcept;

[[nodiscard]] QByteArray encode(Message message);

/**
 * Strict UTF-8 decode of a datagram. Returns nullopt on invalid input.
 */
[[nodiscard]] std::optional<QString> decode(const QByteArray& payload);

/**
 * True when the payload decodes as UTF-8 and contains the message token.
 */
[[nodiscard]] bool matches(const QByteArray& payload, Message message);

/**
 * First message (in declaration order) whose token the payload contains.
 */
[[nodiscard]] std::optional<Message> identify(const QByteArray& payload);

/**
 * Looks up a message by symbolic name ("up") or wire token ("astv_up").
 * Case-insensitive.
 */
[[nodiscard]] std::optional<Message> message_from_name(QStringView text);

} // namespace astv::network
