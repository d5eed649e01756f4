#pragma once

#include "core/result.hpp"
#include <QByteArray>
#include <QHostAddress>
#include <functional>
#include <optional>

namespace astv::network {

/**
 * Transport - a datagram channel to a single peer endpoint.
 *
 * Errors carry a POSIX errno in Error::code. All callbacks are delivered on
 * the thread that owns the transport, and none are delivered after cancel().
 */
class Transport {
public:
    using SendCompletion = std::function<void(std::optional<Error>)>;

    virtual ~Transport() = default;

    /**
     * Start connecting to the peer. on_ready or on_error follows.
     */
    virtual void open(const QHostAddress& host, uint16_t port) = 0;

    /**
     * Send one datagram. `completion` runs once the datagram was handed to
     * the network, with an error if that failed.
     */
    virtual void send(const QByteArray& payload, SendCompletion completion) = 0;

    /**
     * Ask for the next datagram. Exactly one on_message follows for each
     * call; callers re-arm from inside on_message to keep listening.
     */
    virtual void receive() = 0;

    /**
     * Close the channel. Idempotent.
     */
    virtual void cancel() = 0;

    [[nodiscard]] virtual bool isOpen() const = 0;

    // Callbacks
    std::function<void()> on_ready;
    std::function<void(Error)> on_error;
    std::function<void(QByteArray, std::optional<Error>)> on_message;
};

} // namespace astv::network
