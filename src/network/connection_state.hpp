#pragma once

#include "network/connection_error.hpp"

#include <QMetaType>
#include <QString>
#include <optional>

namespace astv::network {

/**
 * ConnectionState - lifecycle state of the link.
 *
 * Failed carries the reason; the other kinds carry nothing.
 */
class ConnectionState {
public:
    enum class Kind {
        Disconnected,
        Connecting,
        Connected,
        Failed
    };

    constexpr ConnectionState() noexcept = default;

    [[nodiscard]] static constexpr ConnectionState disconnected() noexcept {
        return ConnectionState(Kind::Disconnected, std::nullopt);
    }
    [[nodiscard]] static constexpr ConnectionState connecting() noexcept {
        return ConnectionState(Kind::Connecting, std::nullopt);
    }
    [[nodiscard]] static constexpr ConnectionState connected() noexcept {
        return ConnectionState(Kind::Connected, std::nullopt);
    }
    [[nodiscard]] static constexpr ConnectionState failed(ErrorKind reason) noexcept {
        return ConnectionState(Kind::Failed, reason);
    }

    [[nodiscard]] constexpr Kind kind() const noexcept { return kind_; }
    [[nodiscard]] constexpr std::optional<ErrorKind> reason() const noexcept { return reason_; }

    [[nodiscard]] constexpr bool isConnected() const noexcept { return kind_ == Kind::Connected; }
    [[nodiscard]] constexpr bool isConnecting() const noexcept { return kind_ == Kind::Connecting; }
    [[nodiscard]] constexpr bool isFailed() const noexcept { return kind_ == Kind::Failed; }

    /// Connecting or Connected: sends are allowed and close() has work to do.
    [[nodiscard]] constexpr bool isActive() const noexcept {
        return kind_ == Kind::Connecting || kind_ == Kind::Connected;
    }

    [[nodiscard]] QString toString() const;

    constexpr bool operator==(const ConnectionState&) const noexcept = default;

private:
    constexpr ConnectionState(Kind kind, std::optional<ErrorKind> reason) noexcept
        : kind_(kind), reason_(reason) {}

    Kind kind_ = Kind::Disconnected;
    std::optional<ErrorKind> reason_;
};

} // namespace astv::network

Q_DECLARE_METATYPE(astv::network::ConnectionState)
