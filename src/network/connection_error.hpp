#pragma once

#include <QString>
#include <optional>

namespace astv::network {

enum class ResolveError;

/**
 * ErrorKind - why a connection attempt ended in the Failed state.
 */
enum class ErrorKind {
    // Transport
    ConnectAddressInUse,
    ConnectAddressUnavailable,
    ConnectPermissionDenied,
    ConnectDeviceBusy,
    ConnectCanceled,
    ConnectRefused,
    ConnectHostDown,
    ConnectAlreadyConnected,
    ConnectTimeout,
    ConnectNetworkDown,
    ConnectOther,

    // Discovery / handshake
    DiscoverResolveServiceNotFound,
    DiscoverResolveBusy,
    DiscoverIncorrectConfiguration,
    DiscoverResolveCanceled,
    DiscoverResolveTimeout,
    DiscoverResolveUnknown,
    DiscoverResolveFailed,
    DiscoverTimeout,
    ConnectShakeNoResponse
};

[[nodiscard]] const char* to_string(ErrorKind kind) noexcept;

/// Human readable description for logs and the CLI.
[[nodiscard]] QString describe(ErrorKind kind);

/**
 * Maps a POSIX errno reported by a transport.
 *
 * Returns nullopt for ENOTCONN: the peer went away and the session should
 * end as Disconnected rather than Failed.
 */
[[nodiscard]] std::optional<ErrorKind> error_kind_for_posix(int code);

[[nodiscard]] ErrorKind error_kind_for_resolve(ResolveError error);

} // namespace astv::network
