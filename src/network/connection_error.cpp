#include "network/connection_error.hpp"
#include "network/discovery.hpp"
#include "network/log.hpp"

#include <cerrno>

namespace astv::network {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ConnectAddressInUse: return "connectAddressInUse";
        case ErrorKind::ConnectAddressUnavailable: return "connectAddressUnavailable";
        case ErrorKind::ConnectPermissionDenied: return "connectPermissionDenied";
        case ErrorKind::ConnectDeviceBusy: return "connectDeviceBusy";
        case ErrorKind::ConnectCanceled: return "connectCanceled";
        case ErrorKind::ConnectRefused: return "connectRefused";
        case ErrorKind::ConnectHostDown: return "connectHostDown";
        case ErrorKind::ConnectAlreadyConnected: return "connectAlreadyConnected";
        case ErrorKind::ConnectTimeout: return "connectTimeout";
        case ErrorKind::ConnectNetworkDown: return "connectNetworkDown";
        case ErrorKind::ConnectOther: return "connectOther";
        case ErrorKind::DiscoverResolveServiceNotFound: return "discoverResolveServiceNotFound";
        case ErrorKind::DiscoverResolveBusy: return "discoverResolveBusy";
        case ErrorKind::DiscoverIncorrectConfiguration: return "discoverIncorrectConfiguration";
        case ErrorKind::DiscoverResolveCanceled: return "discoverResolveCanceled";
        case ErrorKind::DiscoverResolveTimeout: return "discoverResolveTimeout";
        case ErrorKind::DiscoverResolveUnknown: return "discoverResolveUnknown";
        case ErrorKind::DiscoverResolveFailed: return "discoverResolveFailed";
        case ErrorKind::DiscoverTimeout: return "discoverTimeout";
        case ErrorKind::ConnectShakeNoResponse: return "connectShakeNoResponse";
    }
    return "unknown";
}

QString describe(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConnectAddressInUse:
            return QStringLiteral("Local address already in use");
        case ErrorKind::ConnectAddressUnavailable:
            return QStringLiteral("Address not available");
        case ErrorKind::ConnectPermissionDenied:
            return QStringLiteral("Permission denied");
        case ErrorKind::ConnectDeviceBusy:
            return QStringLiteral("Network device busy");
        case ErrorKind::ConnectCanceled:
            return QStringLiteral("Connection canceled");
        case ErrorKind::ConnectRefused:
            return QStringLiteral("Connection refused by peer");
        case ErrorKind::ConnectHostDown:
            return QStringLiteral("Peer host is down or unreachable");
        case ErrorKind::ConnectAlreadyConnected:
            return QStringLiteral("Socket already connected");
        case ErrorKind::ConnectTimeout:
            return QStringLiteral("Connection timed out");
        case ErrorKind::ConnectNetworkDown:
            return QStringLiteral("Network is down");
        case ErrorKind::ConnectOther:
            return QStringLiteral("Transport error");
        case ErrorKind::DiscoverResolveServiceNotFound:
            return QStringLiteral("Service not found while resolving");
        case ErrorKind::DiscoverResolveBusy:
            return QStringLiteral("Discovery service busy");
        case ErrorKind::DiscoverIncorrectConfiguration:
            return QStringLiteral("Discovery is not configured correctly");
        case ErrorKind::DiscoverResolveCanceled:
            return QStringLiteral("Resolve canceled");
        case ErrorKind::DiscoverResolveTimeout:
            return QStringLiteral("Resolve timed out");
        case ErrorKind::DiscoverResolveUnknown:
            return QStringLiteral("Unknown resolve error");
        case ErrorKind::DiscoverResolveFailed:
            return QStringLiteral("No usable IPv4 address for service");
        case ErrorKind::DiscoverTimeout:
            return QStringLiteral("No service found before the search timed out");
        case ErrorKind::ConnectShakeNoResponse:
            return QStringLiteral("Peer did not answer the handshake");
    }
    return QStringLiteral("Unknown error");
}

std::optional<ErrorKind> error_kind_for_posix(int code) {
    switch (code) {
        case EADDRINUSE:
            return ErrorKind::ConnectAddressInUse;
        case EADDRNOTAVAIL:
            return ErrorKind::ConnectAddressUnavailable;
        case EACCES:
        case EPERM:
            return ErrorKind::ConnectPermissionDenied;
        case EBUSY:
            return ErrorKind::ConnectDeviceBusy;
        case ECANCELED:
            return ErrorKind::ConnectCanceled;
        case ECONNREFUSED:
            return ErrorKind::ConnectRefused;
        case EHOSTDOWN:
        case EHOSTUNREACH:
            return ErrorKind::ConnectHostDown;
        case EISCONN:
            return ErrorKind::ConnectAlreadyConnected;
        case ENOTCONN:
            return std::nullopt;
        case ETIMEDOUT:
            return ErrorKind::ConnectTimeout;
        case ENETDOWN:
        case ENETUNREACH:
        case ENETRESET:
            return ErrorKind::ConnectNetworkDown;
        default:
            qCWarning(astvTransportLog) << "POSIX connection error:" << code;
            return ErrorKind::ConnectOther;
    }
}

ErrorKind error_kind_for_resolve(ResolveError error) {
    switch (error) {
        case ResolveError::NotFound: return ErrorKind::DiscoverResolveServiceNotFound;
        case ResolveError::Busy: return ErrorKind::DiscoverResolveBusy;
        case ResolveError::BadArgument:
        case ResolveError::InvalidConfiguration:
            return ErrorKind::DiscoverIncorrectConfiguration;
        case ResolveError::Canceled: return ErrorKind::DiscoverResolveCanceled;
        case ResolveError::Timeout: return ErrorKind::DiscoverResolveTimeout;
        case ResolveError::Unknown: return ErrorKind::DiscoverResolveUnknown;
    }
    return ErrorKind::DiscoverResolveUnknown;
}

} // namespace astv::network
