#pragma once

#include "core/result.hpp"
#include <QHostAddress>
#include <QString>
#include <chrono>
#include <functional>
#include <memory>
#include <vector>

namespace astv::network {

/**
 * ServiceCandidate - a service instance reported by a browse.
 *
 * Carries what the backend needs to resolve it later; the address is not
 * known until resolution completes.
 */
struct ServiceCandidate {
    QString name;
    QString type;
    QString domain;
    int interface_index = -1;
    int protocol = -1;

    bool operator==(const ServiceCandidate& other) const {
        return name == other.name && type == other.type && domain == other.domain;
    }
};

/**
 * ResolveError - why a candidate could not be resolved to an address.
 */
enum class ResolveError {
    NotFound,
    Busy,
    BadArgument,
    Canceled,
    InvalidConfiguration,
    Timeout,
    Unknown
};

[[nodiscard]] const char* to_string(ResolveError error) noexcept;

/**
 * DiscoveryBackend - DNS-SD browse/resolve capability.
 *
 * Callbacks are invoked on the thread that owns the backend. After stop()
 * no further browse or resolve callbacks are delivered for the stopped
 * operation.
 */
class DiscoveryBackend {
public:
    virtual ~DiscoveryBackend() = default;

    /**
     * Browse for `service_type` (e.g. "_astv._udp"). If nothing is found
     * within `timeout`, on_search_ended(false) is delivered.
     */
    virtual Result<void, Error> search(const QString& service_type,
                                       std::chrono::milliseconds timeout) = 0;

    /**
     * Stop browsing and abandon any resolve in progress.
     */
    virtual void stop() = 0;

    /**
     * Resolve a candidate. Delivers exactly one of on_resolved or
     * on_resolve_failed unless stop() is called first.
     */
    virtual Result<void, Error> resolve(const ServiceCandidate& candidate,
                                        std::chrono::milliseconds timeout) = 0;

    // Callbacks
    std::function<void(ServiceCandidate)> on_found;
    std::function<void(bool success)> on_search_ended;
    std::function<void(std::vector<QHostAddress>)> on_resolved;
    std::function<void(ResolveError)> on_resolve_failed;
};

/**
 * Create the platform discovery backend (Avahi on Linux when available).
 */
std::unique_ptr<DiscoveryBackend> createDiscoveryBackend();

} // namespace astv::network
