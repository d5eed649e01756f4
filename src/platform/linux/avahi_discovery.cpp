#include "network/discovery.hpp"
#include "network/log.hpp"

#ifdef ASTV_HAS_AVAHI

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/address.h>
#include <avahi-common/error.h>
#include <avahi-common/thread-watch.h>

#include <QMetaObject>
#include <QObject>
#include <QTimer>

#include <atomic>

namespace astv::network {

namespace {

ResolveError resolve_error_from_avahi(int error) {
    switch (error) {
        case AVAHI_ERR_NOT_FOUND:
            return ResolveError::NotFound;
        case AVAHI_ERR_TIMEOUT:
            return ResolveError::Timeout;
        case AVAHI_ERR_NO_MEMORY:
        case AVAHI_ERR_TOO_MANY_OBJECTS:
        case AVAHI_ERR_TOO_MANY_CLIENTS:
            return ResolveError::Busy;
        case AVAHI_ERR_INVALID_SERVICE_NAME:
        case AVAHI_ERR_INVALID_SERVICE_TYPE:
        case AVAHI_ERR_INVALID_DOMAIN_NAME:
        case AVAHI_ERR_INVALID_INTERFACE:
        case AVAHI_ERR_INVALID_PROTOCOL:
        case AVAHI_ERR_INVALID_FLAGS:
            return ResolveError::BadArgument;
        case AVAHI_ERR_DISCONNECTED:
            return ResolveError::Canceled;
        case AVAHI_ERR_BAD_STATE:
        case AVAHI_ERR_NO_DAEMON:
        case AVAHI_ERR_NOT_PERMITTED:
            return ResolveError::InvalidConfiguration;
        default:
            return ResolveError::Unknown;
    }
}

} // namespace

/**
 * Avahi-based DNS-SD browse/resolve for Linux.
 *
 * Avahi runs its own poll thread. Every event is re-posted onto this
 * object's thread, tagged with the generation of the browse or resolve it
 * belongs to, so events from an operation stopped in the meantime are
 * dropped.
 */
class AvahiDiscoveryBackend final : public QObject, public DiscoveryBackend {
public:
    AvahiDiscoveryBackend()
        : search_timer_(std::make_unique<QTimer>(this))
        , resolve_timer_(std::make_unique<QTimer>(this))
    {
        search_timer_->setSingleShot(true);
        resolve_timer_->setSingleShot(true);

        connect(search_timer_.get(), &QTimer::timeout, this, [this] {
            qCInfo(astvDiscoveryLog) << "Avahi: search timed out";
            stop_browser();
            if (on_search_ended) on_search_ended(false);
        });
        connect(resolve_timer_.get(), &QTimer::timeout, this, [this] {
            qCInfo(astvDiscoveryLog) << "Avahi: resolve timed out";
            stop_resolver();
            if (on_resolve_failed) on_resolve_failed(ResolveError::Timeout);
        });
    }

    ~AvahiDiscoveryBackend() override {
        stop();

        if (threaded_poll_) {
            avahi_threaded_poll_stop(threaded_poll_);
        }
        if (client_) {
            avahi_client_free(client_);
        }
        if (threaded_poll_) {
            avahi_threaded_poll_free(threaded_poll_);
        }
    }

    Result<void, Error> search(const QString& service_type,
                               std::chrono::milliseconds timeout) override {
        if (!ensure_client()) {
            return Result<void, Error>::err(Error{"Failed to create Avahi client"});
        }

        stop_browser();
        const auto generation = ++search_generation_;
        const QByteArray type = service_type.toUtf8();

        avahi_threaded_poll_lock(threaded_poll_);
        browser_ = avahi_service_browser_new(
            client_,
            AVAHI_IF_UNSPEC,
            AVAHI_PROTO_UNSPEC,
            type.constData(),
            nullptr,  // domain
            static_cast<AvahiLookupFlags>(0),
            browse_callback,
            this
        );
        const int error = browser_ ? AVAHI_OK : avahi_client_errno(client_);
        avahi_threaded_poll_unlock(threaded_poll_);

        if (!browser_) {
            return Result<void, Error>::err(Error{
                "Failed to create service browser: " + std::string(avahi_strerror(error)),
                error});
        }

        qCDebug(astvDiscoveryLog) << "Avahi: browsing type=" << service_type
                                  << "generation=" << generation;
        search_timer_->start(timeout);
        return Result<void, Error>::ok();
    }

    void stop() override {
        stop_browser();
        stop_resolver();
    }

    Result<void, Error> resolve(const ServiceCandidate& candidate,
                                std::chrono::milliseconds timeout) override {
        if (!ensure_client()) {
            return Result<void, Error>::err(Error{"Failed to create Avahi client"});
        }

        stop_resolver();
        ++resolve_generation_;
        const QByteArray name = candidate.name.toUtf8();
        const QByteArray type = candidate.type.toUtf8();
        const QByteArray domain = candidate.domain.toUtf8();

        avahi_threaded_poll_lock(threaded_poll_);
        resolver_ = avahi_service_resolver_new(
            client_,
            static_cast<AvahiIfIndex>(candidate.interface_index),
            static_cast<AvahiProtocol>(candidate.protocol),
            name.constData(),
            type.constData(),
            domain.isEmpty() ? nullptr : domain.constData(),
            AVAHI_PROTO_INET,
            static_cast<AvahiLookupFlags>(0),
            resolve_callback,
            this
        );
        const int error = resolver_ ? AVAHI_OK : avahi_client_errno(client_);
        avahi_threaded_poll_unlock(threaded_poll_);

        if (!resolver_) {
            return Result<void, Error>::err(Error{
                "Failed to create service resolver: " + std::string(avahi_strerror(error)),
                error});
        }

        resolve_timer_->start(timeout);
        return Result<void, Error>::ok();
    }

private:
    AvahiThreadedPoll* threaded_poll_ = nullptr;
    AvahiClient* client_ = nullptr;
    AvahiServiceBrowser* browser_ = nullptr;
    AvahiServiceResolver* resolver_ = nullptr;

    std::unique_ptr<QTimer> search_timer_;
    std::unique_ptr<QTimer> resolve_timer_;

    std::atomic<quint64> search_generation_{0};
    std::atomic<quint64> resolve_generation_{0};

    bool ensure_client() {
        if (client_) return true;

        threaded_poll_ = avahi_threaded_poll_new();
        if (!threaded_poll_) return false;

        int error = 0;
        client_ = avahi_client_new(
            avahi_threaded_poll_get(threaded_poll_),
            static_cast<AvahiClientFlags>(0),
            client_callback,
            this,
            &error
        );

        if (!client_) {
            qCWarning(astvDiscoveryLog) << "Avahi: client creation failed:" << avahi_strerror(error);
            avahi_threaded_poll_free(threaded_poll_);
            threaded_poll_ = nullptr;
            return false;
        }

        if (avahi_threaded_poll_start(threaded_poll_) < 0) {
            qCWarning(astvDiscoveryLog) << "Avahi: failed to start poll thread";
            avahi_client_free(client_);
            client_ = nullptr;
            avahi_threaded_poll_free(threaded_poll_);
            threaded_poll_ = nullptr;
            return false;
        }

        return true;
    }

    void stop_browser() {
        search_timer_->stop();
        ++search_generation_;
        if (!browser_) return;

        avahi_threaded_poll_lock(threaded_poll_);
        avahi_service_browser_free(browser_);
        browser_ = nullptr;
        avahi_threaded_poll_unlock(threaded_poll_);
    }

    void stop_resolver() {
        resolve_timer_->stop();
        ++resolve_generation_;
        if (!threaded_poll_) return;

        avahi_threaded_poll_lock(threaded_poll_);
        if (resolver_) {
            avahi_service_resolver_free(resolver_);
            resolver_ = nullptr;
        }
        avahi_threaded_poll_unlock(threaded_poll_);
    }

    // The following run on the Avahi poll thread.

    static void client_callback(AvahiClient* client, AvahiClientState state, void* userdata) {
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

        if (state != AVAHI_CLIENT_FAILURE) {
            return;
        }

        const int error = avahi_client_errno(client);
        const auto generation = self->search_generation_.load();
        QMetaObject::invokeMethod(self, [self, generation, error] {
            if (generation != self->search_generation_.load() || !self->browser_) {
                return;
            }
            qCWarning(astvDiscoveryLog) << "Avahi: client failure:" << avahi_strerror(error);
            self->stop_browser();
            if (self->on_search_ended) self->on_search_ended(false);
        }, Qt::QueuedConnection);
    }

    static void browse_callback(AvahiServiceBrowser* browser,
                                AvahiIfIndex interface,
                                AvahiProtocol protocol,
                                AvahiBrowserEvent event,
                                const char* name,
                                const char* type,
                                const char* domain,
                                AvahiLookupResultFlags flags,
                                void* userdata) {
        Q_UNUSED(browser)
        Q_UNUSED(flags)
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);
        const auto generation = self->search_generation_.load();

        switch (event) {
            case AVAHI_BROWSER_NEW: {
                ServiceCandidate candidate{
                    .name = QString::fromUtf8(name),
                    .type = QString::fromUtf8(type),
                    .domain = QString::fromUtf8(domain),
                    .interface_index = static_cast<int>(interface),
                    .protocol = static_cast<int>(protocol)
                };
                QMetaObject::invokeMethod(self, [self, generation, candidate] {
                    if (generation != self->search_generation_.load()) return;
                    if (self->on_found) self->on_found(candidate);
                }, Qt::QueuedConnection);
                break;
            }

            case AVAHI_BROWSER_FAILURE: {
                const int error = avahi_client_errno(avahi_service_browser_get_client(browser));
                QMetaObject::invokeMethod(self, [self, generation, error] {
                    if (generation != self->search_generation_.load()) return;
                    qCWarning(astvDiscoveryLog) << "Avahi: browse failed:" << avahi_strerror(error);
                    self->stop_browser();
                    if (self->on_search_ended) self->on_search_ended(false);
                }, Qt::QueuedConnection);
                break;
            }

            case AVAHI_BROWSER_REMOVE:
            case AVAHI_BROWSER_ALL_FOR_NOW:
            case AVAHI_BROWSER_CACHE_EXHAUSTED:
                // Keep browsing until a service appears or the search times out.
                break;
        }
    }

    static void resolve_callback(AvahiServiceResolver* resolver,
                                 AvahiIfIndex interface,
                                 AvahiProtocol protocol,
                                 AvahiResolverEvent event,
                                 const char* name,
                                 const char* type,
                                 const char* domain,
                                 const char* host_name,
                                 const AvahiAddress* address,
                                 uint16_t port,
                                 AvahiStringList* txt,
                                 AvahiLookupResultFlags flags,
                                 void* userdata) {
        Q_UNUSED(interface)
        Q_UNUSED(protocol)
        Q_UNUSED(name)
        Q_UNUSED(type)
        Q_UNUSED(domain)
        Q_UNUSED(port)
        Q_UNUSED(txt)
        Q_UNUSED(flags)
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);
        const auto generation = self->resolve_generation_.load();

        if (event == AVAHI_RESOLVER_FOUND) {
            std::vector<QHostAddress> addresses;
            if (address) {
                char addr_str[AVAHI_ADDRESS_STR_MAX];
                avahi_address_snprint(addr_str, sizeof(addr_str), address);
                addresses.emplace_back(QString::fromUtf8(addr_str));
            }
            const QString host = QString::fromUtf8(host_name ? host_name : "");

            QMetaObject::invokeMethod(self, [self, generation, addresses, host] {
                if (generation != self->resolve_generation_.load()) return;
                self->resolve_timer_->stop();
                qCDebug(astvDiscoveryLog) << "Avahi: resolved host=" << host
                                          << "addresses=" << addresses.size();
                if (self->on_resolved) self->on_resolved(addresses);
            }, Qt::QueuedConnection);
        } else {
            const int error = avahi_client_errno(avahi_service_resolver_get_client(resolver));
            const auto reason = resolve_error_from_avahi(error);

            QMetaObject::invokeMethod(self, [self, generation, reason, error] {
                if (generation != self->resolve_generation_.load()) return;
                self->resolve_timer_->stop();
                qCWarning(astvDiscoveryLog) << "Avahi: resolve failed:" << avahi_strerror(error);
                if (self->on_resolve_failed) self->on_resolve_failed(reason);
            }, Qt::QueuedConnection);
        }

        // Called with the poll lock held, so the handle can be dropped here.
        avahi_service_resolver_free(resolver);
        if (self->resolver_ == resolver) {
            self->resolver_ = nullptr;
        }
    }
};

std::unique_ptr<DiscoveryBackend> createAvahiBackend() {
    return std::make_unique<AvahiDiscoveryBackend>();
}

} // namespace astv::network

#endif // ASTV_HAS_AVAHI
