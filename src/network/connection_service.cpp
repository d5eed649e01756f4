#include "network/connection_service.hpp"
#include "network/log.hpp"

#include <QAbstractSocket>
#include <QMetaObject>
#include <algorithm>

namespace astv::network {

ConnectionService::ConnectionService(DiscoveryBackend* discovery,
                                     TransportFactory make_transport,
                                     ConnectionConfig config,
                                     QObject* parent)
    : QObject(parent)
    , discovery_(discovery)
    , make_transport_(std::move(make_transport))
    , config_(std::move(config))
    , estimator_(static_cast<std::size_t>(std::max(1, config_.strength_window)))
    , timers_(std::make_unique<TimerRegistry>(this))
{
    qRegisterMetaType<astv::network::ConnectionState>();

    if (discovery_) {
        discovery_->on_found = [this](ServiceCandidate candidate) {
            onCandidateFound(candidate);
        };
        discovery_->on_search_ended = [this](bool success) {
            onSearchEnded(success);
        };
        discovery_->on_resolved = [this](std::vector<QHostAddress> addresses) {
            onResolved(addresses);
        };
        discovery_->on_resolve_failed = [this](ResolveError error) {
            onResolveFailed(error);
        };
    }
}

ConnectionService::~ConnectionService() {
    timers_->cancelAll();
    stopDiscovery();
    if (session_ && session_->open) {
        session_->open = false;
        session_->transport->cancel();
    }

    if (discovery_) {
        discovery_->on_found = nullptr;
        discovery_->on_search_ended = nullptr;
        discovery_->on_resolved = nullptr;
        discovery_->on_resolve_failed = nullptr;
    }
}

// ============================================================================
// Public operations
// ============================================================================

void ConnectionService::discover(const QString& service_type) {
    tearDown();
    estimator_.reset();
    candidate_.reset();
    setState(ConnectionState::connecting());

    if (!discovery_) {
        qCWarning(astvDiscoveryLog) << "No discovery backend configured";
        close(false, ConnectionState::failed(ErrorKind::DiscoverIncorrectConfiguration));
        return;
    }

    discovery_->stop();
    auto started = discovery_->search(service_type, config_.discovery_timeout);
    if (started.is_err()) {
        qCWarning(astvDiscoveryLog) << "Failed to browse for" << service_type << ":"
                                    << QString::fromStdString(started.unwrap_err().message);
        close(false, ConnectionState::failed(ErrorKind::DiscoverIncorrectConfiguration));
        return;
    }

    browsing_ = true;
    qCInfo(astvDiscoveryLog) << "Browsing for" << service_type;
}

void ConnectionService::connectTo(const QHostAddress& host, quint16 port) {
    tearDown();
    estimator_.reset();

    auto transport = make_transport_ ? make_transport_() : nullptr;
    if (!transport) {
        qCWarning(astvLinkLog) << "No transport available for" << host.toString() << port;
        setState(ConnectionState::failed(ErrorKind::ConnectOther));
        return;
    }

    auto session = std::make_unique<Session>();
    session->id = next_session_id_++;
    session->host = host;
    session->port = port;
    session->transport = std::move(transport);
    session->open = true;

    const auto id = session->id;
    session->transport->on_ready = [this, id] {
        onTransportReady(id);
    };
    session->transport->on_error = [this, id](Error error) {
        onTransportError(id, error);
    };
    session->transport->on_message = [this, id](QByteArray payload, std::optional<Error> error) {
        onTransportMessage(id, payload, error);
    };
    session_ = std::move(session);

    // The greeting is only sent while Connecting.
    setState(ConnectionState::connecting());

    qCInfo(astvLinkLog) << "Connection started on" << host.toString() << ":" << port;
    session_->transport->open(host, port);
}

void ConnectionService::send(Message message) {
    if (!state_.isActive() || !session_ || !session_->open) {
        return;
    }

    const auto id = session_->id;
    session_->transport->send(encode(message), [this, id, message](std::optional<Error> error) {
        onSendComplete(id, message, error);
    });
}

void ConnectionService::close(bool notify_peer, ConnectionState final_state) {
    if (!state_.isActive()) {
        return;
    }

    closing_ = true;
    if (notify_peer) {
        send(Message::Disconnect);
    }
    timers_->cancelAll();
    stopDiscovery();
    setState(final_state);
    if (session_ && session_->open) {
        session_->open = false;
        session_->transport->cancel();
    }
    closing_ = false;
}

SessionCounters ConnectionService::counters() const {
    return session_ ? session_->counters : SessionCounters{};
}

int ConnectionService::discoverRetries() const {
    return session_ ? session_->discover_retries : 0;
}

std::optional<std::pair<QHostAddress, quint16>> ConnectionService::endpoint() const {
    if (!session_) {
        return std::nullopt;
    }
    return std::make_pair(session_->host, session_->port);
}

// ============================================================================
// Internals
// ============================================================================

void ConnectionService::setState(const ConnectionState& state) {
    if (state_ == state) {
        return;
    }
    state_ = state;
    qCInfo(astvLinkLog) << "State:" << state_.toString();
    emit stateChanged(state_);
}

void ConnectionService::tearDown() {
    stopDiscovery();
    timers_->cancelAll();

    if (!session_) {
        return;
    }
    if (session_->open) {
        session_->open = false;
        session_->transport->cancel();
    }

    // The old transport may still be on the call stack; free it once control
    // returns to the event loop.
    std::shared_ptr<Transport> retired(std::move(session_->transport));
    QMetaObject::invokeMethod(this, [retired] {}, Qt::QueuedConnection);
    session_.reset();
}

void ConnectionService::stopDiscovery() {
    if ((browsing_ || resolving_) && discovery_) {
        discovery_->stop();
    }
    browsing_ = false;
    resolving_ = false;
}

bool ConnectionService::isCurrent(quint64 session_id) const {
    return session_ && session_->id == session_id && session_->open;
}

float ConnectionService::sampleStrength(float success_rate_percent) {
    const float strength = estimator_.observe(success_rate_percent, state_.isConnected());
    emit strengthChanged(strength);
    return strength;
}

// ============================================================================
// Transport events
// ============================================================================

void ConnectionService::onTransportReady(quint64 session_id) {
    if (!isCurrent(session_id)) {
        return;
    }

    session_->transport->receive();
    session_->discover_retries = 0;
    send(Message::Discover);
}

void ConnectionService::onTransportError(quint64 session_id, const Error& error) {
    if (!isCurrent(session_id)) {
        return;
    }
    handleTransportError(error);
}

void ConnectionService::handleTransportError(const Error& error) {
    if (!state_.isActive()) {
        return;
    }

    qCWarning(astvTransportLog) << "Transport error:" << QString::fromStdString(error.message)
                                << "errno=" << error.code;

    const auto kind = error_kind_for_posix(error.code);
    if (!kind) {
        close(false);
        return;
    }
    close(false, ConnectionState::failed(*kind));
}

void ConnectionService::onSendComplete(quint64 session_id, Message message,
                                       const std::optional<Error>& error) {
    if (!isCurrent(session_id)) {
        return;
    }

    if (error) {
        if (closing_) {
            qCDebug(astvLinkLog) << "Ignoring send failure while closing:" << token(message);
            return;
        }
        handleTransportError(*error);
        return;
    }

    if (state_.isActive()) {
        if (const auto current = timers_->current()) {
            timers_->supersede(*current);
        }
        timers_->arm(config_.response_timeout, [this, session_id] {
            onResponseTimeout(session_id);
        });
    }

    ++session_->counters.sent;
    qCDebug(astvLinkLog) << "Sent:" << token(message)
                         << "sent=" << session_->counters.sent;
}

void ConnectionService::onResponseTimeout(quint64 session_id) {
    if (!isCurrent(session_id) || !state_.isActive()) {
        return;
    }

    const float strength = sampleStrength(0.0f);
    if (strength >= config_.strength_threshold || !isCurrent(session_id)) {
        return;
    }

    if (state_.isConnecting()) {
        if (session_->discover_retries >= config_.retry_budget) {
            qCInfo(astvLinkLog) << "No handshake after" << session_->discover_retries << "retries";
            close(false, ConnectionState::failed(ErrorKind::ConnectShakeNoResponse));
            return;
        }
        ++session_->discover_retries;
        send(Message::Discover);
        return;
    }

    // Peer presumed unreachable, so there is no point telling it.
    qCInfo(astvLinkLog) << "Link lost, strength" << strength;
    close(false);
}

void ConnectionService::onTransportMessage(quint64 session_id, const QByteArray& payload,
                                           const std::optional<Error>& error) {
    if (!isCurrent(session_id)) {
        return;
    }

    if (error) {
        handleTransportError(*error);
        return;
    }

    if (!payload.isEmpty()) {
        auto& counters = session_->counters;
        ++counters.received;

        const auto text = decode(payload);
        if (!text) {
            qCDebug(astvLinkLog) << "Received undecodable datagram, bytes=" << payload.size();
        } else {
            const float rate = counters.sent == 0
                ? 100.0f
                : std::min(100.0f, static_cast<float>(counters.received) /
                                   static_cast<float>(counters.sent) * 100.0f);

            timers_->cancelAll();

            if (matches(payload, Message::Handshake)) {
                setState(ConnectionState::connected());
            }
            if (matches(payload, Message::Disconnect)) {
                close(false);
            }

            const float strength = sampleStrength(rate);
            qCDebug(astvLinkLog) << "Received:" << *text << "--" << strength
                                 << "% successful transmission";
        }
    }

    if (isCurrent(session_id)) {
        session_->transport->receive();
    }
}

// ============================================================================
// Discovery events
// ============================================================================

void ConnectionService::onCandidateFound(const ServiceCandidate& candidate) {
    if (!browsing_ || candidate_) {
        return;
    }

    candidate_ = candidate;
    qCInfo(astvDiscoveryLog) << "Discovered service name=" << candidate.name
                             << "type=" << candidate.type
                             << "domain=" << candidate.domain;

    browsing_ = false;
    discovery_->stop();

    auto started = discovery_->resolve(candidate, config_.resolve_timeout);
    if (started.is_err()) {
        qCWarning(astvDiscoveryLog) << "Failed to resolve" << candidate.name << ":"
                                    << QString::fromStdString(started.unwrap_err().message);
        close(false, ConnectionState::failed(ErrorKind::DiscoverResolveUnknown));
        return;
    }
    resolving_ = true;
}

void ConnectionService::onSearchEnded(bool success) {
    if (!browsing_) {
        return;
    }
    browsing_ = false;

    if (!success) {
        qCInfo(astvDiscoveryLog) << "Search ended without finding a service";
        close(false, ConnectionState::failed(ErrorKind::DiscoverTimeout));
    }
}

void ConnectionService::onResolved(const std::vector<QHostAddress>& addresses) {
    if (!resolving_) {
        return;
    }
    resolving_ = false;

    const auto it = std::find_if(addresses.begin(), addresses.end(), [](const QHostAddress& address) {
        return address.protocol() == QAbstractSocket::IPv4Protocol;
    });
    if (it == addresses.end()) {
        qCWarning(astvDiscoveryLog) << "Resolved service has no IPv4 address";
        close(false, ConnectionState::failed(ErrorKind::DiscoverResolveFailed));
        return;
    }

    const QHostAddress host = *it;
    connectTo(host, config_.service_port);
}

void ConnectionService::onResolveFailed(ResolveError error) {
    if (!resolving_) {
        return;
    }
    resolving_ = false;

    qCWarning(astvDiscoveryLog) << "Resolve failed:" << to_string(error);
    close(false, ConnectionState::failed(error_kind_for_resolve(error)));
}

} // namespace astv::network
