#pragma once

#include "network/connection_config.hpp"
#include "network/connection_state.hpp"
#include "network/discovery.hpp"
#include "network/link_quality.hpp"
#include "network/protocol.hpp"
#include "network/timer_registry.hpp"
#include "network/transport.hpp"
#include <QHostAddress>
#include <QObject>
#include <functional>
#include <memory>
#include <optional>

namespace astv::network {

/**
 * SessionCounters - datagrams exchanged during one connection attempt.
 */
struct SessionCounters {
    quint64 sent = 0;
    quint64 received = 0;
};

/**
 * ConnectionService - discovers an astv peer, handshakes with it and keeps
 * the session alive.
 *
 * Lifecycle:
 *   discover()  -> browse for the service, resolve it, connectTo() port 1024
 *   connectTo() -> open a transport, greet with astv_discover until the peer
 *                  answers astv_shake (Connected) or the retry budget runs out
 *   send()      -> every send arms a response timer; unanswered sends drag the
 *                  rolling strength down until the session is dropped
 *   close()     -> optional astv_disconnect, cancel timers and transport
 *
 * Every entry point and callback runs on the thread owning this object.
 * Discovery is borrowed; transports are created per attempt from the factory.
 */
class ConnectionService : public QObject {
    Q_OBJECT

public:
    using TransportFactory = std::function<std::unique_ptr<Transport>()>;

    ConnectionService(DiscoveryBackend* discovery,
                      TransportFactory make_transport,
                      ConnectionConfig config = {},
                      QObject* parent = nullptr);
    ~ConnectionService() override;

    /**
     * Browse for `service_type` and connect to the first instance found.
     * Tears down any attempt in progress first.
     */
    void discover(const QString& service_type);

    /**
     * Connect directly to a known endpoint. Tears down any attempt in
     * progress first.
     */
    void connectTo(const QHostAddress& host, quint16 port);

    /**
     * Send a protocol message. Ignored unless Connecting or Connected.
     */
    void send(Message message);

    /**
     * End the session. Ignored unless Connecting or Connected.
     * @param notify_peer  send astv_disconnect first (best effort)
     * @param final_state  state to report once closed
     */
    void close(bool notify_peer = true,
               ConnectionState final_state = ConnectionState::disconnected());

    [[nodiscard]] const ConnectionState& state() const { return state_; }
    [[nodiscard]] SessionCounters counters() const;
    [[nodiscard]] int discoverRetries() const;
    [[nodiscard]] float strength() const { return estimator_.average(); }
    [[nodiscard]] const LinkQualityEstimator& estimator() const { return estimator_; }
    [[nodiscard]] const TimerRegistry& timers() const { return *timers_; }
    [[nodiscard]] const ConnectionConfig& config() const { return config_; }
    [[nodiscard]] std::optional<std::pair<QHostAddress, quint16>> endpoint() const;

signals:
    void stateChanged(const astv::network::ConnectionState& state);
    void strengthChanged(float percent);

private:
    /// One connection attempt: its transport and bookkeeping.
    struct Session {
        quint64 id = 0;
        std::unique_ptr<Transport> transport;
        QHostAddress host;
        quint16 port = 0;
        SessionCounters counters;
        int discover_retries = 0;
        bool open = false;
    };

    DiscoveryBackend* discovery_;
    TransportFactory make_transport_;
    ConnectionConfig config_;

    ConnectionState state_;
    LinkQualityEstimator estimator_;
    std::unique_ptr<TimerRegistry> timers_;
    std::unique_ptr<Session> session_;
    quint64 next_session_id_ = 1;

    bool browsing_ = false;
    bool resolving_ = false;
    bool closing_ = false;
    std::optional<ServiceCandidate> candidate_;

    void setState(const ConnectionState& state);
    void tearDown();
    void stopDiscovery();
    [[nodiscard]] bool isCurrent(quint64 session_id) const;

    void onTransportReady(quint64 session_id);
    void onTransportError(quint64 session_id, const Error& error);
    void onTransportMessage(quint64 session_id, const QByteArray& payload,
                            const std::optional<Error>& error);
    void onSendComplete(quint64 session_id, Message message,
                        const std::optional<Error>& error);
    void onResponseTimeout(quint64 session_id);
    void handleTransportError(const Error& error);

    void onCandidateFound(const ServiceCandidate& candidate);
    void onSearchEnded(bool success);
    void onResolved(const std::vector<QHostAddress>& addresses);
    void onResolveFailed(ResolveError error);

    float sampleStrength(float success_rate_percent);
};

} // namespace astv::network
