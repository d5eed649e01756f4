#pragma once

#include "network/discovery.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <algorithm>
#include <memory>
#include <optional>
#include <vector>

namespace astv::testing {

/**
 * FakeTransport - scripted Transport for driving ConnectionService.
 *
 * Sends complete synchronously. Tests push readiness, datagrams and errors
 * through the helpers below; nothing is delivered after cancel().
 */
class FakeTransport : public network::Transport {
public:
    void open(const QHostAddress& h, uint16_t p) override {
        host = h;
        port = p;
        opened = true;
    }

    void send(const QByteArray& payload, SendCompletion completion) override {
        if (cancelled) {
            return;
        }
        if (fail_sends) {
            if (completion) completion(*fail_sends);
            return;
        }
        sent.push_back(payload);
        if (completion) completion(std::nullopt);
    }

    void receive() override {
        ++receive_calls;
    }

    void cancel() override {
        cancelled = true;
    }

    [[nodiscard]] bool isOpen() const override {
        return opened && !cancelled;
    }

    void becomeReady() {
        if (!cancelled && on_ready) on_ready();
    }

    void deliver(const QByteArray& payload) {
        if (!cancelled && on_message) on_message(payload, std::nullopt);
    }

    void deliver(network::Message message) {
        deliver(network::encode(message));
    }

    void failReceive(Error error) {
        if (!cancelled && on_message) on_message(QByteArray{}, std::move(error));
    }

    void failOpen(Error error) {
        if (!cancelled && on_error) on_error(std::move(error));
    }

    [[nodiscard]] int sentCount(network::Message message) const {
        return static_cast<int>(std::count(sent.begin(), sent.end(), network::encode(message)));
    }

    QHostAddress host;
    uint16_t port = 0;
    bool opened = false;
    bool cancelled = false;
    int receive_calls = 0;
    std::vector<QByteArray> sent;
    std::optional<Error> fail_sends;
};

/**
 * TransportFactory - hands out FakeTransports and remembers the latest one.
 *
 * Ownership moves to the service; `last` stays valid until the service
 * starts another attempt and control returns to the event loop.
 */
struct FakeTransportFactory {
    FakeTransport* last = nullptr;
    int created = 0;

    auto factory() {
        return [this]() -> std::unique_ptr<network::Transport> {
            auto transport = std::make_unique<FakeTransport>();
            last = transport.get();
            ++created;
            return transport;
        };
    }
};

/**
 * FakeDiscovery - records requests and lets tests emit discovery events.
 */
class FakeDiscovery : public network::DiscoveryBackend {
public:
    Result<void, Error> search(const QString& service_type,
                               std::chrono::milliseconds timeout) override {
        searched_type = service_type;
        search_timeout = timeout;
        ++search_calls;
        if (refuse_search) {
            return Result<void, Error>::err(Error{"browse refused"});
        }
        return Result<void, Error>::ok();
    }

    void stop() override {
        ++stop_calls;
    }

    Result<void, Error> resolve(const network::ServiceCandidate& candidate,
                                std::chrono::milliseconds timeout) override {
        resolved_candidate = candidate;
        resolve_timeout = timeout;
        ++resolve_calls;
        if (refuse_resolve) {
            return Result<void, Error>::err(Error{"resolve refused"});
        }
        return Result<void, Error>::ok();
    }

    void find(const QString& name) {
        if (on_found) {
            on_found(network::ServiceCandidate{name, QStringLiteral("_astv._udp"),
                                               QStringLiteral("local.")});
        }
    }

    void endSearch(bool success) {
        if (on_search_ended) on_search_ended(success);
    }

    void resolveTo(std::vector<QHostAddress> addresses) {
        if (on_resolved) on_resolved(std::move(addresses));
    }

    void failResolve(network::ResolveError error) {
        if (on_resolve_failed) on_resolve_failed(error);
    }

    QString searched_type;
    std::chrono::milliseconds search_timeout{0};
    std::chrono::milliseconds resolve_timeout{0};
    std::optional<network::ServiceCandidate> resolved_candidate;
    int search_calls = 0;
    int stop_calls = 0;
    int resolve_calls = 0;
    bool refuse_search = false;
    bool refuse_resolve = false;
};

} // namespace astv::testing
