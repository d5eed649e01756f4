#pragma once

#include "network/transport.hpp"
#include <QAbstractSocket>
#include <QObject>
#include <memory>

class QUdpSocket;

namespace astv::network {

/**
 * UdpTransport - Transport over a connected QUdpSocket.
 */
class UdpTransport final : public QObject, public Transport {
    Q_OBJECT

public:
    explicit UdpTransport(QObject* parent = nullptr);
    ~UdpTransport() override;

    void open(const QHostAddress& host, uint16_t port) override;
    void send(const QByteArray& payload, SendCompletion completion) override;
    void receive() override;
    void cancel() override;

    [[nodiscard]] bool isOpen() const override;

private slots:
    void onConnected();
    void onErrorOccurred(QAbstractSocket::SocketError error);
    void onReadyRead();

private:
    std::unique_ptr<QUdpSocket> socket_;
    bool ready_ = false;
    bool receiving_ = false;
    bool cancelled_ = false;

    void deliverNext();
    Error currentError() const;
};

/**
 * Translate a Qt socket error into the closest POSIX errno.
 */
[[nodiscard]] int posix_code_for(QAbstractSocket::SocketError error);

} // namespace astv::network
