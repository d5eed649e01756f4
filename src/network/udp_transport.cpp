#include "network/udp_transport.hpp"
#include "network/log.hpp"

#include <QMetaObject>
#include <QNetworkDatagram>
#include <QPointer>
#include <QUdpSocket>

#include <cerrno>

namespace astv::network {

int posix_code_for(QAbstractSocket::SocketError error) {
    switch (error) {
        case QAbstractSocket::ConnectionRefusedError: return ECONNREFUSED;
        case QAbstractSocket::RemoteHostClosedError: return ENOTCONN;
        case QAbstractSocket::HostNotFoundError: return EHOSTUNREACH;
        case QAbstractSocket::SocketAccessError: return EACCES;
        case QAbstractSocket::SocketResourceError: return EBUSY;
        case QAbstractSocket::SocketTimeoutError: return ETIMEDOUT;
        case QAbstractSocket::NetworkError: return ENETDOWN;
        case QAbstractSocket::AddressInUseError: return EADDRINUSE;
        case QAbstractSocket::SocketAddressNotAvailableError: return EADDRNOTAVAIL;
        case QAbstractSocket::OperationError: return EISCONN;
        case QAbstractSocket::TemporaryError: return EAGAIN;
        default: return EIO;
    }
}

UdpTransport::UdpTransport(QObject* parent)
    : QObject(parent)
    , socket_(std::make_unique<QUdpSocket>(this))
{
    connect(socket_.get(), &QUdpSocket::connected,
            this, &UdpTransport::onConnected);
    connect(socket_.get(), &QUdpSocket::errorOccurred,
            this, &UdpTransport::onErrorOccurred);
    connect(socket_.get(), &QUdpSocket::readyRead,
            this, &UdpTransport::onReadyRead);
}

UdpTransport::~UdpTransport() {
    cancel();
}

void UdpTransport::open(const QHostAddress& host, uint16_t port) {
    cancelled_ = false;
    ready_ = false;
    receiving_ = false;
    qCDebug(astvTransportLog) << "UDP: open" << host.toString() << port;
    socket_->connectToHost(host, port);
}

void UdpTransport::send(const QByteArray& payload, SendCompletion completion) {
    if (cancelled_) {
        return;
    }

    std::optional<Error> result;
    if (socket_->state() != QAbstractSocket::ConnectedState) {
        result = Error{"Socket not connected", ENOTCONN};
    } else if (socket_->write(payload) != payload.size()) {
        result = currentError();
    }

    // Completion is always asynchronous so callers never re-enter themselves.
    QPointer<UdpTransport> guard(this);
    QMetaObject::invokeMethod(this, [guard, completion = std::move(completion), result] {
        if (!guard || guard->cancelled_) return;
        if (completion) completion(result);
    }, Qt::QueuedConnection);
}

void UdpTransport::receive() {
    if (cancelled_) {
        return;
    }
    receiving_ = true;
    if (socket_->hasPendingDatagrams()) {
        QMetaObject::invokeMethod(this, &UdpTransport::deliverNext, Qt::QueuedConnection);
    }
}

void UdpTransport::cancel() {
    if (cancelled_) {
        return;
    }
    cancelled_ = true;
    ready_ = false;
    receiving_ = false;
    socket_->abort();
}

bool UdpTransport::isOpen() const {
    return !cancelled_ && socket_->state() == QAbstractSocket::ConnectedState;
}

void UdpTransport::onConnected() {
    if (cancelled_) return;
    ready_ = true;
    qCDebug(astvTransportLog) << "UDP: ready" << socket_->peerAddress().toString()
                              << socket_->peerPort();
    if (on_ready) on_ready();
}

void UdpTransport::onErrorOccurred(QAbstractSocket::SocketError error) {
    if (cancelled_) return;
    Q_UNUSED(error)

    const auto err = currentError();
    qCDebug(astvTransportLog) << "UDP: error" << QString::fromStdString(err.message)
                              << "errno=" << err.code;

    // A pending read receives the error; otherwise the connection does.
    if (ready_ && receiving_) {
        receiving_ = false;
        if (on_message) on_message(QByteArray{}, err);
        return;
    }
    if (on_error) on_error(err);
}

void UdpTransport::onReadyRead() {
    deliverNext();
}

void UdpTransport::deliverNext() {
    if (cancelled_ || !receiving_ || !socket_->hasPendingDatagrams()) {
        return;
    }

    const QNetworkDatagram datagram = socket_->receiveDatagram();
    receiving_ = false;

    if (!datagram.isValid()) {
        if (on_message) on_message(QByteArray{}, currentError());
        return;
    }
    if (on_message) on_message(datagram.data(), std::nullopt);
}

Error UdpTransport::currentError() const {
    return Error{socket_->errorString().toStdString(), posix_code_for(socket_->error())};
}

} // namespace astv::network
