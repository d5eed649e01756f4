#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QHostAddress>
#include <QNetworkDatagram>
#include <QUdpSocket>

#include <optional>

#include "network/connection_config.hpp"
#include "network/protocol.hpp"

using astv::network::Message;

namespace {

struct PeerEndpoint {
    QHostAddress address;
    quint16 port = 0;

    bool operator==(const PeerEndpoint& other) const {
        return address.isEqual(other.address) && port == other.port;
    }
};

} // namespace

// Development peer: answers astv_discover with astv_shake and every other
// token with astv_ack. One client at a time; astv_disconnect ends its session.
int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("astv-peer");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Emulates an astv peer on UDP."));
    parser.addHelpOption();

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("p"), QStringLiteral("port")},
        QStringLiteral("UDP port to listen on (default 1024)."),
        QStringLiteral("port"),
        QString::number(astv::network::ConnectionConfig::DEFAULT_SERVICE_PORT));
    parser.addOption(portOption);

    const QCommandLineOption onceOption(
        QStringList{QStringLiteral("once")},
        QStringLiteral("Exit after the first session ends."));
    parser.addOption(onceOption);

    const QCommandLineOption muteOption(
        QStringList{QStringLiteral("mute")},
        QStringLiteral("Never answer; useful to watch the client give up."));
    parser.addOption(muteOption);

    parser.process(app);

    bool ok = false;
    const auto port = parser.value(portOption).toUShort(&ok);
    if (!ok) {
        qCritical().noquote() << "astv-peer: invalid port" << parser.value(portOption);
        return 1;
    }

    QUdpSocket socket;
    if (!socket.bind(QHostAddress::AnyIPv4, port)) {
        qCritical().noquote() << "astv-peer: bind failed:" << socket.errorString();
        return 1;
    }
    qInfo().noquote() << "astv-peer: listening on" << socket.localPort();

    const bool once = parser.isSet(onceOption);
    const bool mute = parser.isSet(muteOption);
    std::optional<PeerEndpoint> client;

    QObject::connect(&socket, &QUdpSocket::readyRead, &app, [&] {
        while (socket.hasPendingDatagrams()) {
            const QNetworkDatagram datagram = socket.receiveDatagram();
            if (!datagram.isValid()) {
                continue;
            }

            const PeerEndpoint sender{datagram.senderAddress(),
                                      static_cast<quint16>(datagram.senderPort())};
            const auto message = astv::network::identify(datagram.data());
            if (!message) {
                qWarning().noquote() << "astv-peer: ignoring datagram from"
                                     << sender.address.toString() << sender.port;
                continue;
            }

            if (client && !(*client == sender) && *message != Message::Discover) {
                qInfo().noquote() << "astv-peer: busy, dropping" << astv::network::token(*message)
                                  << "from" << sender.address.toString() << sender.port;
                continue;
            }

            qInfo().noquote() << "astv-peer: <-" << astv::network::token(*message)
                              << "from" << sender.address.toString() << sender.port;

            if (*message == Message::Disconnect) {
                client.reset();
                qInfo().noquote() << "astv-peer: session ended";
                if (once) {
                    QCoreApplication::quit();
                    return;
                }
                continue;
            }

            if (mute) {
                continue;
            }

            Message reply = Message::Acknowledge;
            if (*message == Message::Discover) {
                client = sender;
                reply = Message::Handshake;
            }
            socket.writeDatagram(astv::network::encode(reply), sender.address, sender.port);
            qInfo().noquote() << "astv-peer: ->" << astv::network::token(reply);
        }
    });

    return app.exec();
}
