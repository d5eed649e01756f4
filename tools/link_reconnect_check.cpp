#include <QCoreApplication>
#include <QDebug>
#include <QStringList>
#include <QTest>
#include <QUdpSocket>

#include "network/connection_service.hpp"
#include "network/udp_transport.hpp"

#include <algorithm>

namespace {

struct CapturedLog {
    QtMsgType type;
    QString message;
};

QVector<CapturedLog> &capturedLogs() {
    static QVector<CapturedLog> logs;
    return logs;
}

void messageHandler(QtMsgType type, const QMessageLogContext &, const QString &message) {
    capturedLogs().push_back(CapturedLog{type, message});
}

bool containsLeftConnecting(const QVector<CapturedLog> &logs) {
    const auto needlePrefix = QStringLiteral("State:");
    return std::any_of(logs.begin(), logs.end(), [&](const CapturedLog &entry) {
        return entry.message.contains(needlePrefix) &&
               !entry.message.contains(QStringLiteral("connecting"));
    });
}

} // namespace

// Restarting an attempt while one is in flight must not report the old one
// as disconnected or failed, and the retired transport must stay silent.
int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    qputenv("ASTV_DEBUG_LINK", "1");
    qInstallMessageHandler(messageHandler);

    astv::network::ConnectionConfig config;
    config.response_timeout = std::chrono::milliseconds(50);

    astv::network::ConnectionService service(
        nullptr, [] { return std::make_unique<astv::network::UdpTransport>(); }, config);

    // Bound but never read, so nothing answers and no ICMP error comes back.
    QUdpSocket mute;
    if (!mute.bind(QHostAddress::LocalHost, 0)) {
        return 3;
    }
    const auto host = QHostAddress::LocalHost;
    const quint16 port = mute.localPort();

    service.connectTo(host, port);

    capturedLogs().clear();
    service.connectTo(host, port);

    QTest::qWait(30);

    if (containsLeftConnecting(capturedLogs())) {
        qInstallMessageHandler(nullptr);
        qCritical().noquote() << "Second connectTo ended the in-progress attempt";
        return 1;
    }
    if (!service.state().isConnecting()) {
        qInstallMessageHandler(nullptr);
        qCritical().noquote() << "Unexpected state" << service.state().toString();
        return 2;
    }

    return 0;
}
