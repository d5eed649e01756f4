#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QHostAddress>
#include <QLoggingCategory>
#include <QSettings>
#include <QSocketNotifier>
#include <QTextStream>
#include <QThread>

#include <memory>
#include <optional>
#include <utility>
#include <unistd.h>

#include "app/command_reader.hpp"
#include "app/logging.hpp"
#include "network/connection_config.hpp"
#include "network/connection_service.hpp"
#include "network/discovery.hpp"
#include "network/udp_transport.hpp"

using astv::network::ConnectionConfig;
using astv::network::ConnectionService;
using astv::network::ConnectionState;
using astv::network::DiscoveryBackend;
using astv::network::Message;

namespace {

QTextStream& out() {
    static QTextStream stream(stdout);
    return stream;
}

// Owns the link objects on the worker thread. Everything in here is created,
// used and destroyed on that thread.
struct LinkRuntime {
    QThread worker;
    QObject anchor;
    std::unique_ptr<DiscoveryBackend> discovery;
    std::unique_ptr<ConnectionService> service;

    void start(const ConnectionConfig& config) {
        worker.setObjectName(QStringLiteral("astv-link-worker"));
        worker.start();
        anchor.moveToThread(&worker);
        QMetaObject::invokeMethod(&anchor, [this, config] {
            discovery = astv::network::createDiscoveryBackend();
            service = std::make_unique<ConnectionService>(
                discovery.get(),
                [] { return std::make_unique<astv::network::UdpTransport>(); },
                config);
        }, Qt::BlockingQueuedConnection);
    }

    template<typename F>
    void post(F&& f) {
        QMetaObject::invokeMethod(service.get(), std::forward<F>(f), Qt::QueuedConnection);
    }

    void stop() {
        if (!worker.isRunning()) return;
        QMetaObject::invokeMethod(&anchor, [this] {
            if (service) service->close();
            service.reset();
            discovery.reset();
        }, Qt::BlockingQueuedConnection);
        worker.quit();
        worker.wait();
    }
};

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("astv-link");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("astv");
    app.setOrganizationDomain("astv.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Discover an astv peer, connect to it and forward movement commands "
                       "read from stdin (up, down, left, right, disconnect, retry, quit)."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption serviceOption(
        QStringList{QStringLiteral("s"), QStringLiteral("service")},
        QStringLiteral("DNS-SD service type to browse for (default _astv._udp)."),
        QStringLiteral("type"));
    parser.addOption(serviceOption);

    const QCommandLineOption hostOption(
        QStringList{QStringLiteral("host")},
        QStringLiteral("Connect directly to this IPv4 address instead of browsing."),
        QStringLiteral("address"));
    parser.addOption(hostOption);

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("p"), QStringLiteral("port")},
        QStringLiteral("Peer port used with --host (default 1024)."),
        QStringLiteral("port"));
    parser.addOption(portOption);

    const QCommandLineOption configOption(
        QStringList{QStringLiteral("config")},
        QStringLiteral("Read link settings from this INI file."),
        QStringLiteral("path"));
    parser.addOption(configOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Write the log here instead of the default location."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption debugLinkOption(
        QStringList{QStringLiteral("debug-link")},
        QStringLiteral("Enable link debug logging (also sets ASTV_DEBUG_LINK=1)."));
    parser.addOption(debugLinkOption);

    parser.process(app);

    const bool debugLink = parser.isSet(debugLinkOption) || qEnvironmentVariableIsSet("ASTV_DEBUG_LINK");
    if (debugLink) {
        qputenv("ASTV_DEBUG_LINK", "1");
        QLoggingCategory::setFilterRules(QStringLiteral("astv.*.debug=true\n"));
    }

    astv::app::install_file_logging(parser.value(logFileOption));
    qInfo() << "astv-link: logging to" << astv::app::active_log_file_path();
    if (debugLink) {
        qInfo() << "astv-link: link debug enabled";
    }

    std::unique_ptr<QSettings> settings = parser.isSet(configOption)
        ? std::make_unique<QSettings>(parser.value(configOption), QSettings::IniFormat)
        : std::make_unique<QSettings>();
    auto config = astv::network::load_connection_config(*settings);
    if (parser.isSet(serviceOption)) {
        config.service_type = parser.value(serviceOption).trimmed();
    }

    std::optional<QHostAddress> host;
    quint16 port = config.service_port;
    if (parser.isSet(hostOption)) {
        const QHostAddress parsed(parser.value(hostOption).trimmed());
        if (parsed.isNull() || parsed.protocol() != QAbstractSocket::IPv4Protocol) {
            QTextStream(stderr) << "Invalid IPv4 address: " << parser.value(hostOption) << '\n';
            return 1;
        }
        host = parsed;
    }
    if (parser.isSet(portOption)) {
        bool ok = false;
        const auto value = parser.value(portOption).toUShort(&ok);
        if (!ok || value == 0) {
            QTextStream(stderr) << "Invalid port: " << parser.value(portOption) << '\n';
            return 1;
        }
        port = value;
    }

    LinkRuntime runtime;
    runtime.start(config);

    QObject::connect(runtime.service.get(), &ConnectionService::stateChanged, &app,
                     [](const ConnectionState& state) {
                         out() << "state: " << state.toString();
                         if (const auto reason = state.reason()) {
                             out() << " - " << astv::network::describe(*reason);
                         }
                         out() << Qt::endl;
                     });
    QObject::connect(runtime.service.get(), &ConnectionService::strengthChanged, &app,
                     [](float percent) {
                         out() << "strength: " << QString::number(percent, 'f', 1) << "%" << Qt::endl;
                     });

    auto* service = runtime.service.get();
    const auto begin = [&runtime, service, host, port, type = config.service_type] {
        runtime.post([service, host, port, type] {
            if (host) {
                service->connectTo(*host, port);
            } else {
                service->discover(type);
            }
        });
    };
    begin();

    // Opened on the descriptor so no stdio buffer hides lines from the notifier.
    QFile input;
    if (!input.open(STDIN_FILENO, QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "astv-link: cannot read stdin";
    }

    const auto handleLine = [&](const QString& line) {
        if (line == QStringLiteral("quit") || line == QStringLiteral("exit")) {
            QCoreApplication::quit();
            return;
        }
        if (line == QStringLiteral("retry")) {
            begin();
            return;
        }
        if (line == QStringLiteral("disconnect")) {
            runtime.post([service] { service->close(); });
            return;
        }

        const auto message = astv::network::message_from_name(line);
        if (!message) {
            out() << "unknown command: " << line << Qt::endl;
            return;
        }
        runtime.post([service, m = *message] { service->send(m); });
    };

    astv::app::CommandReader reader(&input);
    QSocketNotifier notifier(STDIN_FILENO, QSocketNotifier::Read);
    QObject::connect(&notifier, &QSocketNotifier::activated,
                     &reader, &astv::app::CommandReader::readAvailable);
    QObject::connect(&reader, &astv::app::CommandReader::lineRead, &app, handleLine);
    QObject::connect(&reader, &astv::app::CommandReader::finished, &app, [&] {
        notifier.setEnabled(false);
        QCoreApplication::quit();
    });

    const int rc = app.exec();
    runtime.stop();
    return rc;
}
