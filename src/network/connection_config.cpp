#include "network/connection_config.hpp"
#include "network/log.hpp"

#include <QSettings>

namespace astv::network {

namespace {

constexpr const char* kResponseTimeout = "link/response_timeout_ms";
constexpr const char* kDiscoveryTimeout = "link/discovery_timeout_ms";
constexpr const char* kResolveTimeout = "link/resolve_timeout_ms";
constexpr const char* kStrengthThreshold = "link/strength_threshold";
constexpr const char* kRetryBudget = "link/retry_budget";
constexpr const char* kStrengthWindow = "link/strength_window";
constexpr const char* kServicePort = "link/service_port";
constexpr const char* kServiceType = "link/service_type";

// Reads an integer in [min, max]; anything else keeps `fallback`.
qint64 read_int(QSettings& settings, const char* key, qint64 fallback, qint64 min, qint64 max) {
    const QString k = QString::fromLatin1(key);
    if (!settings.contains(k)) {
        return fallback;
    }
    bool ok = false;
    const qint64 value = settings.value(k).toLongLong(&ok);
    if (!ok || value < min || value > max) {
        qCWarning(astvLinkLog) << "Config: ignoring invalid" << k << "=" << settings.value(k);
        return fallback;
    }
    return value;
}

} // namespace

ConnectionConfig load_connection_config(QSettings& settings) {
    ConnectionConfig config;

    config.response_timeout = std::chrono::milliseconds(
        read_int(settings, kResponseTimeout, config.response_timeout.count(), 1, 600000));
    config.discovery_timeout = std::chrono::milliseconds(
        read_int(settings, kDiscoveryTimeout, config.discovery_timeout.count(), 1, 600000));
    config.resolve_timeout = std::chrono::milliseconds(
        read_int(settings, kResolveTimeout, config.resolve_timeout.count(), 1, 600000));
    config.retry_budget = static_cast<int>(
        read_int(settings, kRetryBudget, config.retry_budget, 0, 1000));
    config.strength_window = static_cast<int>(
        read_int(settings, kStrengthWindow, config.strength_window, 1, 1000));
    config.service_port = static_cast<uint16_t>(
        read_int(settings, kServicePort, config.service_port, 1, 65535));

    const QString threshold_key = QString::fromLatin1(kStrengthThreshold);
    if (settings.contains(threshold_key)) {
        bool ok = false;
        const float threshold = settings.value(threshold_key).toFloat(&ok);
        if (ok && threshold >= 0.0f && threshold <= 100.0f) {
            config.strength_threshold = threshold;
        } else {
            qCWarning(astvLinkLog) << "Config: ignoring invalid" << threshold_key
                                   << "=" << settings.value(threshold_key);
        }
    }

    const auto service_type = settings.value(QString::fromLatin1(kServiceType)).toString().trimmed();
    if (!service_type.isEmpty()) {
        config.service_type = service_type;
    }

    return config;
}

void save_connection_config(QSettings& settings, const ConnectionConfig& config) {
    settings.setValue(QString::fromLatin1(kResponseTimeout),
                      static_cast<qint64>(config.response_timeout.count()));
    settings.setValue(QString::fromLatin1(kDiscoveryTimeout),
                      static_cast<qint64>(config.discovery_timeout.count()));
    settings.setValue(QString::fromLatin1(kResolveTimeout),
                      static_cast<qint64>(config.resolve_timeout.count()));
    settings.setValue(QString::fromLatin1(kStrengthThreshold), config.strength_threshold);
    settings.setValue(QString::fromLatin1(kRetryBudget), config.retry_budget);
    settings.setValue(QString::fromLatin1(kStrengthWindow), config.strength_window);
    settings.setValue(QString::fromLatin1(kServicePort), config.service_port);
    settings.setValue(QString::fromLatin1(kServiceType), config.service_type);
}

} // namespace astv::network
