#pragma once

#include <QString>
#include <chrono>
#include <cstdint>

class QSettings;

namespace astv::network {

/**
 * ConnectionConfig - tunables for ConnectionService.
 *
 * Defaults reproduce the reference peer's expectations; settings live under
 * the "link/" group.
 */
struct ConnectionConfig {
    static constexpr const char* DEFAULT_SERVICE_TYPE = "_astv._udp";
    static constexpr uint16_t DEFAULT_SERVICE_PORT = 1024;

    /// How long a send waits for any reply before the strength is sampled as 0.
    std::chrono::milliseconds response_timeout{2000};
    std::chrono::milliseconds discovery_timeout{5000};
    std::chrono::milliseconds resolve_timeout{5000};

    /// Below this average strength (percent) the link is considered lost.
    float strength_threshold = 5.0f;

    /// Extra discover greetings sent before giving up on the handshake.
    int retry_budget = 5;

    /// Samples in the rolling strength window.
    int strength_window = 5;

    /// Port the resolved service is contacted on.
    uint16_t service_port = DEFAULT_SERVICE_PORT;

    QString service_type = QString::fromLatin1(DEFAULT_SERVICE_TYPE);
};

/**
 * Read the "link/" group. Missing keys keep their defaults; invalid values
 * are logged and replaced by defaults.
 */
[[nodiscard]] ConnectionConfig load_connection_config(QSettings& settings);

void save_connection_config(QSettings& settings, const ConnectionConfig& config);

} // namespace astv::network
