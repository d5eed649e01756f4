#include <catch2/catch_test_macros.hpp>
#include "network/connection_config.hpp"

#include <QSettings>
#include <QTemporaryDir>

using namespace astv::network;
using namespace std::chrono_literals;

TEST_CASE("Config: defaults match the astv peer", "[config]") {
    const ConnectionConfig config;

    REQUIRE(config.response_timeout == 2s);
    REQUIRE(config.discovery_timeout == 5s);
    REQUIRE(config.resolve_timeout == 5s);
    REQUIRE(config.strength_threshold == 5.0f);
    REQUIRE(config.retry_budget == 5);
    REQUIRE(config.strength_window == 5);
    REQUIRE(config.service_port == 1024);
    REQUIRE(config.service_type == QStringLiteral("_astv._udp"));
}

TEST_CASE("Config: loads overrides from the link group", "[config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("astv.ini")), QSettings::IniFormat);

    SECTION("missing keys keep defaults") {
        const auto config = load_connection_config(settings);
        REQUIRE(config.response_timeout == 2s);
        REQUIRE(config.service_port == 1024);
    }

    SECTION("valid values are applied") {
        settings.setValue(QStringLiteral("link/response_timeout_ms"), 250);
        settings.setValue(QStringLiteral("link/retry_budget"), 2);
        settings.setValue(QStringLiteral("link/strength_threshold"), 12.5);
        settings.setValue(QStringLiteral("link/service_port"), 4000);
        settings.setValue(QStringLiteral("link/service_type"), QStringLiteral("_robot._udp"));

        const auto config = load_connection_config(settings);
        REQUIRE(config.response_timeout == 250ms);
        REQUIRE(config.retry_budget == 2);
        REQUIRE(config.strength_threshold == 12.5f);
        REQUIRE(config.service_port == 4000);
        REQUIRE(config.service_type == QStringLiteral("_robot._udp"));
    }

    SECTION("invalid values fall back to defaults") {
        settings.setValue(QStringLiteral("link/response_timeout_ms"), QStringLiteral("soon"));
        settings.setValue(QStringLiteral("link/service_port"), 70000);
        settings.setValue(QStringLiteral("link/strength_threshold"), 150);
        settings.setValue(QStringLiteral("link/strength_window"), 0);

        const auto config = load_connection_config(settings);
        REQUIRE(config.response_timeout == 2s);
        REQUIRE(config.service_port == 1024);
        REQUIRE(config.strength_threshold == 5.0f);
        REQUIRE(config.strength_window == 5);
    }
}

TEST_CASE("Config: saved settings load back", "[config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("astv.ini"));

    ConnectionConfig saved;
    saved.discovery_timeout = 1500ms;
    saved.retry_budget = 0;
    {
        QSettings settings(path, QSettings::IniFormat);
        save_connection_config(settings, saved);
    }

    QSettings settings(path, QSettings::IniFormat);
    const auto loaded = load_connection_config(settings);
    REQUIRE(loaded.discovery_timeout == 1500ms);
    REQUIRE(loaded.retry_budget == 0);
    REQUIRE(loaded.service_port == saved.service_port);
}
