#include <catch2/catch_test_macros.hpp>
#include "app/logging.hpp"
#include "network/log.hpp"

#include <QFile>
#include <QTemporaryDir>

TEST_CASE("Logging: file handler writes category-tagged lines", "[logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("logs/astv-link.log"));

    astv::app::install_file_logging(path);
    REQUIRE(astv::app::active_log_file_path() == path);

    qCInfo(astvLinkLog) << "State: connecting";
    qCDebug(astvLinkLog) << "filtered out by default";

    // Stop writing before reading the file back.
    qInstallMessageHandler(nullptr);

    QFile file(path);
    REQUIRE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const auto contents = QString::fromUtf8(file.readAll());
    REQUIRE(contents.contains(QStringLiteral(" I astv.link State: connecting")));
    REQUIRE_FALSE(contents.contains(QStringLiteral("filtered out")));
}

TEST_CASE("Logging: default path lives under app data", "[logging]") {
    const auto path = astv::app::default_log_file_path();
    REQUIRE(path.endsWith(QStringLiteral("logs/astv-link.log")));
}
