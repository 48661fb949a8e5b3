#include <QCoreApplication>
#include <QDir>
#include <QStandardPaths>
#include <catch2/catch_session.hpp>

#include "crypto/random.hpp"

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("tally");
    QCoreApplication::setOrganizationDomain("tally.local");
    QCoreApplication::setApplicationName("tally_tests");
    const auto testHome = QDir::tempPath() + QStringLiteral("/tally_tests_home");
    QDir().mkpath(testHome);
    qputenv("HOME", testHome.toUtf8());
    QStandardPaths::setTestModeEnabled(true);
    if (tally::crypto::init().is_err()) {
        return 1;
    }
    Catch::Session session;
    return session.run(argc, argv);
}
