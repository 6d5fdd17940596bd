#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/testline_version.hpp"
#include "daemon/testline_service.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("testline-service"));
    QCoreApplication::setApplicationVersion(QStringLiteral(TESTLINE_VERSION));
    qInfo() << "Testline service starting...";

    QCommandLineParser parser;
    parser.addHelpOption();
    parser.addVersionOption();
    testline::addServiceOptions(parser);
    parser.process(app);

    const testline::ServiceOptions options = testline::serviceOptionsFrom(parser);
    const QString &configPath = options.configPath;
    testline::logging::initLogging(QStringLiteral("testline-service"), options.trace);

    testline::EngineConfig config;
    try {
        config = testline::loadEngineConfig(configPath);
    } catch (const testline::EngineError &ex) {
        qCritical() << "Testline: cannot load config:" << ex.what();
        TLOG_ERROR(QStringLiteral("main"),
                   QStringLiteral("main"),
                   QStringLiteral("config_load_failed"),
                   QStringLiteral("invalid_config"),
                   QStringLiteral("exit"),
                   testline::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", configPath.toStdString()}, {"what", ex.what()}}));
        return 1;
    }

    TLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("service_start"),
              QStringLiteral("user_start"),
              configPath.isEmpty() ? QStringLiteral("default_config") : QStringLiteral("config_file"),
              testline::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"bundleDir", config.bundleDir.toStdString()},
                              {"socket", config.socketName.toStdString()},
                              {"referenceUtcOffsetMinutes", config.referenceUtcOffsetMinutes}}));

    // The service lives for the lifetime of the process.
    testline::TestlineService service(config);
    if (!service.start()) {
        return 1;
    }

    return app.exec();
}
