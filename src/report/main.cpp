#include <QCoreApplication>

#include "report/ReportCli.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    bool trace = qEnvironmentVariableIntValue("TESTLINE_TRACE") == 1;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    testline::logging::initLogging(QStringLiteral("testline-report"), trace);
    TLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("report_cli_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              testline::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"args", filteredArgs.size()}}));

    testline::ReportCli cli;
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
