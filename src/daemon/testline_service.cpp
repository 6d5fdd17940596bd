#include "daemon/testline_service.hpp"

#include <chrono>

#include <QCommandLineParser>
#include <QTimer>
#include <QDebug>
#include <QUuid>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/testline_version.hpp"
#include "daemon/testline_api_server.hpp"
#include "data/json_bundle_source.hpp"

namespace testline {

void addServiceOptions(QCommandLineParser &parser)
{
    parser.addOption(QCommandLineOption(QStringList() << "trace",
                                        "Enable verbose trace logging."));
    parser.addOption(QCommandLineOption(QStringList() << "config",
                                        "Read engine settings from a JSON file.",
                                        "path"));
}

ServiceOptions serviceOptionsFrom(const QCommandLineParser &parser)
{
    ServiceOptions options;
    options.trace = parser.isSet(QStringLiteral("trace"))
        || qEnvironmentVariableIntValue("TESTLINE_TRACE") == 1;
    options.configPath = parser.isSet(QStringLiteral("config"))
        ? parser.value(QStringLiteral("config"))
        : qEnvironmentVariable("TESTLINE_CONFIG");
    return options;
}

TestlineService::TestlineService(const EngineConfig &config,
                                 std::unique_ptr<RecordSource> source,
                                 QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_source(std::move(source))
    , m_engine(std::make_unique<CoverageEngine>(config))
{
    if (!m_source && !m_config.bundleDir.isEmpty()) {
        m_source = std::make_unique<JsonBundleSource>(m_config.bundleDir);
    }
}

TestlineService::~TestlineService() = default;

CoverageEngine &TestlineService::engine()
{
    return *m_engine;
}

TestlineApiServer *TestlineService::apiServer() const
{
    return m_apiServer.get();
}

int TestlineService::consecutiveErrors() const
{
    return m_errorCount;
}

int TestlineService::backoffCyclesRemaining() const
{
    return m_backoffCycles;
}

bool TestlineService::start()
{
    qInfo() << "Testline: service starting (version" << TESTLINE_VERSION << ")";

    if (!m_source) {
        qWarning() << "Testline: no record bundle configured; serving an empty dataset.";
    }

    if (!m_apiServer) {
        m_apiServer = std::make_unique<TestlineApiServer>(*m_engine, m_config.socketName);
        if (!m_apiServer->start()) {
            return false;
        }
    }

    auto *timer = new QTimer(this);
    timer->setInterval(m_config.refreshIntervalSeconds * 1000);
    connect(timer, &QTimer::timeout, this, &TestlineService::runRefreshCycle);
    timer->start();

    runRefreshCycle();
    return true;
}

void TestlineService::runRefreshCycle()
{
    if (!m_source) {
        return;
    }
    if (m_backoffCycles > 0) {
        --m_backoffCycles;
        return;
    }

    testline::logging::CorrelationScope cycleScope(QUuid::createUuid().toString(QUuid::WithoutBraces));
    const auto cycleStart = std::chrono::steady_clock::now();
    try {
        m_engine->refresh(*m_source);
        m_errorCount = 0;
        // Skipped records already logged a WARN each; surface the tally at INFO.
        const bool noisy = cycleScope.warnings() > 0 || cycleScope.errors() > 0;
        testline::logging::logEvent(noisy ? testline::logging::LogLevel::Info
                                          : testline::logging::LogLevel::Debug,
                                    testline::logging::defaultProcessName(),
                                    QStringLiteral("TestlineService"),
                                    QStringLiteral("runRefreshCycle"),
                                    QStringLiteral("refresh_cycle_complete"),
                                    QStringLiteral("timer"),
                                    QStringLiteral("reload_bundle"),
                                    testline::logging::defaultWho(),
                                    QString(),
                                    (nlohmann::json{{"durationMs",
                                                     std::chrono::duration_cast<std::chrono::milliseconds>(
                                                         std::chrono::steady_clock::now() - cycleStart).count()},
                                                    {"warnings", cycleScope.warnings()},
                                                    {"errors", cycleScope.errors()}}));
    } catch (const EngineError &ex) {
        if (m_errorCount == 0) {
            qWarning() << "Testline: refresh failed; keeping the last good dataset.";
        }
        TLOG_WARN(QStringLiteral("TestlineService"),
                  QStringLiteral("runRefreshCycle"),
                  QStringLiteral("refresh_failed"),
                  QString::fromStdString(toErrorKindString(ex.kind())),
                  QStringLiteral("keep_dataset"),
                  testline::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"what", ex.what()}, {"consecutiveErrors", m_errorCount + 1}}));
        m_errorCount++;
        if (m_errorCount >= kMaxConsecutiveErrors) {
            qWarning() << "Testline: refresh failed repeatedly, backing off.";
            m_backoffCycles = kBackoffCycles;
            m_errorCount = 0;
        }
    }
}

} // namespace testline
