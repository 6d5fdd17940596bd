#pragma once

#include <memory>

#include <QObject>
#include <QString>

class QCommandLineParser;

#include "common/config.hpp"
#include "data/record_source.hpp"
#include "engine/coverage_engine.hpp"

namespace testline {

class TestlineApiServer;

// Command-line settings of testline-service.
struct ServiceOptions {
    bool trace = false;
    // Empty means built-in defaults plus TESTLINE_* overrides.
    QString configPath;
};

// Registers --trace and --config <path> on parser.
void addServiceOptions(QCommandLineParser &parser);

// Reads the options back after parsing. TESTLINE_TRACE=1 also turns trace
// on; TESTLINE_CONFIG is used when --config is absent.
ServiceOptions serviceOptionsFrom(const QCommandLineParser &parser);

/**
 * TestlineService coordinates:
 * - periodic re-reads of the record source into the CoverageEngine
 * - the local RPC server answering dashboard queries
 *
 * A failed refresh keeps serving the last good dataset. After
 * kMaxConsecutiveErrors failures in a row the next kBackoffCycles refresh
 * ticks are skipped.
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 */
class TestlineService : public QObject
{
    Q_OBJECT
public:
    static constexpr int kMaxConsecutiveErrors = 3;
    static constexpr int kBackoffCycles = 2;

    // source may be null, in which case config.bundleDir (if set) is read.
    explicit TestlineService(const EngineConfig &config,
                             std::unique_ptr<RecordSource> source = nullptr,
                             QObject *parent = nullptr);
    ~TestlineService() override;

    // Starts the RPC server and the refresh timer. Returns false when the
    // socket cannot be bound.
    bool start();

    CoverageEngine &engine();
    TestlineApiServer *apiServer() const;

    int consecutiveErrors() const;
    int backoffCyclesRemaining() const;

public slots:
    void runRefreshCycle();

private:
    EngineConfig m_config;
    std::unique_ptr<RecordSource> m_source;
    std::unique_ptr<CoverageEngine> m_engine;
    std::unique_ptr<TestlineApiServer> m_apiServer;

    int m_errorCount = 0;
    int m_backoffCycles = 0;
};

} // namespace testline
