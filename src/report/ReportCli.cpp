#include "report/ReportCli.hpp"

#include <iostream>

#include <QDir>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "data/json_bundle_source.hpp"
#include "engine/coverage_engine.hpp"
#include "engine/day_window.hpp"
#include "engine/trend_cache.hpp"

namespace testline {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  testline-report status --testcase ID [--at ISO] [--bundle DIR] [--format markdown|json]\n"
        "  testline-report snapshot [--release ID]... [--at ISO] [--bundle DIR] [--format markdown|json]\n"
        "  testline-report trend [--release ID]... [--days 7|14|30] [--at ISO] [--bundle DIR] [--format markdown|json]\n"
        "  testline-report coverage [--release ID]... [--bundle DIR] [--format markdown|json]\n"
        "  testline-report requirements [--release ID]... [--at ISO] [--bundle DIR] [--format markdown|json]\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

std::set<std::string> getArgValues(const QStringList &args, const QString &key)
{
    std::set<std::string> values;
    for (int i = 0; i + 1 < args.size(); ++i) {
        if (args.at(i) == key) {
            values.insert(args.at(i + 1).toStdString());
        }
    }
    return values;
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

bool validFormat(const QString &format)
{
    if (format != QStringLiteral("markdown") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return false;
    }
    return true;
}

std::string scopeLabel(const std::set<std::string> &releaseIds)
{
    if (releaseIds.empty()) {
        return "all releases";
    }
    return scopeSignature(releaseIds);
}

void renderSnapshotMarkdown(const AggregateSnapshot &snapshot,
                            const std::set<std::string> &releaseIds,
                            const NormalizationDiagnostics &diagnostics)
{
    std::cout << "# Testline Execution Snapshot\n\n";
    std::cout << "Scope: " << scopeLabel(releaseIds) << "\n";
    std::cout << "As of: " << toIso8601Utc(snapshot.cutoff) << "\n\n";

    std::cout << "## Test Cases\n\n";
    std::cout << "| Passed | Failed | Blocked | Not executed | Total | Pass rate |\n";
    std::cout << "|---|---|---|---|---|---|\n";
    std::cout << "| " << snapshot.passed << " | " << snapshot.failed << " | "
              << snapshot.blocked << " | " << snapshot.notExecuted << " | "
              << snapshot.total << " | " << snapshot.passRate << "% |\n";

    if (snapshot.coverage.has_value()) {
        const auto &coverage = *snapshot.coverage;
        std::cout << "\n## Requirements\n\n";
        std::cout << "- Total: " << coverage.requirementsTotal << "\n";
        std::cout << "- With tests: " << coverage.requirementsWithTests
                  << " (" << coverage.coveragePercentage << "%)\n";
        std::cout << "- Fully tested: " << coverage.requirementsFullyTested
                  << " (" << coverage.fullyTestedPercentage << "%)\n";
        std::cout << "- Linked test cases: " << coverage.testcasesLinked
                  << ", executed: " << coverage.testcasesExecuted << "\n";
    }

    if (diagnostics.malformedSkipped > 0) {
        std::cout << "\nSkipped malformed records: " << diagnostics.malformedSkipped << "\n";
    }
}

void renderTrendMarkdown(const std::vector<AggregateSnapshot> &points,
                         const std::set<std::string> &releaseIds,
                         int offsetMinutes)
{
    std::cout << "# Testline Execution Trend\n\n";
    std::cout << "Scope: " << scopeLabel(releaseIds) << "\n";
    std::cout << "Days: " << points.size() << "\n\n";
    std::cout << "| Day | Passed | Failed | Blocked | Not executed | Pass rate |\n";
    std::cout << "|---|---|---|---|---|---|\n";
    for (const auto &point : points) {
        std::cout << "| " << referenceDayLabel(referenceDayIndex(point.cutoff, offsetMinutes))
                  << " | " << point.passed << " | " << point.failed << " | "
                  << point.blocked << " | " << point.notExecuted << " | "
                  << point.passRate << "% |\n";
    }
}

void renderRequirementsMarkdown(const std::vector<RequirementCoverage> &rows,
                                const std::set<std::string> &releaseIds)
{
    std::cout << "# Testline Requirement Coverage\n\n";
    std::cout << "Scope: " << scopeLabel(releaseIds) << "\n\n";

    if (rows.empty()) {
        std::cout << "No requirements in scope.\n";
        return;
    }

    std::cout << "| Requirement | Linked | Passed | Failed | Blocked | Not executed | Executed | Fully tested |\n";
    std::cout << "|---|---|---|---|---|---|---|---|\n";
    for (const auto &row : rows) {
        std::cout << "| " << row.requirementId;
        if (!row.title.empty()) {
            std::cout << " " << row.title;
        }
        std::cout << " | " << row.linkedTestCases << " | " << row.passed << " | "
                  << row.failed << " | " << row.blocked << " | " << row.notExecuted
                  << " | " << row.executionPercentage << "% | "
                  << (row.fullyTested ? "yes" : "no") << " |\n";
    }
}

} // namespace

int ReportCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    TLOG_INFO(QStringLiteral("ReportCli"),
              QStringLiteral("run"),
              QStringLiteral("report_cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              testline::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"command", command.toStdString()}}));

    try {
        if (command == QStringLiteral("status")) {
            return runStatusReport(args);
        }
        if (command == QStringLiteral("snapshot")) {
            return runSnapshotReport(args);
        }
        if (command == QStringLiteral("trend")) {
            return runTrendReport(args);
        }
        if (command == QStringLiteral("coverage")) {
            return runCoverageReport(args);
        }
        if (command == QStringLiteral("requirements")) {
            return runRequirementsReport(args);
        }
    } catch (const EngineError &ex) {
        std::cerr << "Error (" << toErrorKindString(ex.kind()) << "): " << ex.what() << std::endl;
        return 1;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

std::unique_ptr<CoverageEngine> ReportCli::loadEngine(const QStringList &args) const
{
    EngineConfig config = loadEngineConfig(getArgValue(args, QStringLiteral("--config")));
    const QString bundleDir = getArgValue(args, QStringLiteral("--bundle"));
    if (!bundleDir.isEmpty()) {
        config.bundleDir = bundleDir;
    }
    if (config.bundleDir.isEmpty() || !QDir(config.bundleDir).exists()) {
        std::cerr << "Bundle directory not found. Use --bundle DIR." << std::endl;
        return nullptr;
    }

    std::optional<std::chrono::system_clock::time_point> at;
    const QString atValue = getArgValue(args, QStringLiteral("--at"));
    if (!atValue.isEmpty()) {
        at = parseIso8601(atValue);
        if (!at.has_value()) {
            std::cerr << "Invalid ISO8601 timestamp." << std::endl;
            return nullptr;
        }
    }

    CoverageEngine::Clock clock;
    if (at.has_value()) {
        const auto fixed = *at;
        clock = [fixed] {
            return fixed;
        };
    }

    // One-shot process: nothing to gain from caching trends.
    auto engine = std::make_unique<CoverageEngine>(config, std::make_shared<NullTrendCache>(), clock);
    engine->refresh(JsonBundleSource(config.bundleDir));
    return engine;
}

int ReportCli::runStatusReport(const QStringList &args)
{
    const QString testCaseId = getArgValue(args, QStringLiteral("--testcase"));
    if (testCaseId.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        return 1;
    }

    const auto engine = loadEngine(args);
    if (!engine) {
        return 1;
    }

    const ResolvedStatus status = engine->getCurrentStatus(testCaseId.toStdString());
    TLOG_INFO(QStringLiteral("ReportCli"),
              QStringLiteral("runStatusReport"),
              QStringLiteral("report_status"),
              QStringLiteral("user_invocation"),
              QStringLiteral("resolve"),
              testline::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"testCaseId", status.testCaseId},
                              {"format", format.toStdString()}}));

    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(status).dump(2) << std::endl;
        return 0;
    }

    std::cout << "# Testline Test Case Status\n\n";
    std::cout << "Test case: " << status.testCaseId << "\n";
    std::cout << "Result: " << toResolvedResultString(status.result) << "\n";
    std::cout << "Source: " << toResolvedSourceString(status.source) << "\n";
    std::cout << "As of: " << toIso8601Utc(status.asOf) << "\n";
    if (status.eventTime.has_value()) {
        std::cout << "Event time: " << toIso8601Utc(*status.eventTime) << "\n";
    }
    return 0;
}

int ReportCli::runSnapshotReport(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        return 1;
    }

    const auto engine = loadEngine(args);
    if (!engine) {
        return 1;
    }

    const auto releaseIds = getArgValues(args, QStringLiteral("--release"));
    const AggregateSnapshot snapshot = engine->getAggregateSnapshot(releaseIds);
    const NormalizationDiagnostics diagnostics = engine->diagnostics();

    TLOG_INFO(QStringLiteral("ReportCli"),
              QStringLiteral("runSnapshotReport"),
              QStringLiteral("report_snapshot"),
              QStringLiteral("user_invocation"),
              QStringLiteral("aggregate"),
              testline::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"testCases", snapshot.total},
                              {"format", format.toStdString()}}));

    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["scope"] = scopeSignature(releaseIds);
        payload["snapshot"] = snapshot;
        payload["diagnostics"] = diagnostics;
        std::cout << payload.dump(2) << std::endl;
    } else {
        renderSnapshotMarkdown(snapshot, releaseIds, diagnostics);
    }
    return 0;
}

int ReportCli::runTrendReport(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        return 1;
    }

    int windowDays = 7;
    const QString daysValue = getArgValue(args, QStringLiteral("--days"));
    if (!daysValue.isEmpty()) {
        bool ok = false;
        windowDays = daysValue.toInt(&ok);
        if (!ok || !isSupportedWindow(windowDays)) {
            std::cerr << "Invalid --days. Use 7, 14 or 30." << std::endl;
            return 1;
        }
    }

    const auto engine = loadEngine(args);
    if (!engine) {
        return 1;
    }

    const auto releaseIds = getArgValues(args, QStringLiteral("--release"));
    const auto points = engine->getTrend(releaseIds, windowDays);
    const int offsetMinutes = engine->referenceUtcOffsetMinutes();

    TLOG_INFO(QStringLiteral("ReportCli"),
              QStringLiteral("runTrendReport"),
              QStringLiteral("report_trend"),
              QStringLiteral("user_invocation"),
              QStringLiteral("replay_days"),
              testline::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"windowDays", windowDays},
                              {"format", format.toStdString()}}));

    if (format == QStringLiteral("json")) {
        nlohmann::json pointsJson = nlohmann::json::array();
        for (const auto &point : points) {
            nlohmann::json entry = point;
            entry["day"] = referenceDayLabel(referenceDayIndex(point.cutoff, offsetMinutes));
            pointsJson.push_back(entry);
        }
        nlohmann::json payload;
        payload["scope"] = scopeSignature(releaseIds);
        payload["windowDays"] = windowDays;
        payload["referenceUtcOffsetMinutes"] = offsetMinutes;
        payload["points"] = pointsJson;
        std::cout << payload.dump(2) << std::endl;
    } else {
        renderTrendMarkdown(points, releaseIds, offsetMinutes);
    }
    return 0;
}

int ReportCli::runCoverageReport(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        return 1;
    }

    const auto engine = loadEngine(args);
    if (!engine) {
        return 1;
    }

    const auto releaseIds = getArgValues(args, QStringLiteral("--release"));
    const CoverageSummary coverage = engine->getCoverage(releaseIds);
    const AutomationSummary automation = engine->getAutomationSummary(releaseIds);

    TLOG_INFO(QStringLiteral("ReportCli"),
              QStringLiteral("runCoverageReport"),
              QStringLiteral("report_coverage"),
              QStringLiteral("user_invocation"),
              QStringLiteral("aggregate"),
              testline::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"requirements", coverage.total},
                              {"format", format.toStdString()}}));

    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["scope"] = scopeSignature(releaseIds);
        payload["coverage"] = coverage;
        payload["automation"] = automation;
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }

    std::cout << "# Testline Coverage\n\n";
    std::cout << "Scope: " << scopeLabel(releaseIds) << "\n\n";
    std::cout << "- Requirements covered: " << coverage.covered << " of " << coverage.total
              << " (" << coverage.percentage << "%)\n";
    std::cout << "- Requirements without tests: " << coverage.notCovered << "\n";
    std::cout << "- Automations: " << automation.total << ", with a run: " << automation.withRun
              << ", passing: " << automation.passing
              << " (" << automation.passPercentage << "%)\n";
    return 0;
}

int ReportCli::runRequirementsReport(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        return 1;
    }

    const auto engine = loadEngine(args);
    if (!engine) {
        return 1;
    }

    const auto releaseIds = getArgValues(args, QStringLiteral("--release"));
    const auto rows = engine->getRequirementBreakdown(releaseIds);

    TLOG_INFO(QStringLiteral("ReportCli"),
              QStringLiteral("runRequirementsReport"),
              QStringLiteral("report_requirements"),
              QStringLiteral("user_invocation"),
              QStringLiteral("aggregate"),
              testline::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"requirements", rows.size()},
                              {"format", format.toStdString()}}));

    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["scope"] = scopeSignature(releaseIds);
        payload["requirements"] = rows;
        std::cout << payload.dump(2) << std::endl;
    } else {
        renderRequirementsMarkdown(rows, releaseIds);
    }
    return 0;
}

std::optional<std::chrono::system_clock::time_point> ReportCli::parseIso8601(
    const QString &value) const
{
    return testline::parseIso8601(value.toStdString());
}

} // namespace testline
