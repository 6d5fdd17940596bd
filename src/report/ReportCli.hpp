#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include <QString>
#include <QStringList>

namespace testline {

class CoverageEngine;

class ReportCli
{
public:
    // CLI dispatcher for status, snapshot, trend and coverage reports.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    // Each subcommand loads the record bundle once and renders the result
    // in the chosen format.
    int runStatusReport(const QStringList &args);
    int runSnapshotReport(const QStringList &args);
    int runTrendReport(const QStringList &args);
    int runCoverageReport(const QStringList &args);
    int runRequirementsReport(const QStringList &args);

    // Builds an engine over --bundle (or the configured bundle dir) whose
    // clock reads --at when given. Prints the error and returns null on
    // failure.
    std::unique_ptr<CoverageEngine> loadEngine(const QStringList &args) const;

    std::optional<std::chrono::system_clock::time_point> parseIso8601(
        const QString &value) const;
};

} // namespace testline
