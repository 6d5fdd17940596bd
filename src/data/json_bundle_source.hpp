#pragma once

#include <map>
#include <mutex>
#include <string>

#include <QString>

#include <nlohmann/json.hpp>

#include "data/record_source.hpp"

namespace testline {

/**
 * RecordSource over a directory of JSON exports:
 *   testcases.json, requirements.json, releases.json,
 *   executions.json, automations.json
 * Each file holds an array of upstream records. A missing file is an empty
 * list; a file that cannot be parsed as a JSON array is an
 * EngineError(InvalidRequest). Entries that are not readable records are
 * dropped and reported through rejectedRecordIds().
 */
class JsonBundleSource : public RecordSource
{
public:
    explicit JsonBundleSource(const QString &directory);

    std::vector<TestCase> listTestCases() const override;
    std::vector<Requirement> listRequirements() const override;
    std::vector<Release> listReleases() const override;
    std::vector<ManualExecutionRecord> listManualExecutions() const override;
    std::vector<AutomationRecord> listAutomations() const override;
    std::vector<std::string> rejectedRecordIds() const override;

    const QString &directory() const;

    static const char *testCasesFile();
    static const char *requirementsFile();
    static const char *releasesFile();
    static const char *executionsFile();
    static const char *automationsFile();

private:
    nlohmann::json readArray(const char *fileName) const;

    template <typename T>
    std::vector<T> readRecords(const char *fileName) const;

    QString m_directory;

    // Rejected entries of the last read, per file.
    mutable std::mutex m_rejectedMutex;
    mutable std::map<std::string, std::vector<std::string>> m_rejectedByFile;
};

} // namespace testline
