#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace testline {

using TimePoint = std::chrono::system_clock::time_point;

struct TestCase {
    std::string id;
    std::string title;
    std::set<std::string> requirementIds;
    std::set<std::string> releaseIds;
};

struct Requirement {
    std::string id;
    std::string title;
    std::optional<std::string> releaseId;
};

struct Release {
    std::string id;
    std::string name;
};

// Raw manual execution as the executions service reports it. Every field
// the upstream may omit is optional; the normalizer decides the fallback.
struct ManualExecutionRecord {
    std::string id;
    std::string testCaseId;
    std::optional<std::string> releaseId;
    std::optional<std::string> result;
    std::optional<TimePoint> executionDate;
    std::optional<TimePoint> createdAt;
    std::optional<TimePoint> updatedAt;
};

// Raw automation record. Only the latest run is known upstream.
struct AutomationRecord {
    std::string id;
    std::string testCaseId;
    std::optional<std::string> releaseId;
    std::optional<std::string> status;
    std::optional<std::string> lastRunResult;
    std::optional<TimePoint> lastRunDate;
    std::optional<TimePoint> updatedAt;
};

struct RecordSet {
    std::vector<TestCase> testCases;
    std::vector<Requirement> requirements;
    std::vector<Release> releases;
    std::vector<ManualExecutionRecord> manualExecutions;
    std::vector<AutomationRecord> automations;
    // Entries the source could not read as a record at all.
    std::vector<std::string> rejectedRecordIds;
};

struct StatusEvent {
    std::string testCaseId;
    std::string recordId;
    EventSource source = EventSource::Manual;
    ExecutionResult result = ExecutionResult::Skipped;
    TimePoint effectiveTime;
    TimePoint tiebreakTime;
};

inline bool operator==(const StatusEvent &a, const StatusEvent &b)
{
    return a.testCaseId == b.testCaseId
        && a.recordId == b.recordId
        && a.source == b.source
        && a.result == b.result
        && a.effectiveTime == b.effectiveTime
        && a.tiebreakTime == b.tiebreakTime;
}

inline bool operator!=(const StatusEvent &a, const StatusEvent &b)
{
    return !(a == b);
}

struct ResolvedStatus {
    std::string testCaseId;
    ResolvedResult result = ResolvedResult::NotExecuted;
    ResolvedSource source = ResolvedSource::None;
    TimePoint asOf;
    // Effective time of the winning event, when there is one.
    std::optional<TimePoint> eventTime;
};

struct CoverageMetrics {
    int requirementsTotal = 0;
    int requirementsWithTests = 0;
    int requirementsFullyTested = 0;
    int testcasesLinked = 0;
    int testcasesExecuted = 0;
    int coveragePercentage = 0;
    int fullyTestedPercentage = 0;
    std::vector<std::string> fullyTestedRequirementIds;
};

struct AggregateSnapshot {
    TimePoint cutoff;
    int passed = 0;
    int failed = 0;
    int blocked = 0;
    int notExecuted = 0;
    int total = 0;
    int executed = 0;
    int passRate = 0;
    // Only the point-in-time snapshot carries coverage; trend points do not.
    std::optional<CoverageMetrics> coverage;
};

struct CoverageSummary {
    int covered = 0;
    int notCovered = 0;
    int total = 0;
    int percentage = 0;
};

struct RequirementCoverage {
    std::string requirementId;
    std::string title;
    int linkedTestCases = 0;
    int passed = 0;
    int failed = 0;
    int blocked = 0;
    int notExecuted = 0;
    int executed = 0;
    int executionPercentage = 0;
    bool covered = false;
    bool fullyTested = false;
};

struct AutomationSummary {
    int total = 0;
    int withRun = 0;
    int passing = 0;
    int passPercentage = 0;
};

struct NormalizationDiagnostics {
    int manualEvents = 0;
    int automatedEvents = 0;
    int manualDateFallbacks = 0;
    int manualResultDefaulted = 0;
    int automationsWithoutRun = 0;
    int malformedSkipped = 0;
    std::vector<std::string> malformedRecordIds;
};

} // namespace testline
