#include "engine/aggregator.hpp"

#include <algorithm>

namespace testline {

namespace {

using LinkedTestCases = std::map<std::string, std::vector<std::string>>;

ResolvedStatus statusOf(const std::string &testCaseId,
                        TimePoint cutoff,
                        const TimelineIndex &timelines)
{
    auto it = timelines.find(testCaseId);
    if (it == timelines.end()) {
        ResolvedStatus status;
        status.testCaseId = testCaseId;
        status.asOf = cutoff;
        return status;
    }
    return it->second.statusAt(cutoff);
}

bool isExecuted(ResolvedResult result)
{
    return result == ResolvedResult::Passed
        || result == ResolvedResult::Failed
        || result == ResolvedResult::Blocked;
}

void countResult(AggregateSnapshot &snapshot, ResolvedResult result)
{
    switch (result) {
    case ResolvedResult::Passed:
        snapshot.passed++;
        break;
    case ResolvedResult::Failed:
        snapshot.failed++;
        break;
    case ResolvedResult::Blocked:
        snapshot.blocked++;
        break;
    case ResolvedResult::Skipped:
    case ResolvedResult::NotExecuted:
        snapshot.notExecuted++;
        break;
    }
}

// Requirement id -> in-scope test cases that link it.
LinkedTestCases linkTestCases(const Scope &scope, const std::vector<TestCase> &testCases)
{
    LinkedTestCases linked;
    for (const auto &testCase : testCases) {
        if (scope.testCaseIds.count(testCase.id) == 0) {
            continue;
        }
        for (const auto &requirementId : testCase.requirementIds) {
            if (scope.requirementIds.count(requirementId) > 0) {
                linked[requirementId].push_back(testCase.id);
            }
        }
    }
    return linked;
}

const std::vector<std::string> &linkedFor(const LinkedTestCases &linked,
                                          const std::string &requirementId)
{
    static const std::vector<std::string> kNone;
    auto it = linked.find(requirementId);
    return it == linked.end() ? kNone : it->second;
}

} // namespace

TimelineIndex buildTimelines(const EventsByTestCase &events, SourceTiePolicy policy)
{
    TimelineIndex timelines;
    for (const auto &[testCaseId, testCaseEvents] : events) {
        timelines.emplace(testCaseId, EventTimeline(testCaseId, testCaseEvents, policy));
    }
    return timelines;
}

int percentage(int numerator, int denominator)
{
    if (denominator <= 0 || numerator <= 0) {
        return 0;
    }
    // Integer round-half-up of 100 * n / d.
    const long long n = numerator;
    const long long d = denominator;
    return static_cast<int>((200 * n + d) / (2 * d));
}

AggregateSnapshot aggregateStatuses(const std::set<std::string> &testCaseIds,
                                    TimePoint cutoff,
                                    const TimelineIndex &timelines)
{
    AggregateSnapshot snapshot;
    snapshot.cutoff = cutoff;
    for (const auto &testCaseId : testCaseIds) {
        countResult(snapshot, statusOf(testCaseId, cutoff, timelines).result);
    }
    snapshot.total = static_cast<int>(testCaseIds.size());
    snapshot.executed = snapshot.passed + snapshot.failed + snapshot.blocked;
    snapshot.passRate = percentage(snapshot.passed, snapshot.total);
    return snapshot;
}

AggregateSnapshot aggregate(const Scope &scope,
                            TimePoint cutoff,
                            const TimelineIndex &timelines,
                            const std::vector<TestCase> &testCases,
                            const std::vector<Requirement> &requirements)
{
    AggregateSnapshot snapshot;
    snapshot.cutoff = cutoff;

    std::map<std::string, ResolvedResult> results;
    for (const auto &testCaseId : scope.testCaseIds) {
        const ResolvedResult result = statusOf(testCaseId, cutoff, timelines).result;
        results.emplace(testCaseId, result);
        countResult(snapshot, result);
    }
    snapshot.total = static_cast<int>(scope.testCaseIds.size());
    snapshot.executed = snapshot.passed + snapshot.failed + snapshot.blocked;
    snapshot.passRate = percentage(snapshot.passed, snapshot.total);

    const LinkedTestCases linked = linkTestCases(scope, testCases);
    CoverageMetrics coverage;
    for (const auto &requirement : requirements) {
        if (scope.requirementIds.count(requirement.id) == 0) {
            continue;
        }
        coverage.requirementsTotal++;

        const auto &linkedIds = linkedFor(linked, requirement.id);
        if (linkedIds.empty()) {
            continue;
        }
        coverage.requirementsWithTests++;
        coverage.testcasesLinked += static_cast<int>(linkedIds.size());

        bool allPassed = true;
        for (const auto &testCaseId : linkedIds) {
            const ResolvedResult result = results.at(testCaseId);
            if (isExecuted(result)) {
                coverage.testcasesExecuted++;
            }
            if (result != ResolvedResult::Passed) {
                allPassed = false;
            }
        }
        if (allPassed) {
            coverage.requirementsFullyTested++;
            coverage.fullyTestedRequirementIds.push_back(requirement.id);
        }
    }
    coverage.coveragePercentage =
        percentage(coverage.requirementsWithTests, coverage.requirementsTotal);
    coverage.fullyTestedPercentage =
        percentage(coverage.requirementsFullyTested, coverage.requirementsTotal);

    snapshot.coverage = coverage;
    return snapshot;
}

CoverageSummary computeCoverage(const Scope &scope,
                                const std::vector<TestCase> &testCases,
                                const std::vector<Requirement> &requirements)
{
    const LinkedTestCases linked = linkTestCases(scope, testCases);

    CoverageSummary summary;
    for (const auto &requirement : requirements) {
        if (scope.requirementIds.count(requirement.id) == 0) {
            continue;
        }
        summary.total++;
        if (!linkedFor(linked, requirement.id).empty()) {
            summary.covered++;
        }
    }
    summary.notCovered = summary.total - summary.covered;
    summary.percentage = percentage(summary.covered, summary.total);
    return summary;
}

std::vector<RequirementCoverage> requirementBreakdown(const Scope &scope,
                                                      TimePoint cutoff,
                                                      const TimelineIndex &timelines,
                                                      const std::vector<TestCase> &testCases,
                                                      const std::vector<Requirement> &requirements)
{
    const LinkedTestCases linked = linkTestCases(scope, testCases);

    std::vector<RequirementCoverage> rows;
    for (const auto &requirement : requirements) {
        if (scope.requirementIds.count(requirement.id) == 0) {
            continue;
        }

        RequirementCoverage row;
        row.requirementId = requirement.id;
        row.title = requirement.title;

        const auto &linkedIds = linkedFor(linked, requirement.id);
        row.linkedTestCases = static_cast<int>(linkedIds.size());
        row.covered = !linkedIds.empty();

        for (const auto &testCaseId : linkedIds) {
            switch (statusOf(testCaseId, cutoff, timelines).result) {
            case ResolvedResult::Passed:
                row.passed++;
                break;
            case ResolvedResult::Failed:
                row.failed++;
                break;
            case ResolvedResult::Blocked:
                row.blocked++;
                break;
            case ResolvedResult::Skipped:
            case ResolvedResult::NotExecuted:
                row.notExecuted++;
                break;
            }
        }
        row.executed = row.passed + row.failed + row.blocked;
        row.executionPercentage = percentage(row.executed, row.linkedTestCases);
        row.fullyTested = row.covered && row.passed == row.linkedTestCases;
        rows.push_back(row);
    }
    return rows;
}

AutomationSummary summarizeAutomations(const Scope &scope,
                                       const std::vector<AutomationRecord> &automations)
{
    AutomationSummary summary;
    for (const auto &automation : automations) {
        const bool inScope = scope.unrestricted()
            || (automation.releaseId.has_value()
                && scope.selectedReleaseIds.count(*automation.releaseId) > 0)
            || scope.testCaseIds.count(automation.testCaseId) > 0;
        if (!inScope) {
            continue;
        }
        summary.total++;
        if (automation.lastRunResult.has_value()) {
            summary.withRun++;
            if (parseAutomationResult(*automation.lastRunResult) == ExecutionResult::Passed) {
                summary.passing++;
            }
        }
    }
    summary.passPercentage = percentage(summary.passing, summary.total);
    return summary;
}

} // namespace testline
