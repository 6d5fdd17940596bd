#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"
#include "data/record_source.hpp"
#include "engine/aggregator.hpp"
#include "engine/event_normalizer.hpp"
#include "engine/scope_filter.hpp"
#include "engine/trend_cache.hpp"

namespace testline {

// Immutable input of every computation. Replaced wholesale, never mutated.
struct Dataset {
    RecordSet records;
    EventsByTestCase events;
    NormalizationDiagnostics diagnostics;
    TimelineIndex timelines;
};

/**
 * Entry point for callers. Holds the current Dataset behind a shared_ptr so
 * every request works on one consistent snapshot without holding a lock
 * while it computes; writers build a new Dataset and swap it in.
 *
 * Cutoffs default to the injected clock's "now". Structural request errors
 * throw EngineError; unknown releases and malformed records never do.
 */
class CoverageEngine
{
public:
    using Clock = std::function<TimePoint()>;

    explicit CoverageEngine(const EngineConfig &config,
                            std::shared_ptr<TrendCache> cache = nullptr,
                            Clock clock = nullptr);

    ResolvedStatus getCurrentStatus(const std::string &testCaseId,
                                    std::optional<TimePoint> cutoff = std::nullopt) const;

    AggregateSnapshot getAggregateSnapshot(const std::set<std::string> &selectedReleaseIds,
                                           std::optional<TimePoint> cutoff = std::nullopt) const;

    std::vector<AggregateSnapshot> getTrend(const std::set<std::string> &selectedReleaseIds,
                                            int windowDays) const;

    CoverageSummary getCoverage(const std::set<std::string> &selectedReleaseIds) const;

    std::vector<RequirementCoverage> getRequirementBreakdown(
        const std::set<std::string> &selectedReleaseIds,
        std::optional<TimePoint> cutoff = std::nullopt) const;

    AutomationSummary getAutomationSummary(const std::set<std::string> &selectedReleaseIds) const;

    NormalizationDiagnostics diagnostics() const;

    // Resolves a release selection against the current dataset, logging
    // selected ids that match nothing.
    Scope scopeFor(const std::set<std::string> &selectedReleaseIds) const;

    // Adds or replaces (by record id) one upstream record. Throws
    // EngineError(InvalidRequest) when the id or test case id is empty.
    void recordManualExecution(const ManualExecutionRecord &record);
    void recordAutomationRun(const AutomationRecord &record);

    // Replaces the whole dataset. Records added through record*() whose id
    // the new set does not contain are carried over.
    void loadRecords(RecordSet records);

    // Reads every collaborator once and loads the result. On failure the
    // current dataset stays in place and the error propagates.
    void refresh(const RecordSource &source);

    std::shared_ptr<const Dataset> dataset() const;

    int referenceUtcOffsetMinutes() const;
    SourceTiePolicy sourceTiePolicy() const;
    TimePoint now() const;

private:
    // Normalizes records. With rebuildOnly set, timelines of other test
    // cases are shared from previous instead of being sorted again.
    std::shared_ptr<const Dataset> buildDataset(RecordSet records,
                                                const Dataset *previous,
                                                const std::set<std::string> *rebuildOnly) const;
    void swapDataset(std::shared_ptr<const Dataset> next,
                     bool structureChanged,
                     const std::set<std::string> &changedTestCases);
    void logNewMalformed(const Dataset &next, const Dataset *previous) const;
    Scope scopeIn(const Dataset &data, const std::set<std::string> &selectedReleaseIds) const;
    TimePoint resolveCutoff(std::optional<TimePoint> cutoff) const;

    int m_offsetMinutes = 0;
    SourceTiePolicy m_policy = SourceTiePolicy::PreferManual;
    std::shared_ptr<TrendCache> m_cache;
    Clock m_clock;

    mutable std::mutex m_datasetMutex;
    std::shared_ptr<const Dataset> m_dataset;

    // Serializes writers; readers only take m_datasetMutex briefly.
    std::mutex m_writeMutex;
    std::map<std::string, ManualExecutionRecord> m_recordedManual;
    std::map<std::string, AutomationRecord> m_recordedAutomations;
};

} // namespace testline
