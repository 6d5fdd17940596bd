#include "engine/coverage_engine.hpp"

#include <algorithm>
#include <chrono>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/day_window.hpp"
#include "engine/status_resolver.hpp"
#include "engine/trend_builder.hpp"

namespace testline {

namespace {

qint64 elapsedMs(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
}

nlohmann::json idsJson(const std::set<std::string> &ids)
{
    return nlohmann::json(std::vector<std::string>(ids.begin(), ids.end()));
}

// Links and ids only; titles and names do not change any cached trend.
bool sameStructure(const RecordSet &a, const RecordSet &b)
{
    const bool sameTestCases = std::equal(
        a.testCases.begin(), a.testCases.end(),
        b.testCases.begin(), b.testCases.end(),
        [](const TestCase &x, const TestCase &y) {
            return x.id == y.id
                && x.requirementIds == y.requirementIds
                && x.releaseIds == y.releaseIds;
        });
    const bool sameRequirements = std::equal(
        a.requirements.begin(), a.requirements.end(),
        b.requirements.begin(), b.requirements.end(),
        [](const Requirement &x, const Requirement &y) {
            return x.id == y.id && x.releaseId == y.releaseId;
        });
    const bool sameReleases = std::equal(
        a.releases.begin(), a.releases.end(),
        b.releases.begin(), b.releases.end(),
        [](const Release &x, const Release &y) {
            return x.id == y.id;
        });
    return sameTestCases && sameRequirements && sameReleases;
}

// Test cases whose sorted timeline differs between the two datasets.
std::set<std::string> changedTimelines(const TimelineIndex &before, const TimelineIndex &after)
{
    std::set<std::string> changed;
    for (const auto &[testCaseId, timeline] : before) {
        auto it = after.find(testCaseId);
        if (it == after.end() || it->second.events() != timeline.events()) {
            changed.insert(testCaseId);
        }
    }
    for (const auto &[testCaseId, timeline] : after) {
        if (before.count(testCaseId) == 0) {
            changed.insert(testCaseId);
        }
    }
    return changed;
}

template <typename Record>
void mergeRecorded(std::vector<Record> &upstream, std::map<std::string, Record> &recorded)
{
    std::set<std::string> upstreamIds;
    for (const auto &record : upstream) {
        upstreamIds.insert(record.id);
    }
    for (auto it = recorded.begin(); it != recorded.end();) {
        if (upstreamIds.count(it->first) > 0) {
            // Upstream now knows this record; its copy wins.
            it = recorded.erase(it);
        } else {
            upstream.push_back(it->second);
            ++it;
        }
    }
}

// Replaces the record with the same id or appends it. Returns the test case
// id of the replaced record, if any.
template <typename Record>
std::optional<std::string> upsert(std::vector<Record> &records, const Record &record)
{
    for (auto &existing : records) {
        if (existing.id == record.id) {
            std::string previousTestCase = existing.testCaseId;
            existing = record;
            return previousTestCase;
        }
    }
    records.push_back(record);
    return std::nullopt;
}

void requireRecordIds(const std::string &id, const std::string &testCaseId)
{
    if (id.empty()) {
        throw EngineError(ErrorKind::InvalidRequest, "record id is required");
    }
    if (testCaseId.empty()) {
        throw EngineError(ErrorKind::InvalidRequest, "test_case_id is required");
    }
}

} // namespace

CoverageEngine::CoverageEngine(const EngineConfig &config,
                               std::shared_ptr<TrendCache> cache,
                               Clock clock)
    : m_offsetMinutes(config.referenceUtcOffsetMinutes)
    , m_policy(config.sourceTiePolicy)
    , m_cache(std::move(cache))
    , m_clock(std::move(clock))
    , m_dataset(std::make_shared<const Dataset>())
{
    if (!m_cache) {
        if (config.trendCacheEnabled) {
            m_cache = std::make_shared<InMemoryTrendCache>();
        } else {
            m_cache = std::make_shared<NullTrendCache>();
        }
    }
    if (!m_clock) {
        m_clock = [] {
            return std::chrono::system_clock::now();
        };
    }
}

std::shared_ptr<const Dataset> CoverageEngine::dataset() const
{
    std::lock_guard<std::mutex> lock(m_datasetMutex);
    return m_dataset;
}

int CoverageEngine::referenceUtcOffsetMinutes() const
{
    return m_offsetMinutes;
}

SourceTiePolicy CoverageEngine::sourceTiePolicy() const
{
    return m_policy;
}

TimePoint CoverageEngine::now() const
{
    return m_clock();
}

TimePoint CoverageEngine::resolveCutoff(std::optional<TimePoint> cutoff) const
{
    const TimePoint resolved = cutoff.value_or(m_clock());
    validateCutoff(resolved);
    return resolved;
}

Scope CoverageEngine::scopeIn(const Dataset &data,
                              const std::set<std::string> &selectedReleaseIds) const
{
    Scope scope = computeScope(selectedReleaseIds,
                               data.records.testCases,
                               data.records.requirements,
                               data.records.releases);
    if (!scope.unknownReleaseIds.empty()) {
        TLOG_WARN(QStringLiteral("CoverageEngine"),
                  QStringLiteral("scopeFor"),
                  QStringLiteral("unknown_scope"),
                  QStringLiteral("release_matches_nothing"),
                  QStringLiteral("ignore_release"),
                  testline::logging::defaultWho(),
                  testline::logging::currentCorrelationId(),
                  (nlohmann::json{
                      {"unknownReleaseIds", idsJson(scope.unknownReleaseIds)},
                      {"scopeKind", toScopeKindString(scope.kind)}
                  }));
    }
    return scope;
}

Scope CoverageEngine::scopeFor(const std::set<std::string> &selectedReleaseIds) const
{
    return scopeIn(*dataset(), selectedReleaseIds);
}

ResolvedStatus CoverageEngine::getCurrentStatus(const std::string &testCaseId,
                                                std::optional<TimePoint> cutoff) const
{
    if (testCaseId.empty()) {
        throw EngineError(ErrorKind::InvalidRequest, "testCaseId is required");
    }
    const TimePoint at = resolveCutoff(cutoff);
    const auto data = dataset();

    auto it = data->timelines.find(testCaseId);
    if (it == data->timelines.end()) {
        return EventTimeline(testCaseId, {}, m_policy).statusAt(at);
    }
    return it->second.statusAt(at);
}

AggregateSnapshot CoverageEngine::getAggregateSnapshot(const std::set<std::string> &selectedReleaseIds,
                                                       std::optional<TimePoint> cutoff) const
{
    const TimePoint at = resolveCutoff(cutoff);
    const auto start = std::chrono::steady_clock::now();
    const auto data = dataset();
    const Scope scope = scopeIn(*data, selectedReleaseIds);

    AggregateSnapshot snapshot = aggregate(scope, at, data->timelines,
                                           data->records.testCases,
                                           data->records.requirements);

    TLOG_DEBUG(QStringLiteral("CoverageEngine"),
               QStringLiteral("getAggregateSnapshot"),
               QStringLiteral("snapshot_computed"),
               QStringLiteral("request"),
               QStringLiteral("aggregate"),
               testline::logging::defaultWho(),
               testline::logging::currentCorrelationId(),
               (nlohmann::json{
                   {"scope", scope.signature()},
                   {"cutoff", toIso8601Utc(at)},
                   {"testCases", snapshot.total},
                   {"durationMs", elapsedMs(start)}
               }));
    return snapshot;
}

std::vector<AggregateSnapshot> CoverageEngine::getTrend(const std::set<std::string> &selectedReleaseIds,
                                                        int windowDays) const
{
    validateWindow(windowDays);
    const TimePoint at = m_clock();
    validateCutoff(at);

    const auto start = std::chrono::steady_clock::now();
    const auto data = dataset();
    const Scope scope = scopeIn(*data, selectedReleaseIds);

    TrendCacheKey key;
    key.scopeSignature = scope.signature();
    key.windowDays = windowDays;
    key.dayIndex = referenceDayIndex(at, m_offsetMinutes);

    if (auto cached = m_cache->lookup(key)) {
        TLOG_DEBUG(QStringLiteral("CoverageEngine"),
                   QStringLiteral("getTrend"),
                   QStringLiteral("trend_cache_hit"),
                   QStringLiteral("request"),
                   QStringLiteral("cache"),
                   testline::logging::defaultWho(),
                   testline::logging::currentCorrelationId(),
                   (nlohmann::json{{"scope", key.scopeSignature}, {"windowDays", windowDays}}));
        return *cached;
    }

    auto points = buildTrend(windowDays, scope, data->timelines, at, m_offsetMinutes);

    {
        // A writer may have swapped the dataset while we computed; only a
        // series built from the current dataset may enter the cache.
        std::lock_guard<std::mutex> lock(m_datasetMutex);
        if (m_dataset == data) {
            m_cache->store(key, scope.testCaseIds, scope.unrestricted(), points);
        }
    }

    TLOG_DEBUG(QStringLiteral("CoverageEngine"),
               QStringLiteral("getTrend"),
               QStringLiteral("trend_computed"),
               QStringLiteral("request"),
               QStringLiteral("replay_days"),
               testline::logging::defaultWho(),
               testline::logging::currentCorrelationId(),
               (nlohmann::json{
                   {"scope", key.scopeSignature},
                   {"windowDays", windowDays},
                   {"testCases", scope.testCaseIds.size()},
                   {"durationMs", elapsedMs(start)}
               }));
    return points;
}

CoverageSummary CoverageEngine::getCoverage(const std::set<std::string> &selectedReleaseIds) const
{
    const auto data = dataset();
    const Scope scope = scopeIn(*data, selectedReleaseIds);
    return computeCoverage(scope, data->records.testCases, data->records.requirements);
}

std::vector<RequirementCoverage> CoverageEngine::getRequirementBreakdown(
    const std::set<std::string> &selectedReleaseIds,
    std::optional<TimePoint> cutoff) const
{
    const TimePoint at = resolveCutoff(cutoff);
    const auto data = dataset();
    const Scope scope = scopeIn(*data, selectedReleaseIds);
    return requirementBreakdown(scope, at, data->timelines,
                                data->records.testCases,
                                data->records.requirements);
}

AutomationSummary CoverageEngine::getAutomationSummary(const std::set<std::string> &selectedReleaseIds) const
{
    const auto data = dataset();
    const Scope scope = scopeIn(*data, selectedReleaseIds);
    return summarizeAutomations(scope, data->records.automations);
}

NormalizationDiagnostics CoverageEngine::diagnostics() const
{
    return dataset()->diagnostics;
}

std::shared_ptr<const Dataset> CoverageEngine::buildDataset(RecordSet records,
                                                            const Dataset *previous,
                                                            const std::set<std::string> *rebuildOnly) const
{
    auto next = std::make_shared<Dataset>();
    NormalizationResult normalized = normalizeEvents(records.manualExecutions, records.automations);
    next->records = std::move(records);
    next->events = std::move(normalized.events);
    next->diagnostics = std::move(normalized.diagnostics);
    // Unreadable source entries count as malformed alongside the ones the
    // normalizer skipped.
    next->diagnostics.malformedSkipped += static_cast<int>(next->records.rejectedRecordIds.size());
    next->diagnostics.malformedRecordIds.insert(next->diagnostics.malformedRecordIds.end(),
                                                next->records.rejectedRecordIds.begin(),
                                                next->records.rejectedRecordIds.end());

    if (previous && rebuildOnly) {
        next->timelines = previous->timelines;
        for (const auto &testCaseId : *rebuildOnly) {
            next->timelines.erase(testCaseId);
            auto it = next->events.find(testCaseId);
            if (it != next->events.end()) {
                next->timelines.emplace(testCaseId, EventTimeline(testCaseId, it->second, m_policy));
            }
        }
    } else {
        next->timelines = buildTimelines(next->events, m_policy);
    }
    return next;
}

void CoverageEngine::swapDataset(std::shared_ptr<const Dataset> next,
                                 bool structureChanged,
                                 const std::set<std::string> &changedTestCases)
{
    std::shared_ptr<const Dataset> previous;
    {
        std::lock_guard<std::mutex> lock(m_datasetMutex);
        previous = m_dataset;
        m_dataset = next;
        if (structureChanged) {
            m_cache->clear();
        } else {
            for (const auto &testCaseId : changedTestCases) {
                m_cache->invalidateTestCase(testCaseId);
            }
        }
    }
    logNewMalformed(*next, previous.get());
}

void CoverageEngine::logNewMalformed(const Dataset &next, const Dataset *previous) const
{
    // The source already logged the entries it could not read.
    std::set<std::string> known(next.records.rejectedRecordIds.begin(),
                                next.records.rejectedRecordIds.end());
    if (previous) {
        known.insert(previous->diagnostics.malformedRecordIds.begin(),
                     previous->diagnostics.malformedRecordIds.end());
    }
    for (const auto &recordId : next.diagnostics.malformedRecordIds) {
        if (known.count(recordId) > 0) {
            continue;
        }
        TLOG_WARN(QStringLiteral("CoverageEngine"),
                  QStringLiteral("loadRecords"),
                  QStringLiteral("malformed_event_skipped"),
                  QStringLiteral("no_usable_timestamp_or_result"),
                  QStringLiteral("skip_record"),
                  testline::logging::defaultWho(),
                  testline::logging::currentCorrelationId(),
                  (nlohmann::json{{"recordId", recordId}}));
    }
}

void CoverageEngine::recordManualExecution(const ManualExecutionRecord &record)
{
    requireRecordIds(record.id, record.testCaseId);

    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    const auto current = dataset();
    RecordSet records = current->records;

    std::set<std::string> changed{record.testCaseId};
    if (const auto replaced = upsert(records.manualExecutions, record)) {
        changed.insert(*replaced);
    }
    m_recordedManual[record.id] = record;

    swapDataset(buildDataset(std::move(records), current.get(), &changed), false, changed);

    TLOG_INFO(QStringLiteral("CoverageEngine"),
              QStringLiteral("recordManualExecution"),
              QStringLiteral("execution_recorded"),
              QStringLiteral("request"),
              QStringLiteral("upsert"),
              testline::logging::defaultWho(),
              testline::logging::currentCorrelationId(),
              (nlohmann::json{{"recordId", record.id}, {"testCaseId", record.testCaseId}}));
}

void CoverageEngine::recordAutomationRun(const AutomationRecord &record)
{
    requireRecordIds(record.id, record.testCaseId);

    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    const auto current = dataset();
    RecordSet records = current->records;

    std::set<std::string> changed{record.testCaseId};
    if (const auto replaced = upsert(records.automations, record)) {
        changed.insert(*replaced);
    }
    m_recordedAutomations[record.id] = record;

    swapDataset(buildDataset(std::move(records), current.get(), &changed), false, changed);

    TLOG_INFO(QStringLiteral("CoverageEngine"),
              QStringLiteral("recordAutomationRun"),
              QStringLiteral("automation_run_recorded"),
              QStringLiteral("request"),
              QStringLiteral("upsert"),
              testline::logging::defaultWho(),
              testline::logging::currentCorrelationId(),
              (nlohmann::json{{"recordId", record.id}, {"testCaseId", record.testCaseId}}));
}

void CoverageEngine::loadRecords(RecordSet records)
{
    const auto start = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    mergeRecorded(records.manualExecutions, m_recordedManual);
    mergeRecorded(records.automations, m_recordedAutomations);

    const auto current = dataset();
    const bool structureChanged = !sameStructure(current->records, records);
    auto next = buildDataset(std::move(records), nullptr, nullptr);
    const std::set<std::string> changed = changedTimelines(current->timelines, next->timelines);
    const auto diagnostics = next->diagnostics;
    const auto testCaseCount = next->records.testCases.size();

    swapDataset(std::move(next), structureChanged, changed);

    TLOG_INFO(QStringLiteral("CoverageEngine"),
              QStringLiteral("loadRecords"),
              QStringLiteral("dataset_loaded"),
              QStringLiteral("refresh"),
              QStringLiteral("normalize"),
              testline::logging::defaultWho(),
              testline::logging::currentCorrelationId(),
              (nlohmann::json{
                  {"testCases", testCaseCount},
                  {"manualEvents", diagnostics.manualEvents},
                  {"automatedEvents", diagnostics.automatedEvents},
                  {"malformedSkipped", diagnostics.malformedSkipped},
                  {"changedTestCases", changed.size()},
                  {"structureChanged", structureChanged},
                  {"durationMs", elapsedMs(start)}
              }));
}

void CoverageEngine::refresh(const RecordSource &source)
{
    loadRecords(loadRecordSet(source));
}

} // namespace testline
