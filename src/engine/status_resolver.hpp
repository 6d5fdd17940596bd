#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace testline {

/**
 * The single ordering used wherever "most recent event" is decided.
 *
 * Key: (effectiveTime, source rank, tiebreakTime, recordId, result).
 * Source rank only separates a manual and an automated event that share an
 * effective time; the policy names which one ranks higher. Between two
 * events of the same source the later tiebreakTime wins (creation time for
 * manual executions, record update time for automation runs).
 */
class EventOrder
{
public:
    explicit EventOrder(SourceTiePolicy policy = SourceTiePolicy::PreferManual);

    // Strict "a is older than b".
    bool operator()(const StatusEvent &a, const StatusEvent &b) const;

    SourceTiePolicy policy() const;

private:
    int sourceRank(EventSource source) const;

    SourceTiePolicy m_policy;
};

ResolvedResult toResolvedResult(ExecutionResult result);
ResolvedSource toResolvedSource(EventSource source);

// Status of one test case as of cutoff. Only events with
// effectiveTime <= cutoff are considered; none -> NotExecuted/None.
ResolvedStatus resolveStatus(const std::string &testCaseId,
                             const std::vector<StatusEvent> &events,
                             TimePoint cutoff,
                             SourceTiePolicy policy = SourceTiePolicy::PreferManual);

// One test case's events sorted once, answering statusAt() by binary search.
// Gives the same answer as resolveStatus() for every cutoff.
class EventTimeline
{
public:
    EventTimeline() = default;
    EventTimeline(std::string testCaseId,
                  std::vector<StatusEvent> events,
                  SourceTiePolicy policy);

    ResolvedStatus statusAt(TimePoint cutoff) const;

    const std::string &testCaseId() const;
    const std::vector<StatusEvent> &events() const;

private:
    std::string m_testCaseId;
    std::vector<StatusEvent> m_events;
};

} // namespace testline
