#include "engine/status_resolver.hpp"

#include <algorithm>
#include <iterator>
#include <tuple>

namespace testline {

namespace {

ResolvedStatus notExecuted(const std::string &testCaseId, TimePoint cutoff)
{
    ResolvedStatus status;
    status.testCaseId = testCaseId;
    status.result = ResolvedResult::NotExecuted;
    status.source = ResolvedSource::None;
    status.asOf = cutoff;
    return status;
}

ResolvedStatus fromEvent(const std::string &testCaseId,
                         const StatusEvent &event,
                         TimePoint cutoff)
{
    ResolvedStatus status;
    status.testCaseId = testCaseId;
    status.result = toResolvedResult(event.result);
    status.source = toResolvedSource(event.source);
    status.asOf = cutoff;
    status.eventTime = event.effectiveTime;
    return status;
}

} // namespace

EventOrder::EventOrder(SourceTiePolicy policy)
    : m_policy(policy)
{
}

int EventOrder::sourceRank(EventSource source) const
{
    const EventSource preferred = m_policy == SourceTiePolicy::PreferManual
        ? EventSource::Manual
        : EventSource::Automated;
    return source == preferred ? 1 : 0;
}

bool EventOrder::operator()(const StatusEvent &a, const StatusEvent &b) const
{
    using Key = std::tuple<TimePoint, int, TimePoint, const std::string &, int>;
    return Key(a.effectiveTime, sourceRank(a.source), a.tiebreakTime, a.recordId,
               static_cast<int>(a.result))
        < Key(b.effectiveTime, sourceRank(b.source), b.tiebreakTime, b.recordId,
              static_cast<int>(b.result));
}

SourceTiePolicy EventOrder::policy() const
{
    return m_policy;
}

ResolvedResult toResolvedResult(ExecutionResult result)
{
    switch (result) {
    case ExecutionResult::Passed:
        return ResolvedResult::Passed;
    case ExecutionResult::Failed:
        return ResolvedResult::Failed;
    case ExecutionResult::Blocked:
        return ResolvedResult::Blocked;
    case ExecutionResult::Skipped:
        return ResolvedResult::Skipped;
    }
    return ResolvedResult::Skipped;
}

ResolvedSource toResolvedSource(EventSource source)
{
    switch (source) {
    case EventSource::Manual:
        return ResolvedSource::Manual;
    case EventSource::Automated:
        return ResolvedSource::Automated;
    }
    return ResolvedSource::None;
}

ResolvedStatus resolveStatus(const std::string &testCaseId,
                             const std::vector<StatusEvent> &events,
                             TimePoint cutoff,
                             SourceTiePolicy policy)
{
    const EventOrder order(policy);
    const StatusEvent *latest = nullptr;
    for (const auto &event : events) {
        if (event.effectiveTime > cutoff) {
            continue;
        }
        if (!latest || order(*latest, event)) {
            latest = &event;
        }
    }

    if (!latest) {
        return notExecuted(testCaseId, cutoff);
    }
    return fromEvent(testCaseId, *latest, cutoff);
}

EventTimeline::EventTimeline(std::string testCaseId,
                             std::vector<StatusEvent> events,
                             SourceTiePolicy policy)
    : m_testCaseId(std::move(testCaseId))
    , m_events(std::move(events))
{
    std::sort(m_events.begin(), m_events.end(), EventOrder(policy));
}

ResolvedStatus EventTimeline::statusAt(TimePoint cutoff) const
{
    // Sorted by effectiveTime first, so everything before the first event
    // past the cutoff is visible and the last visible event is the maximum.
    auto firstAfter = std::upper_bound(
        m_events.begin(), m_events.end(), cutoff,
        [](TimePoint value, const StatusEvent &event) {
            return value < event.effectiveTime;
        });

    if (firstAfter == m_events.begin()) {
        return notExecuted(m_testCaseId, cutoff);
    }
    return fromEvent(m_testCaseId, *std::prev(firstAfter), cutoff);
}

const std::string &EventTimeline::testCaseId() const
{
    return m_testCaseId;
}

const std::vector<StatusEvent> &EventTimeline::events() const
{
    return m_events;
}

} // namespace testline
