#include "engine/trend_builder.hpp"

#include "engine/day_window.hpp"

namespace testline {

std::vector<AggregateSnapshot> buildTrend(int windowDays,
                                          const Scope &scope,
                                          const TimelineIndex &timelines,
                                          TimePoint now,
                                          int offsetMinutes)
{
    const auto cutoffs = trendCutoffs(windowDays, now, offsetMinutes);

    std::vector<AggregateSnapshot> points;
    points.reserve(cutoffs.size());
    for (const auto &cutoff : cutoffs) {
        points.push_back(aggregateStatuses(scope.testCaseIds, cutoff, timelines));
    }
    return points;
}

} // namespace testline
