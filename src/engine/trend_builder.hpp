#pragma once

#include <vector>

#include "common/models.hpp"
#include "engine/aggregator.hpp"
#include "engine/scope_filter.hpp"

namespace testline {

/**
 * Daily status counts over the last windowDays reference days, oldest first.
 * Each point is the aggregate at the end (23:59:59.999) of its day in the
 * reference zone; the last point is the end of the day containing now.
 * Trend points carry counts only, no coverage.
 *
 * Automated statuses only know the latest run, so older points can show a
 * run's result on days after it happened but never a run it replaced.
 *
 * Throws EngineError(InvalidWindow) unless windowDays is 7, 14 or 30.
 */
std::vector<AggregateSnapshot> buildTrend(int windowDays,
                                          const Scope &scope,
                                          const TimelineIndex &timelines,
                                          TimePoint now,
                                          int offsetMinutes);

} // namespace testline
