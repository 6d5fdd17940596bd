#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "engine/event_normalizer.hpp"
#include "engine/scope_filter.hpp"
#include "engine/status_resolver.hpp"

namespace testline {

using TimelineIndex = std::map<std::string, EventTimeline>;

TimelineIndex buildTimelines(const EventsByTestCase &events, SourceTiePolicy policy);

// round(100 * numerator / denominator), 0 when the denominator is 0.
int percentage(int numerator, int denominator);

// Passed/failed/blocked/not-executed counts at cutoff. Skipped counts as
// not executed. Test cases without any event are not executed.
AggregateSnapshot aggregateStatuses(const std::set<std::string> &testCaseIds,
                                    TimePoint cutoff,
                                    const TimelineIndex &timelines);

// Status counts plus requirement coverage for the scope at cutoff.
// A requirement is fully tested only when it has at least one linked test
// case and every linked test case resolves to Passed.
AggregateSnapshot aggregate(const Scope &scope,
                            TimePoint cutoff,
                            const TimelineIndex &timelines,
                            const std::vector<TestCase> &testCases,
                            const std::vector<Requirement> &requirements);

CoverageSummary computeCoverage(const Scope &scope,
                                const std::vector<TestCase> &testCases,
                                const std::vector<Requirement> &requirements);

std::vector<RequirementCoverage> requirementBreakdown(const Scope &scope,
                                                      TimePoint cutoff,
                                                      const TimelineIndex &timelines,
                                                      const std::vector<TestCase> &testCases,
                                                      const std::vector<Requirement> &requirements);

// Automations in scope: tagged with a selected release or attached to a test
// case in scope (everything when unrestricted).
AutomationSummary summarizeAutomations(const Scope &scope,
                                       const std::vector<AutomationRecord> &automations);

} // namespace testline
