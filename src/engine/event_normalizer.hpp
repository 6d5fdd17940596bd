#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace testline {

using EventsByTestCase = std::map<std::string, std::vector<StatusEvent>>;

struct NormalizationResult {
    EventsByTestCase events;
    NormalizationDiagnostics diagnostics;
};

/**
 * Convert raw manual executions and automation records into StatusEvents,
 * grouped by test case. Events are left in input order; ordering is the
 * resolver's job.
 *
 * Fallbacks:
 * - manual execution_date missing -> created_at, then updated_at
 * - manual result missing -> Skipped
 * - automation without last_run_result -> no event
 * - result strings are case-insensitive; automation "error" -> Failed
 * Records with no usable timestamp, an unknown result string or no test case
 * id are skipped and counted as malformed.
 */
NormalizationResult normalizeEvents(const std::vector<ManualExecutionRecord> &manualExecutions,
                                    const std::vector<AutomationRecord> &automations);

// Upstream result strings, matched case-insensitively.
std::optional<ExecutionResult> parseManualResult(const std::string &value);
std::optional<ExecutionResult> parseAutomationResult(const std::string &value);

std::optional<StatusEvent> normalizeManualExecution(const ManualExecutionRecord &record,
                                                    NormalizationDiagnostics &diagnostics);

std::optional<StatusEvent> normalizeAutomationRun(const AutomationRecord &record,
                                                  NormalizationDiagnostics &diagnostics);

} // namespace testline
