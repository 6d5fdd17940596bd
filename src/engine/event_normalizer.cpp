#include "engine/event_normalizer.hpp"

#include <algorithm>
#include <cctype>

#include "common/json_utils.hpp"

namespace testline {

namespace {

void markMalformed(NormalizationDiagnostics &diagnostics, const std::string &recordId)
{
    diagnostics.malformedSkipped++;
    diagnostics.malformedRecordIds.push_back(recordId);
}

std::string lowered(const std::string &value)
{
    std::string result = value;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

} // namespace

std::optional<ExecutionResult> parseManualResult(const std::string &value)
{
    return parseExecutionResultString(lowered(value));
}

std::optional<ExecutionResult> parseAutomationResult(const std::string &value)
{
    const std::string result = lowered(value);
    // The automation runner reports infrastructure failures as "error".
    if (result == "error") {
        return ExecutionResult::Failed;
    }
    return parseExecutionResultString(result);
}

std::optional<StatusEvent> normalizeManualExecution(const ManualExecutionRecord &record,
                                                    NormalizationDiagnostics &diagnostics)
{
    if (record.testCaseId.empty()) {
        markMalformed(diagnostics, record.id);
        return std::nullopt;
    }

    ExecutionResult result = ExecutionResult::Skipped;
    bool resultDefaulted = false;
    if (record.result.has_value()) {
        const auto parsed = parseManualResult(*record.result);
        if (!parsed.has_value()) {
            markMalformed(diagnostics, record.id);
            return std::nullopt;
        }
        result = *parsed;
    } else {
        resultDefaulted = true;
    }

    std::optional<TimePoint> effective = record.executionDate;
    bool dateFallback = false;
    if (!effective.has_value()) {
        effective = record.createdAt.has_value() ? record.createdAt : record.updatedAt;
        dateFallback = true;
    }
    if (!effective.has_value()) {
        markMalformed(diagnostics, record.id);
        return std::nullopt;
    }

    if (resultDefaulted) {
        diagnostics.manualResultDefaulted++;
    }
    if (dateFallback) {
        diagnostics.manualDateFallbacks++;
    }

    StatusEvent event;
    event.testCaseId = record.testCaseId;
    event.recordId = record.id;
    event.source = EventSource::Manual;
    event.result = result;
    event.effectiveTime = *effective;
    event.tiebreakTime = record.createdAt.value_or(*effective);
    diagnostics.manualEvents++;
    return event;
}

std::optional<StatusEvent> normalizeAutomationRun(const AutomationRecord &record,
                                                  NormalizationDiagnostics &diagnostics)
{
    if (!record.lastRunResult.has_value()) {
        diagnostics.automationsWithoutRun++;
        return std::nullopt;
    }

    const auto result = parseAutomationResult(*record.lastRunResult);
    if (record.testCaseId.empty() || !result.has_value() || !record.lastRunDate.has_value()) {
        markMalformed(diagnostics, record.id);
        return std::nullopt;
    }

    StatusEvent event;
    event.testCaseId = record.testCaseId;
    event.recordId = record.id;
    event.source = EventSource::Automated;
    event.result = *result;
    event.effectiveTime = *record.lastRunDate;
    event.tiebreakTime = record.updatedAt.value_or(*record.lastRunDate);
    diagnostics.automatedEvents++;
    return event;
}

NormalizationResult normalizeEvents(const std::vector<ManualExecutionRecord> &manualExecutions,
                                    const std::vector<AutomationRecord> &automations)
{
    NormalizationResult normalized;

    for (const auto &record : manualExecutions) {
        if (auto event = normalizeManualExecution(record, normalized.diagnostics)) {
            normalized.events[event->testCaseId].push_back(std::move(*event));
        }
    }

    for (const auto &record : automations) {
        if (auto event = normalizeAutomationRun(record, normalized.diagnostics)) {
            normalized.events[event->testCaseId].push_back(std::move(*event));
        }
    }

    return normalized;
}

} // namespace testline
