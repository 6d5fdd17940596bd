#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace testline {

inline std::string toIso8601Utc(TimePoint timestamp)
{
    const auto sinceEpoch = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch());
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);
    auto millis = sinceEpoch - seconds;
    if (millis.count() < 0) {
        seconds -= std::chrono::seconds(1);
        millis += std::chrono::seconds(1);
    }

    std::time_t time = static_cast<std::time_t>(seconds.count());
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    out << '.' << std::setw(3) << std::setfill('0') << millis.count() << 'Z';
    return out.str();
}

// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS" with an optional fraction and
// an optional "Z" or "+HH:MM" / "-HH:MM" offset. Values without an offset are
// read as UTC. Fractions beyond milliseconds are truncated.
inline std::optional<TimePoint> parseIso8601(const std::string &value)
{
    if (value.size() < 10) {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream in(value);
    if (value.size() == 10) {
        in >> std::get_time(&tm, "%Y-%m-%d");
    } else {
        in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    }
    if (in.fail()) {
        return std::nullopt;
    }

    std::chrono::milliseconds fraction{0};
    if (in.peek() == '.') {
        in.get();
        int digits = 0;
        long long millis = 0;
        while (std::isdigit(in.peek())) {
            const int digit = in.get() - '0';
            if (digits < 3) {
                millis = millis * 10 + digit;
            }
            ++digits;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
        fraction = std::chrono::milliseconds(millis);
    }

    std::chrono::minutes offset{0};
    const int marker = in.peek();
    if (marker == 'Z' || marker == 'z') {
        in.get();
    } else if (marker == '+' || marker == '-') {
        in.get();
        std::string rest;
        std::getline(in, rest);
        if (rest.size() == 5 && rest[2] == ':') {
            rest.erase(2, 1);
        }
        if (rest.size() != 4 && rest.size() != 2) {
            return std::nullopt;
        }
        for (char c : rest) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
        }
        const int hours = std::stoi(rest.substr(0, 2));
        const int minutes = rest.size() == 4 ? std::stoi(rest.substr(2, 2)) : 0;
        offset = std::chrono::minutes(hours * 60 + minutes);
        if (marker == '-') {
            offset = -offset;
        }
    }

    if (in.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    return std::chrono::system_clock::from_time_t(time) + fraction - offset;
}

inline std::string toExecutionResultString(ExecutionResult result)
{
    switch (result) {
    case ExecutionResult::Passed:
        return "passed";
    case ExecutionResult::Failed:
        return "failed";
    case ExecutionResult::Blocked:
        return "blocked";
    case ExecutionResult::Skipped:
        return "skipped";
    }
    return "skipped";
}

inline std::optional<ExecutionResult> parseExecutionResultString(const std::string &value)
{
    if (value == "passed") {
        return ExecutionResult::Passed;
    }
    if (value == "failed") {
        return ExecutionResult::Failed;
    }
    if (value == "blocked") {
        return ExecutionResult::Blocked;
    }
    if (value == "skipped") {
        return ExecutionResult::Skipped;
    }
    return std::nullopt;
}

inline std::string toResolvedResultString(ResolvedResult result)
{
    switch (result) {
    case ResolvedResult::Passed:
        return "passed";
    case ResolvedResult::Failed:
        return "failed";
    case ResolvedResult::Blocked:
        return "blocked";
    case ResolvedResult::Skipped:
        return "skipped";
    case ResolvedResult::NotExecuted:
        return "not_executed";
    }
    return "not_executed";
}

inline std::string toEventSourceString(EventSource source)
{
    switch (source) {
    case EventSource::Manual:
        return "manual";
    case EventSource::Automated:
        return "automated";
    }
    return "manual";
}

inline std::string toResolvedSourceString(ResolvedSource source)
{
    switch (source) {
    case ResolvedSource::Manual:
        return "manual";
    case ResolvedSource::Automated:
        return "automated";
    case ResolvedSource::None:
        return "none";
    }
    return "none";
}

inline std::string toSourceTiePolicyString(SourceTiePolicy policy)
{
    switch (policy) {
    case SourceTiePolicy::PreferManual:
        return "prefer_manual";
    case SourceTiePolicy::PreferAutomated:
        return "prefer_automated";
    }
    return "prefer_manual";
}

inline std::optional<SourceTiePolicy> parseSourceTiePolicyString(const std::string &value)
{
    if (value == "prefer_manual") {
        return SourceTiePolicy::PreferManual;
    }
    if (value == "prefer_automated") {
        return SourceTiePolicy::PreferAutomated;
    }
    return std::nullopt;
}

inline std::string toScopeKindString(ScopeKind kind)
{
    switch (kind) {
    case ScopeKind::Unrestricted:
        return "unrestricted";
    case ScopeKind::Selected:
        return "selected";
    case ScopeKind::UnknownOnly:
        return "unknown_only";
    }
    return "unrestricted";
}

namespace detail {

inline std::optional<std::string> optionalString(const nlohmann::json &j, const char *key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    std::string value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

inline std::optional<TimePoint> optionalTime(const nlohmann::json &j, const char *key)
{
    const auto text = optionalString(j, key);
    if (!text.has_value()) {
        return std::nullopt;
    }
    return parseIso8601(*text);
}

inline std::set<std::string> stringSet(const nlohmann::json &j, const char *key)
{
    std::set<std::string> values;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        return values;
    }
    for (const auto &item : *it) {
        if (item.is_string() && !item.get<std::string>().empty()) {
            values.insert(item.get<std::string>());
        }
    }
    return values;
}

inline bool hasArray(const nlohmann::json &j, const char *key)
{
    auto it = j.find(key);
    return it != j.end() && it->is_array();
}

// Link lists live at the top level, in metadata, or as a singular field.
inline std::set<std::string> linkSet(const nlohmann::json &j,
                                     const char *listKey,
                                     const char *singularKey)
{
    if (hasArray(j, listKey)) {
        return stringSet(j, listKey);
    }
    auto metadata = j.find("metadata");
    if (metadata != j.end() && metadata->is_object() && hasArray(*metadata, listKey)) {
        return stringSet(*metadata, listKey);
    }
    std::set<std::string> values;
    if (const auto single = optionalString(j, singularKey)) {
        values.insert(*single);
    }
    return values;
}

inline nlohmann::json optionalTimeJson(const std::optional<TimePoint> &value)
{
    if (!value.has_value()) {
        return nullptr;
    }
    return toIso8601Utc(*value);
}

} // namespace detail

inline void from_json(const nlohmann::json &j, TestCase &testCase)
{
    testCase.id = j.value("id", "");
    testCase.title = j.value("title", "");
    testCase.requirementIds = detail::linkSet(j, "requirement_ids", "requirement_id");
    testCase.releaseIds = detail::linkSet(j, "release_ids", "release_id");
}

inline void from_json(const nlohmann::json &j, Requirement &requirement)
{
    requirement.id = j.value("id", "");
    requirement.title = j.value("title", "");
    requirement.releaseId = detail::optionalString(j, "release_id");
}

inline void from_json(const nlohmann::json &j, Release &release)
{
    release.id = j.value("id", "");
    release.name = j.value("name", "");
}

inline void from_json(const nlohmann::json &j, ManualExecutionRecord &record)
{
    record.id = j.value("id", "");
    record.testCaseId = j.value("test_case_id", "");
    record.releaseId = detail::optionalString(j, "release_id");
    record.result = detail::optionalString(j, "result");
    record.executionDate = detail::optionalTime(j, "execution_date");
    record.createdAt = detail::optionalTime(j, "created_at");
    record.updatedAt = detail::optionalTime(j, "updated_at");
}

inline void from_json(const nlohmann::json &j, AutomationRecord &record)
{
    record.id = j.value("id", "");
    record.testCaseId = j.value("test_case_id", "");
    record.releaseId = detail::optionalString(j, "release_id");
    record.status = detail::optionalString(j, "status");
    record.lastRunResult = detail::optionalString(j, "last_run_result");
    record.lastRunDate = detail::optionalTime(j, "last_run_date");
    if (!record.lastRunDate.has_value()) {
        record.lastRunDate = detail::optionalTime(j, "last_run_at");
    }
    record.updatedAt = detail::optionalTime(j, "updated_at");
}

inline void to_json(nlohmann::json &j, const ManualExecutionRecord &record)
{
    j = nlohmann::json{
        {"id", record.id},
        {"test_case_id", record.testCaseId},
        {"release_id", record.releaseId.has_value() ? nlohmann::json(*record.releaseId) : nlohmann::json()},
        {"result", record.result.has_value() ? nlohmann::json(*record.result) : nlohmann::json()},
        {"execution_date", detail::optionalTimeJson(record.executionDate)},
        {"created_at", detail::optionalTimeJson(record.createdAt)},
        {"updated_at", detail::optionalTimeJson(record.updatedAt)}
    };
}

inline void to_json(nlohmann::json &j, const AutomationRecord &record)
{
    j = nlohmann::json{
        {"id", record.id},
        {"test_case_id", record.testCaseId},
        {"release_id", record.releaseId.has_value() ? nlohmann::json(*record.releaseId) : nlohmann::json()},
        {"status", record.status.has_value() ? nlohmann::json(*record.status) : nlohmann::json()},
        {"last_run_result", record.lastRunResult.has_value() ? nlohmann::json(*record.lastRunResult) : nlohmann::json()},
        {"last_run_date", detail::optionalTimeJson(record.lastRunDate)},
        {"updated_at", detail::optionalTimeJson(record.updatedAt)}
    };
}

inline void to_json(nlohmann::json &j, const ResolvedStatus &status)
{
    j = nlohmann::json{
        {"testCaseId", status.testCaseId},
        {"result", toResolvedResultString(status.result)},
        {"source", toResolvedSourceString(status.source)},
        {"asOf", toIso8601Utc(status.asOf)},
        {"eventTime", detail::optionalTimeJson(status.eventTime)}
    };
}

inline void to_json(nlohmann::json &j, const CoverageMetrics &metrics)
{
    j = nlohmann::json{
        {"requirementsTotal", metrics.requirementsTotal},
        {"requirementsWithTests", metrics.requirementsWithTests},
        {"requirementsFullyTested", metrics.requirementsFullyTested},
        {"testcasesLinked", metrics.testcasesLinked},
        {"testcasesExecuted", metrics.testcasesExecuted},
        {"coveragePercentage", metrics.coveragePercentage},
        {"fullyTestedPercentage", metrics.fullyTestedPercentage},
        {"fullyTestedRequirementIds", metrics.fullyTestedRequirementIds}
    };
}

inline void to_json(nlohmann::json &j, const AggregateSnapshot &snapshot)
{
    j = nlohmann::json{
        {"cutoff", toIso8601Utc(snapshot.cutoff)},
        {"passed", snapshot.passed},
        {"failed", snapshot.failed},
        {"blocked", snapshot.blocked},
        {"notExecuted", snapshot.notExecuted},
        {"total", snapshot.total},
        {"executed", snapshot.executed},
        {"passRate", snapshot.passRate}
    };
    if (snapshot.coverage.has_value()) {
        j["coverage"] = *snapshot.coverage;
    }
}

inline void to_json(nlohmann::json &j, const CoverageSummary &summary)
{
    j = nlohmann::json{
        {"covered", summary.covered},
        {"notCovered", summary.notCovered},
        {"total", summary.total},
        {"percentage", summary.percentage}
    };
}

inline void to_json(nlohmann::json &j, const RequirementCoverage &coverage)
{
    j = nlohmann::json{
        {"requirementId", coverage.requirementId},
        {"title", coverage.title},
        {"linkedTestCases", coverage.linkedTestCases},
        {"passed", coverage.passed},
        {"failed", coverage.failed},
        {"blocked", coverage.blocked},
        {"notExecuted", coverage.notExecuted},
        {"executed", coverage.executed},
        {"executionPercentage", coverage.executionPercentage},
        {"covered", coverage.covered},
        {"fullyTested", coverage.fullyTested}
    };
}

inline void to_json(nlohmann::json &j, const AutomationSummary &summary)
{
    j = nlohmann::json{
        {"total", summary.total},
        {"withRun", summary.withRun},
        {"passing", summary.passing},
        {"passPercentage", summary.passPercentage}
    };
}

inline void to_json(nlohmann::json &j, const NormalizationDiagnostics &diagnostics)
{
    j = nlohmann::json{
        {"manualEvents", diagnostics.manualEvents},
        {"automatedEvents", diagnostics.automatedEvents},
        {"manualDateFallbacks", diagnostics.manualDateFallbacks},
        {"manualResultDefaulted", diagnostics.manualResultDefaulted},
        {"automationsWithoutRun", diagnostics.automationsWithoutRun},
        {"malformedSkipped", diagnostics.malformedSkipped},
        {"malformedRecordIds", diagnostics.malformedRecordIds}
    };
}

} // namespace testline
