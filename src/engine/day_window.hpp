#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace testline {

constexpr std::int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

bool isSupportedWindow(int windowDays);

// Throws EngineError(InvalidWindow) unless windowDays is 7, 14 or 30.
void validateWindow(int windowDays);

// Throws EngineError(InvalidCutoff) for instants before the Unix epoch.
void validateCutoff(TimePoint cutoff);

// Days since 1970-01-01 in the reference zone (UTC shifted by offsetMinutes).
std::int64_t referenceDayIndex(TimePoint instant, int offsetMinutes);

// 23:59:59.999 of the given reference day, as an absolute instant.
TimePoint endOfReferenceDay(std::int64_t dayIndex, int offsetMinutes);

// "YYYY-MM-DD" of the given reference day.
std::string referenceDayLabel(std::int64_t dayIndex);

// One end-of-day cutoff per day, oldest first, the last being the end of
// the reference day that contains now.
std::vector<TimePoint> trendCutoffs(int windowDays, TimePoint now, int offsetMinutes);

} // namespace testline
