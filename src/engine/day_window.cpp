#include "engine/day_window.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "common/errors.hpp"

namespace testline {

namespace {

std::int64_t floorDiv(std::int64_t value, std::int64_t divisor)
{
    std::int64_t quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

std::int64_t toMillis(TimePoint instant)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               instant.time_since_epoch())
        .count();
}

TimePoint fromMillis(std::int64_t millis)
{
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::milliseconds(millis)));
}

} // namespace

bool isSupportedWindow(int windowDays)
{
    return windowDays == 7 || windowDays == 14 || windowDays == 30;
}

void validateWindow(int windowDays)
{
    if (!isSupportedWindow(windowDays)) {
        throw EngineError(ErrorKind::InvalidWindow,
                          "unsupported trend window " + std::to_string(windowDays)
                              + " (expected 7, 14 or 30 days)");
    }
}

void validateCutoff(TimePoint cutoff)
{
    if (cutoff.time_since_epoch().count() < 0) {
        throw EngineError(ErrorKind::InvalidCutoff, "cutoff is before the Unix epoch");
    }
}

std::int64_t referenceDayIndex(TimePoint instant, int offsetMinutes)
{
    const std::int64_t shifted = toMillis(instant) + offsetMinutes * 60LL * 1000;
    return floorDiv(shifted, kMillisPerDay);
}

TimePoint endOfReferenceDay(std::int64_t dayIndex, int offsetMinutes)
{
    const std::int64_t endMillis =
        (dayIndex + 1) * kMillisPerDay - 1 - offsetMinutes * 60LL * 1000;
    return fromMillis(endMillis);
}

std::string referenceDayLabel(std::int64_t dayIndex)
{
    std::time_t time = static_cast<std::time_t>(dayIndex * 24 * 60 * 60);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d");
    return out.str();
}

std::vector<TimePoint> trendCutoffs(int windowDays, TimePoint now, int offsetMinutes)
{
    validateWindow(windowDays);

    const std::int64_t today = referenceDayIndex(now, offsetMinutes);
    std::vector<TimePoint> cutoffs;
    cutoffs.reserve(static_cast<std::size_t>(windowDays));
    for (int i = windowDays - 1; i >= 0; --i) {
        cutoffs.push_back(endOfReferenceDay(today - i, offsetMinutes));
    }
    return cutoffs;
}

} // namespace testline
