#pragma once

#include <chrono>
#include <cstdint>

namespace stockcoverage::core {

/**
 * @brief UTC calendar-day arithmetic on system_clock time points.
 *
 * Sales and availability records are bucketed to whole days; every stage
 * compares days through these helpers so the bucketing is identical
 * across the pipeline. Weekdays are numbered 0 (Sunday) to 6 (Saturday).
 */
namespace calendar {

using TimePoint = std::chrono::system_clock::time_point;

constexpr std::int64_t kSecondsPerDay = 86400;
constexpr int kDaysPerWeek = 7;

/// Number of whole days since 1970-01-01 (UTC), rounding towards negative infinity.
inline std::int64_t dayNumber(TimePoint tp) {
	const auto secs = std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch()).count();
	std::int64_t days = secs / kSecondsPerDay;
	if (secs % kSecondsPerDay < 0) {
		--days;
	}
	return days;
}

/// Midnight (UTC) of the given day number.
inline TimePoint fromDayNumber(std::int64_t day) {
	return TimePoint{} + std::chrono::seconds(day * kSecondsPerDay);
}

inline TimePoint startOfDay(TimePoint tp) {
	return fromDayNumber(dayNumber(tp));
}

inline TimePoint addDays(TimePoint tp, std::int64_t days) {
	return tp + std::chrono::seconds(days * kSecondsPerDay);
}

/// 1970-01-01 was a Thursday.
inline int dayOfWeek(TimePoint tp) {
	const std::int64_t shifted = (dayNumber(tp) + 4) % kDaysPerWeek;
	return static_cast<int>(shifted < 0 ? shifted + kDaysPerWeek : shifted);
}

/// Day number of a proleptic Gregorian date (month 1-12).
inline std::int64_t daysFromCivil(std::int64_t year, unsigned month, unsigned day) {
	year -= month <= 2 ? 1 : 0;
	const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
	const auto yoe = static_cast<unsigned>(year - era * 400);
	const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

inline TimePoint makeDate(int year, unsigned month, unsigned day) {
	return fromDayNumber(daysFromCivil(year, month, day));
}

/// Month of the year, 0 (January) to 11 (December).
inline int monthOfYear(TimePoint tp) {
	const std::int64_t z = dayNumber(tp) + 719468;
	const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	const auto doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned month = mp < 10 ? mp + 3 : mp - 9;
	return static_cast<int>(month) - 1;
}

} // namespace calendar
} // namespace stockcoverage::core
