#include <catch2/catch_test_macros.hpp>

#include "stock-coverage/core/calendar.hpp"
#include "stock-coverage/core/types.hpp"

#include <chrono>
#include <string>

namespace calendar = stockcoverage::core::calendar;

TEST_CASE("Calendar buckets timestamps into UTC days", "[core][calendar]") {
	const auto midnight = calendar::makeDate(2024, 3, 31);
	REQUIRE(calendar::dayNumber(midnight) == 19813);
	REQUIRE(calendar::dayNumber(midnight + std::chrono::hours(23)) == 19813);
	REQUIRE(calendar::dayNumber(midnight - std::chrono::seconds(1)) == 19812);
	REQUIRE(calendar::startOfDay(midnight + std::chrono::hours(5)) == midnight);
	REQUIRE(calendar::dayNumber(calendar::fromDayNumber(-1)) == -1);
}

TEST_CASE("Calendar weekday and month lookups", "[core][calendar]") {
	REQUIRE(calendar::dayOfWeek(calendar::makeDate(1970, 1, 1)) == 4);
	REQUIRE(calendar::dayOfWeek(calendar::makeDate(2024, 3, 31)) == 0);
	REQUIRE(calendar::dayOfWeek(calendar::makeDate(2024, 4, 6)) == 6);
	REQUIRE(calendar::dayOfWeek(calendar::makeDate(1969, 12, 31)) == 3);

	REQUIRE(calendar::monthOfYear(calendar::makeDate(2024, 1, 31)) == 0);
	REQUIRE(calendar::monthOfYear(calendar::makeDate(2024, 2, 29)) == 1);
	REQUIRE(calendar::monthOfYear(calendar::makeDate(2023, 12, 1)) == 11);

	REQUIRE(calendar::addDays(calendar::makeDate(2024, 2, 28), 2) == calendar::makeDate(2024, 3, 1));
}

TEST_CASE("Seasonality factors expose named weekdays", "[core][types]") {
	auto factors = stockcoverage::core::SeasonalityFactors::neutral();
	factors[6] = 1.3;
	REQUIRE(factors.saturday() == 1.3);
	REQUIRE(factors.sunday() == 1.0);
	REQUIRE(std::string(stockcoverage::core::SeasonalityFactors::dayName(1)) == "monday");
}
