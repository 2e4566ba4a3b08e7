#include "stock-coverage/core/types.hpp"

namespace stockcoverage::core {

const char *SeasonalityFactors::dayName(std::size_t day_of_week) {
	static const char *const names[] = {"sunday",   "monday", "tuesday", "wednesday",
	                                    "thursday", "friday", "saturday"};
	return day_of_week < static_cast<std::size_t>(calendar::kDaysPerWeek) ? names[day_of_week] : "unknown";
}

} // namespace stockcoverage::core
