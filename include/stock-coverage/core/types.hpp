#pragma once

#include "stock-coverage/core/calendar.hpp"

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stockcoverage::core {

using TimePoint = calendar::TimePoint;

/// Identifier of the numerical pipeline; bump it whenever results change.
inline constexpr const char *kAlgorithmVersion = "EWMA_TREND_SEASONALITY_V1";

/// Coverage reported when nothing is being consumed but stock remains.
inline constexpr double kInfiniteCoverageDays = 999.0;

/// Minutes in a fully stocked day.
inline constexpr double kMinutesPerDay = 1440.0;

/**
 * @brief Standard-normal quantiles of the coverage scenarios.
 */
namespace z_scores {
inline constexpr double kP10 = -1.28;
inline constexpr double kP90 = 1.28;
} // namespace z_scores

/**
 * @struct Product
 * @brief Stock position and replenishment constraints of one SKU.
 */
struct Product {
	std::string sku;
	double current_stock = 0.0;
	double minimum_stock = 0.0;
	double maximum_stock = 0.0;
	double lead_time_days = 0.0;
	/// Unit cost; zero means unknown.
	double cost_price = 0.0;
};

/// Units sold on one calendar day.
struct SalesRecord {
	TimePoint date{};
	double units_sold = 0.0;
	bool promotion_flag = false;
};

/// Minutes the SKU was on the shelf during one calendar day.
struct StockAvailabilityRecord {
	TimePoint date{};
	double minutes_in_stock = kMinutesPerDay;
};

/**
 * @struct StockCoverageInput
 * @brief Everything a single calculation needs for one SKU.
 *
 * Sales history must be chronological with at most one record per day.
 * Days without an availability record are treated as fully stocked.
 */
struct StockCoverageInput {
	Product product;
	std::vector<SalesRecord> sales_history;
	std::vector<StockAvailabilityRecord> stock_availability;
	/// Reference "today"; the current time when unset.
	std::optional<TimePoint> current_date;
};

/**
 * @struct ProcessedDataPoint
 * @brief One cleaned daily observation produced by the preprocessor.
 */
struct ProcessedDataPoint {
	TimePoint date{};
	int day_of_week = 0;
	double original_sales = 0.0;
	double availability_factor = 1.0;
	double adjusted_demand = 0.0;
	/// Exponential recency weight, 0.5^(age / halfLife).
	double weight = 1.0;
	/// False for stockout days whose demand was imputed.
	bool is_available = true;
	bool is_promotion = false;
	bool is_outlier = false;
};

/**
 * @struct DataQualityScore
 * @brief Composite assessment of the history behind a calculation.
 */
struct DataQualityScore {
	double completeness = 0.0;
	double consistency = 0.0;
	double availability_issues = 0.0;
	double outlier_percentage = 0.0;
	double overall_score = 0.0;
};

/**
 * @struct SeasonalityFactors
 * @brief Multiplicative day-of-week demand factors (index 0 = Sunday).
 */
struct SeasonalityFactors {
	std::array<double, calendar::kDaysPerWeek> values{{1.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0}};

	static SeasonalityFactors neutral() {
		return {};
	}

	double &operator[](std::size_t day_of_week) {
		return values.at(day_of_week);
	}
	double operator[](std::size_t day_of_week) const {
		return values.at(day_of_week);
	}

	double sunday() const { return values[0]; }
	double monday() const { return values[1]; }
	double tuesday() const { return values[2]; }
	double wednesday() const { return values[3]; }
	double thursday() const { return values[4]; }
	double friday() const { return values[5]; }
	double saturday() const { return values[6]; }

	static const char *dayName(std::size_t day_of_week);
};

/**
 * @struct TrendAnalysis
 * @brief Log-linear trend fit over the deseasonalized series.
 */
struct TrendAnalysis {
	double intercept = 0.0;
	double slope = 0.0;
	double r_squared = 0.0;
	/// Daily multiplicative growth, e^slope.
	double trend_factor = 1.0;
	double current_level = 0.0;
	/// Fit quality in [0, 1].
	double confidence = 0.0;
};

/**
 * @struct WeightedAverageResult
 * @brief Exponentially weighted demand estimate.
 */
struct WeightedAverageResult {
	double mean = 0.0;
	double variance = 0.0;
	double standard_deviation = 0.0;
	double sum_weights = 0.0;
	double effective_samples = 0.0;
};

/**
 * @struct StockCoverageResult
 * @brief Immutable outcome of one calculation.
 *
 * Field names and the algorithm identifier are consumed by serialization
 * layers outside this library.
 */
struct StockCoverageResult {
	double coverage_days = 0.0;
	double coverage_days_p90 = 0.0;
	double coverage_days_p10 = 0.0;

	double demand_forecast = 0.0;
	double demand_std_dev = 0.0;
	double adjusted_demand = 0.0;

	double trend_factor = 1.0;
	double seasonality_index = 1.0;
	double availability_adjustment = 1.0;

	double confidence = 0.0;
	DataQualityScore data_quality;

	double reorder_point = 0.0;
	double reorder_quantity = 0.0;
	double stockout_risk = 0.0;

	std::size_t historical_days_used = 0;
	std::string algorithm = kAlgorithmVersion;
	TimePoint calculated_at{};
	TimePoint expires_at{};
};

/// Results keyed by SKU.
using StockCoverageResultMap = std::map<std::string, StockCoverageResult>;

/**
 * @struct BatchProcessingResult
 * @brief Summary of a fleet-wide run.
 */
struct BatchProcessingResult {
	std::vector<std::string> successful;
	std::vector<std::string> failed;
	std::map<std::string, std::string> errors;
	double total_time_ms = 0.0;
	double average_time_per_sku_ms = 0.0;
};

} // namespace stockcoverage::core
