#pragma once

#include "stock-coverage/config/config.hpp"
#include "stock-coverage/core/types.hpp"

#include <array>
#include <vector>

namespace stockcoverage::models {

/**
 * @struct ConfidenceInterval
 * @brief Interval around a weighted mean; the lower bound never goes below zero.
 */
struct ConfidenceInterval {
	double lower = 0.0;
	double upper = 0.0;
};

/**
 * @class WeightedMovingAverage
 * @brief Exponentially decayed demand estimate with half-life weighting.
 *
 * A point @c halfLife days older than the newest point weighs half as much.
 * Days with partial availability and, when promotion adjustment is enabled,
 * promotional days are additionally down-weighted.
 */
class WeightedMovingAverage {
public:
	explicit WeightedMovingAverage(const config::StockCoverageConfig &config);

	/// Weighted mean, variance and effective sample size; all zero for empty input.
	core::WeightedAverageResult calculate(const std::vector<core::ProcessedDataPoint> &data) const;

	/// Per-weekday estimates (index 0 = Sunday); weekdays without data use the overall estimate.
	std::array<core::WeightedAverageResult, core::calendar::kDaysPerWeek>
	calculateByDayOfWeek(const std::vector<core::ProcessedDataPoint> &data) const;

	/// Weighted mean of the trailing @p window_days points at every position.
	std::vector<double> calculateRolling(const std::vector<core::ProcessedDataPoint> &data, int window_days = 7) const;

	ConfidenceInterval calculateConfidenceInterval(const core::WeightedAverageResult &result,
	                                               double confidence_level = 0.95) const;

	/// Weights with the last two weeks scaled by recent-versus-older stability.
	std::vector<double> calculateAdaptiveWeights(const std::vector<core::ProcessedDataPoint> &data) const;

private:
	double calculateWeight(const core::ProcessedDataPoint &point, core::TimePoint reference) const;

	config::StockCoverageConfig config_;
};

} // namespace stockcoverage::models
