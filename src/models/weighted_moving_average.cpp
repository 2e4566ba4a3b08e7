#include "stock-coverage/models/weighted_moving_average.hpp"
#include "stock-coverage/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iterator>

namespace stockcoverage::models {

namespace {

constexpr double kMinAvailabilityWeight = 0.5;
constexpr double kPromotionWeight = 0.8;
constexpr std::size_t kRecentDays = 14;
constexpr double kStableRecentFactor = 0.7;
constexpr double kVolatileRecentFactor = 1.3;

double zScoreFor(double confidence_level) {
	if (std::abs(confidence_level - 0.90) < 1e-9) {
		return 1.645;
	}
	if (std::abs(confidence_level - 0.99) < 1e-9) {
		return 2.576;
	}
	return 1.96;
}

double coefficientOfVariation(const core::WeightedAverageResult &result) {
	return result.mean > 0.0 ? result.standard_deviation / result.mean : 0.0;
}

} // namespace

WeightedMovingAverage::WeightedMovingAverage(const config::StockCoverageConfig &config) : config_(config) {
}

double WeightedMovingAverage::calculateWeight(const core::ProcessedDataPoint &point, core::TimePoint reference) const {
	const auto days_diff =
	    static_cast<double>(core::calendar::dayNumber(reference) - core::calendar::dayNumber(point.date));
	const double time_weight = std::pow(0.5, days_diff / config_.half_life);

	double adjustment = 1.0;
	if (point.availability_factor < 1.0) {
		adjustment *= std::max(kMinAvailabilityWeight, point.availability_factor);
	}
	if (config_.enable_promotion_adjustment && point.is_promotion) {
		adjustment *= kPromotionWeight;
	}
	return time_weight * adjustment;
}

core::WeightedAverageResult WeightedMovingAverage::calculate(const std::vector<core::ProcessedDataPoint> &data) const {
	core::WeightedAverageResult result;
	if (data.empty()) {
		return result;
	}

	const core::TimePoint reference = data.back().date;
	std::vector<double> weights;
	weights.reserve(data.size());

	double sum_weighted = 0.0;
	double sum_weights = 0.0;
	double sum_squared_weights = 0.0;
	for (const auto &point : data) {
		const double weight = calculateWeight(point, reference);
		weights.push_back(weight);
		sum_weighted += point.adjusted_demand * weight;
		sum_weights += weight;
		sum_squared_weights += weight * weight;
	}
	if (sum_weights <= 0.0) {
		return result;
	}

	result.mean = sum_weighted / sum_weights;

	double sum_squared_diff = 0.0;
	for (std::size_t i = 0; i < data.size(); ++i) {
		const double diff = data[i].adjusted_demand - result.mean;
		sum_squared_diff += weights[i] * diff * diff;
	}
	result.variance = sum_squared_diff / sum_weights;
	result.standard_deviation = std::sqrt(result.variance);
	result.sum_weights = sum_weights;
	result.effective_samples = (sum_weights * sum_weights) / sum_squared_weights;

	STOCKCOVERAGE_TRACE("EWMA over {} points: mean={:.4f} sd={:.4f} n_eff={:.2f}", data.size(), result.mean,
	                    result.standard_deviation, result.effective_samples);
	return result;
}

std::array<core::WeightedAverageResult, core::calendar::kDaysPerWeek>
WeightedMovingAverage::calculateByDayOfWeek(const std::vector<core::ProcessedDataPoint> &data) const {
	const core::WeightedAverageResult overall = calculate(data);

	std::array<core::WeightedAverageResult, core::calendar::kDaysPerWeek> by_day;
	for (int dow = 0; dow < core::calendar::kDaysPerWeek; ++dow) {
		std::vector<core::ProcessedDataPoint> day_data;
		std::copy_if(data.begin(), data.end(), std::back_inserter(day_data),
		             [dow](const core::ProcessedDataPoint &p) { return p.day_of_week == dow; });
		by_day[static_cast<std::size_t>(dow)] = day_data.empty() ? overall : calculate(day_data);
	}
	return by_day;
}

std::vector<double> WeightedMovingAverage::calculateRolling(const std::vector<core::ProcessedDataPoint> &data,
                                                            int window_days) const {
	const std::size_t window = static_cast<std::size_t>(std::max(1, window_days));
	std::vector<double> results;
	results.reserve(data.size());
	for (std::size_t i = 0; i < data.size(); ++i) {
		const std::size_t start = i + 1 >= window ? i + 1 - window : 0;
		const std::vector<core::ProcessedDataPoint> slice(data.begin() + static_cast<std::ptrdiff_t>(start),
		                                                  data.begin() + static_cast<std::ptrdiff_t>(i + 1));
		results.push_back(calculate(slice).mean);
	}
	return results;
}

ConfidenceInterval WeightedMovingAverage::calculateConfidenceInterval(const core::WeightedAverageResult &result,
                                                                      double confidence_level) const {
	const double standard_error = result.effective_samples > 0.0
	                                  ? result.standard_deviation / std::sqrt(result.effective_samples)
	                                  : result.standard_deviation;
	const double margin = zScoreFor(confidence_level) * standard_error;
	return {std::max(0.0, result.mean - margin), result.mean + margin};
}

std::vector<double> WeightedMovingAverage::calculateAdaptiveWeights(
    const std::vector<core::ProcessedDataPoint> &data) const {
	if (data.empty()) {
		return {};
	}

	const std::size_t split = data.size() > kRecentDays ? data.size() - kRecentDays : 0;
	const std::vector<core::ProcessedDataPoint> older(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(split));
	const std::vector<core::ProcessedDataPoint> recent(data.begin() + static_cast<std::ptrdiff_t>(split), data.end());

	// A steadier recent window earns less extra emphasis than a volatile one.
	const double adaptive_factor = coefficientOfVariation(calculate(recent)) < coefficientOfVariation(calculate(older))
	                                   ? kStableRecentFactor
	                                   : kVolatileRecentFactor;

	const core::TimePoint reference = data.back().date;
	const std::int64_t reference_day = core::calendar::dayNumber(reference);
	std::vector<double> weights;
	weights.reserve(data.size());
	for (const auto &point : data) {
		const double base = calculateWeight(point, reference);
		const std::int64_t age = reference_day - core::calendar::dayNumber(point.date);
		weights.push_back(age <= static_cast<std::int64_t>(kRecentDays) ? base * adaptive_factor : base);
	}
	return weights;
}

} // namespace stockcoverage::models
