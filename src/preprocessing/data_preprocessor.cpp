#include "stock-coverage/preprocessing/data_preprocessor.hpp"
#include "stock-coverage/core/errors.hpp"
#include "stock-coverage/utils/logging.hpp"
#include "stock-coverage/utils/statistics.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <unordered_map>

namespace stockcoverage::preprocessing {

namespace {

using core::ErrorType;
using core::ProcessedDataPoint;
using core::StockCoverageCalculationError;
namespace calendar = core::calendar;

// Half-width of the neighbourhood used for the local median.
constexpr std::size_t kMedianWindow = 7;
// Same-weekday look-back for stockout imputation.
constexpr std::int64_t kImputationLookbackDays = 28;
// Modified z-score rule; 0.6745 makes MAD a consistent estimator of sigma.
constexpr double kModifiedZThreshold = 3.5;
constexpr double kMadToStdDev = 0.6745;
// Promotional uplift below this ratio is left untouched.
constexpr double kPromotionUpliftThreshold = 1.2;

// Quality score weights.
constexpr double kCompletenessWeight = 0.3;
constexpr double kConsistencyWeight = 0.3;
constexpr double kAvailabilityWeight = 0.2;
constexpr double kOutlierWeight = 0.2;

void requireNonNegative(double value, const char *field, const std::string &sku) {
	if (!std::isfinite(value) || value < 0.0) {
		throw StockCoverageCalculationError(ErrorType::InvalidInput,
		                                    std::string(field) + " must be a non-negative finite number", sku);
	}
}

double localMedian(const std::vector<ProcessedDataPoint> &data, std::size_t index) {
	const std::size_t start = index >= kMedianWindow ? index - kMedianWindow : 0;
	const std::size_t end = std::min(data.size(), index + kMedianWindow + 1);

	std::vector<double> window;
	window.reserve(end - start);
	for (std::size_t i = start; i < end; ++i) {
		if (data[i].original_sales > 0.0) {
			window.push_back(data[i].original_sales);
		}
	}
	if (window.empty()) {
		return data[index].original_sales;
	}
	return utils::statistics::upperMedian(std::move(window));
}

} // namespace

DataPreprocessor::DataPreprocessor(const config::StockCoverageConfig &config) : config_(config) {
}

void DataPreprocessor::validateInput(const core::StockCoverageInput &input) {
	const auto &product = input.product;
	if (product.sku.empty()) {
		throw StockCoverageCalculationError(ErrorType::InvalidInput, "Product SKU is required");
	}
	requireNonNegative(product.current_stock, "currentStock", product.sku);
	requireNonNegative(product.minimum_stock, "minimumStock", product.sku);
	requireNonNegative(product.maximum_stock, "maximumStock", product.sku);
	requireNonNegative(product.lead_time_days, "leadTimeDays", product.sku);
	requireNonNegative(product.cost_price, "costPrice", product.sku);
	if (product.maximum_stock < product.minimum_stock) {
		throw StockCoverageCalculationError(ErrorType::InvalidInput, "maximumStock must not be below minimumStock",
		                                    product.sku);
	}

	std::int64_t previous_day = 0;
	for (std::size_t i = 0; i < input.sales_history.size(); ++i) {
		const auto &record = input.sales_history[i];
		requireNonNegative(record.units_sold, "unitsSold", product.sku);
		const std::int64_t day = calendar::dayNumber(record.date);
		if (i > 0 && day <= previous_day) {
			throw StockCoverageCalculationError(ErrorType::InvalidInput,
			                                    "Sales history must be chronological with one record per day",
			                                    product.sku);
		}
		previous_day = day;
	}

	for (const auto &record : input.stock_availability) {
		if (!std::isfinite(record.minutes_in_stock) || record.minutes_in_stock < 0.0 ||
		    record.minutes_in_stock > core::kMinutesPerDay) {
			throw StockCoverageCalculationError(ErrorType::InvalidInput, "minutesInStock must lie in [0, 1440]",
			                                    product.sku);
		}
	}
}

std::vector<ProcessedDataPoint> DataPreprocessor::preprocess(const core::StockCoverageInput &input) const {
	return preprocess(input, input.current_date.value_or(std::chrono::system_clock::now()));
}

std::vector<ProcessedDataPoint> DataPreprocessor::preprocess(const core::StockCoverageInput &input,
                                                             core::TimePoint reference_date) const {
	validateInput(input);

	std::unordered_map<std::int64_t, double> availability_by_day;
	for (const auto &record : input.stock_availability) {
		availability_by_day[calendar::dayNumber(record.date)] = record.minutes_in_stock / core::kMinutesPerDay;
	}

	const std::int64_t today = calendar::dayNumber(reference_date);
	const std::int64_t first_day = today - config_.historical_days + 1;

	std::vector<ProcessedDataPoint> data;
	data.reserve(std::min<std::size_t>(input.sales_history.size(), static_cast<std::size_t>(config_.historical_days)));

	for (const auto &record : input.sales_history) {
		const std::int64_t day = calendar::dayNumber(record.date);
		if (day < first_day || day > today) {
			continue;
		}
		const auto availability = availability_by_day.find(day);

		ProcessedDataPoint point;
		point.date = calendar::fromDayNumber(day);
		point.day_of_week = calendar::dayOfWeek(point.date);
		point.original_sales = record.units_sold;
		point.availability_factor = availability == availability_by_day.end() ? 1.0 : availability->second;
		point.weight = std::pow(0.5, static_cast<double>(today - day) / config_.half_life);
		point.is_promotion = record.promotion_flag;
		data.push_back(point);
	}

	if (data.size() < static_cast<std::size_t>(config_.historical_days)) {
		STOCKCOVERAGE_DEBUG("SKU {}: {} of {} days observed in the history window.", input.product.sku, data.size(),
		                    config_.historical_days);
	}

	adjustForAvailability(data);
	detectOutliers(data);
	if (config_.enable_promotion_adjustment) {
		adjustForPromotions(data);
	}

	return data;
}

void DataPreprocessor::adjustForAvailability(std::vector<ProcessedDataPoint> &data) const {
	for (std::size_t i = 0; i < data.size(); ++i) {
		auto &point = data[i];
		const double median = localMedian(data, i);

		if (point.availability_factor >= config_.min_availability_factor) {
			const double adjusted =
			    point.original_sales / std::max(point.availability_factor, config_.min_availability_factor);
			const double cap = median * config_.outlier_cap_multiplier;
			if (adjusted > cap) {
				point.adjusted_demand = cap;
				point.is_outlier = true;
			} else {
				point.adjusted_demand = adjusted;
			}
		} else {
			// Zero sales during a stockout is not zero demand.
			point.is_available = false;
			point.adjusted_demand = imputeDemand(data, i, median);
		}
	}
}

double DataPreprocessor::imputeDemand(const std::vector<ProcessedDataPoint> &data, std::size_t index,
                                      double fallback_median) const {
	const auto &target = data[index];
	const std::int64_t target_day = calendar::dayNumber(target.date);

	double sum = 0.0;
	std::size_t count = 0;
	for (std::size_t j = index; j-- > 0;) {
		const auto &candidate = data[j];
		if (target_day - calendar::dayNumber(candidate.date) > kImputationLookbackDays) {
			break;
		}
		if (candidate.day_of_week == target.day_of_week &&
		    candidate.availability_factor >= config_.min_availability_factor) {
			sum += candidate.adjusted_demand > 0.0 ? candidate.adjusted_demand : candidate.original_sales;
			++count;
		}
	}

	if (count > 0) {
		return sum / static_cast<double>(count);
	}
	return fallback_median;
}

void DataPreprocessor::detectOutliers(std::vector<ProcessedDataPoint> &data) const {
	std::vector<double> demands;
	demands.reserve(data.size());
	for (const auto &point : data) {
		if (point.adjusted_demand > 0.0) {
			demands.push_back(point.adjusted_demand);
		}
	}
	if (demands.empty()) {
		return;
	}

	const double median = utils::statistics::upperMedian(demands);
	std::vector<double> deviations;
	deviations.reserve(demands.size());
	for (double d : demands) {
		deviations.push_back(std::abs(d - median));
	}
	const double mad = utils::statistics::upperMedian(std::move(deviations));

	if (mad == 0.0) {
		STOCKCOVERAGE_DEBUG("Median absolute deviation is zero; modified z-score capping skipped.");
		return;
	}

	const double max_value = median + kModifiedZThreshold * mad / kMadToStdDev;
	const double min_value = std::max(0.0, median - kModifiedZThreshold * mad / kMadToStdDev);

	std::size_t flagged = 0;
	for (auto &point : data) {
		if (point.adjusted_demand == 0.0) {
			continue;
		}
		const double modified_z = kMadToStdDev * (point.adjusted_demand - median) / mad;
		if (std::abs(modified_z) > kModifiedZThreshold) {
			point.is_outlier = true;
			point.adjusted_demand = std::clamp(point.adjusted_demand, min_value, max_value);
			++flagged;
		}
	}
	STOCKCOVERAGE_DEBUG("Modified z-score rule clipped {} point(s).", flagged);
}

void DataPreprocessor::adjustForPromotions(std::vector<ProcessedDataPoint> &data) const {
	double promo_sum = 0.0;
	double normal_sum = 0.0;
	std::size_t promo_count = 0;
	std::size_t normal_count = 0;

	for (const auto &point : data) {
		if (point.is_outlier) {
			continue;
		}
		if (point.is_promotion) {
			promo_sum += point.adjusted_demand;
			++promo_count;
		} else {
			normal_sum += point.adjusted_demand;
			++normal_count;
		}
	}
	if (promo_count == 0 || normal_count == 0) {
		return;
	}

	const double avg_normal = normal_sum / static_cast<double>(normal_count);
	if (avg_normal == 0.0) {
		return;
	}
	const double uplift = (promo_sum / static_cast<double>(promo_count)) / avg_normal;
	if (uplift <= kPromotionUpliftThreshold) {
		return;
	}

	for (auto &point : data) {
		if (point.is_promotion) {
			point.adjusted_demand /= uplift;
		}
	}
	STOCKCOVERAGE_DEBUG("Normalized {} promotional day(s) by uplift {:.3f}.", promo_count, uplift);
}

core::DataQualityScore DataPreprocessor::calculateDataQuality(const std::vector<ProcessedDataPoint> &data) const {
	const double expected_days = static_cast<double>(config_.historical_days);

	std::size_t low_availability = 0;
	std::size_t outliers = 0;
	std::vector<double> clean_demand;
	clean_demand.reserve(data.size());
	for (const auto &point : data) {
		if (point.availability_factor < config_.min_availability_factor) {
			++low_availability;
		}
		if (point.is_outlier) {
			++outliers;
		} else {
			clean_demand.push_back(point.adjusted_demand);
		}
	}

	core::DataQualityScore score;
	score.completeness = utils::statistics::clampUnit(static_cast<double>(data.size()) / expected_days);
	score.consistency =
	    clean_demand.empty() ? 0.0 : std::max(0.0, 1.0 - utils::statistics::coefficientOfVariation(clean_demand));
	score.availability_issues = static_cast<double>(low_availability) / expected_days;
	score.outlier_percentage = static_cast<double>(outliers) / expected_days;
	score.overall_score = utils::statistics::clampUnit(
	    kCompletenessWeight * score.completeness + kConsistencyWeight * score.consistency +
	    kAvailabilityWeight * (1.0 - score.availability_issues) + kOutlierWeight * (1.0 - score.outlier_percentage));
	return score;
}

double DataPreprocessor::availabilityAdjustment(const std::vector<ProcessedDataPoint> &data) const {
	double sum = 0.0;
	std::size_t count = 0;
	for (const auto &point : data) {
		if (!point.is_available) {
			continue;
		}
		sum += 1.0 / std::max(point.availability_factor, config_.min_availability_factor);
		++count;
	}
	return count == 0 ? 1.0 : sum / static_cast<double>(count);
}

} // namespace stockcoverage::preprocessing
