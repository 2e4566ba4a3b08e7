#include "stock-coverage/calculator/stock_coverage_calculator.hpp"
#include "stock-coverage/config/config_validator.hpp"
#include "stock-coverage/core/errors.hpp"
#include "stock-coverage/utils/logging.hpp"
#include "stock-coverage/utils/statistics.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <future>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

namespace stockcoverage::calculator {

namespace {

// Trend projections are only trusted above this fit confidence.
constexpr double kTrendConfidenceGate = 0.3;

// Floor of the optimistic scenario demand, lowered to the forecast itself for slower movers.
constexpr double kMinScenarioDemand = 0.1;

// Economic order quantity inputs.
constexpr double kOrderingCost = 50.0;
constexpr double kAnnualHoldingCostRate = 0.25;
constexpr double kDaysPerYear = 365.0;

// Overall confidence blend.
constexpr double kQualityWeight = 0.4;
constexpr double kTrendWeight = 0.3;
constexpr double kVolumeWeight = 0.3;
constexpr double kVolumeTargetPoints = 30.0;

std::size_t workerCount(std::size_t items) {
	const std::size_t hardware = std::max<std::size_t>(1, std::thread::hardware_concurrency());
	return std::min(items, hardware);
}

} // namespace

StockCoverageCalculator::StockCoverageCalculator(const std::optional<config::PartialStockCoverageConfig> &config)
    : config_(config::ConfigValidator::mergeAndValidate(config)), preprocessor_(config_), seasonality_(config_),
      trend_(config_), weighted_average_(config_) {
	STOCKCOVERAGE_DEBUG("Calculator ready: historicalDays={} horizon={} halfLife={} serviceLevel={}",
	                    config_.historical_days, config_.forecast_horizon, config_.half_life, config_.service_level);
}

core::StockCoverageResult StockCoverageCalculator::calculate(const core::StockCoverageInput &input) const {
	const core::TimePoint today = input.current_date.value_or(std::chrono::system_clock::now());

	const auto processed = preprocessor_.preprocess(input, today);
	const auto quality = preprocessor_.calculateDataQuality(processed);

	const auto factors = seasonality_.calculateSeasonalityFactors(processed);
	const auto deseasonalized = seasonality_.deseasonalize(processed, factors);

	const auto trend = trend_.analyze(deseasonalized);
	const auto average = weighted_average_.calculate(deseasonalized);

	const auto forecast = generateForecast(average.mean, trend, factors, today);
	const auto coverage =
	    calculateCoverage(input.product.current_stock, forecast.demand_forecast, forecast.demand_std_dev);
	const auto recommendations =
	    calculateRecommendations(input.product, forecast.demand_forecast, forecast.demand_std_dev);

	core::StockCoverageResult result;
	result.coverage_days = coverage.p50;
	result.coverage_days_p90 = coverage.p90;
	result.coverage_days_p10 = coverage.p10;

	result.demand_forecast = forecast.demand_forecast;
	result.demand_std_dev = forecast.demand_std_dev;
	result.adjusted_demand = forecast.adjusted_demand;

	result.trend_factor = trend.trend_factor;
	result.seasonality_index = forecast.seasonality_index;
	result.availability_adjustment = preprocessor_.availabilityAdjustment(processed);

	result.confidence = calculateOverallConfidence(quality, trend.confidence, processed.size());
	result.data_quality = quality;

	result.reorder_point = recommendations.reorder_point;
	result.reorder_quantity = recommendations.reorder_quantity;
	result.stockout_risk = recommendations.stockout_risk;

	result.historical_days_used = processed.size();
	result.algorithm = core::kAlgorithmVersion;
	result.calculated_at = std::chrono::system_clock::now();
	result.expires_at = result.calculated_at + std::chrono::seconds(config_.cache_timeout_seconds);

	STOCKCOVERAGE_DEBUG("{}: forecast={:.3f}/day coverage={:.1f}d (p10 {:.1f}, p90 {:.1f}) risk={:.2f} "
	                    "confidence={:.2f}",
	                    input.product.sku, result.demand_forecast, result.coverage_days, result.coverage_days_p10,
	                    result.coverage_days_p90, result.stockout_risk, result.confidence);
	return result;
}

DemandForecast StockCoverageCalculator::generateForecast(double base_demand, const core::TrendAnalysis &trend,
                                                         const core::SeasonalityFactors &factors,
                                                         core::TimePoint start_date) const {
	DemandForecast forecast;

	double level = base_demand;
	// The flat fallback of a skipped fit carries no growth information.
	const bool fitted = trend.slope != 0.0 || trend.r_squared != 0.0;
	if (config_.enable_trend_correction && fitted && trend.confidence > kTrendConfidenceGate) {
		// Projected to the middle of the horizon.
		const int midpoint = config_.forecast_horizon / 2;
		level = trend.current_level * std::pow(trend.trend_factor, midpoint);
	}

	forecast.seasonality_index = seasonality_.averageFactor(start_date, config_.forecast_horizon, factors);
	forecast.adjusted_demand = level;
	forecast.demand_forecast = std::max(0.0, level * forecast.seasonality_index);

	const double base_std_dev = std::sqrt(std::max(0.0, base_demand));
	const double trend_uncertainty = std::abs(trend.slope) * config_.forecast_horizon;
	forecast.demand_std_dev = base_std_dev * (1.0 + trend_uncertainty);
	return forecast;
}

CoveragePercentiles StockCoverageCalculator::calculateCoverage(double current_stock, double demand_forecast,
                                                               double demand_std_dev) {
	if (demand_forecast <= 0.0) {
		const double days = current_stock > 0.0 ? core::kInfiniteCoverageDays : 0.0;
		return {days, days, days};
	}

	const double low_demand = std::max(std::min(kMinScenarioDemand, demand_forecast),
	                                   demand_forecast + core::z_scores::kP10 * demand_std_dev);
	const double high_demand = demand_forecast + core::z_scores::kP90 * demand_std_dev;

	CoveragePercentiles coverage;
	coverage.p10 = current_stock / low_demand;
	coverage.p50 = current_stock / demand_forecast;
	coverage.p90 = current_stock / high_demand;
	return coverage;
}

Recommendations StockCoverageCalculator::calculateRecommendations(const core::Product &product, double demand_forecast,
                                                                  double demand_std_dev) const {
	Recommendations out;

	const double safety_z = utils::statistics::normalQuantile(config_.service_level);
	const double lead_time_demand = demand_forecast * product.lead_time_days;
	const double lead_time_std_dev = demand_std_dev * std::sqrt(product.lead_time_days);
	const double safety_stock = safety_z * lead_time_std_dev + config_.safety_stock_days * demand_forecast;
	out.reorder_point = std::ceil(lead_time_demand + safety_stock);

	const double headroom = product.maximum_stock - product.current_stock;
	double eoq = headroom;
	if (product.cost_price > 0.0) {
		const double annual_demand = demand_forecast * kDaysPerYear;
		eoq = std::ceil(std::sqrt(2.0 * annual_demand * kOrderingCost / (kAnnualHoldingCostRate * product.cost_price)));
	}
	out.reorder_quantity = std::max(0.0, std::min(std::max(eoq, product.minimum_stock), headroom));

	if (demand_forecast > 0.0) {
		out.stockout_risk = calculateStockoutProbability(product.current_stock / demand_forecast,
		                                                 product.lead_time_days, demand_std_dev / demand_forecast);
	} else {
		out.stockout_risk = product.current_stock > 0.0 ? 0.0 : 1.0;
	}
	return out;
}

double StockCoverageCalculator::calculateStockoutProbability(double days_until_stockout, double lead_time_days,
                                                             double coefficient_of_variation) {
	if (days_until_stockout > lead_time_days * 2.0) {
		return 0.0;
	}
	if (days_until_stockout <= 0.0) {
		return 1.0;
	}

	const double ratio = days_until_stockout / lead_time_days;
	const double variability = 1.0 + coefficient_of_variation;

	double risk;
	if (ratio > 1.5) {
		risk = 0.1 * variability - 0.1;
	} else if (ratio > 1.0) {
		risk = 0.3 * variability - 0.2;
	} else if (ratio > 0.5) {
		risk = 0.6 * variability - 0.3;
	} else {
		risk = 0.9 * variability;
	}
	return utils::statistics::clampUnit(risk);
}

double StockCoverageCalculator::calculateOverallConfidence(const core::DataQualityScore &quality,
                                                           double trend_confidence, std::size_t points_used) {
	const double volume = std::min(1.0, static_cast<double>(points_used) / kVolumeTargetPoints);
	return utils::statistics::clampUnit(kQualityWeight * quality.overall_score + kTrendWeight * trend_confidence +
	                                    kVolumeWeight * volume);
}

BatchCalculationResult StockCoverageCalculator::calculateBatchDetailed(
    const std::vector<core::StockCoverageInput> &inputs, const ProgressCallback &on_progress,
    const CancellationPredicate &is_cancelled) const {
	BatchCalculationResult batch;
	const std::size_t total = inputs.size();
	const auto chunk_size = static_cast<std::size_t>(config_.batch_size);

	STOCKCOVERAGE_INFO("Batch of {} SKUs in chunks of {}", total, chunk_size);

	for (std::size_t begin = 0; begin < total; begin += chunk_size) {
		if (is_cancelled && is_cancelled()) {
			STOCKCOVERAGE_WARN("Batch cancelled after {} of {} SKUs", begin, total);
			batch.cancelled = true;
			break;
		}

		const std::size_t end = std::min(begin + chunk_size, total);
		const std::size_t count = end - begin;
		std::vector<std::optional<core::StockCoverageResult>> outcomes(count);
		std::vector<std::string> failures(count);

		// Workers pull the next unclaimed item of the chunk until none is left.
		std::atomic<std::size_t> next {0};
		auto drain = [this, &inputs, &outcomes, &failures, &next, begin, count]() {
			for (std::size_t k = next++; k < count; k = next++) {
				try {
					outcomes[k] = calculate(inputs[begin + k]);
				} catch (const std::exception &e) {
					failures[k] = e.what();
				}
			}
		};

		std::vector<std::future<void>> workers;
		const std::size_t extra_workers = workerCount(count) - 1;
		workers.reserve(extra_workers);
		for (std::size_t w = 0; w < extra_workers; ++w) {
			try {
				workers.push_back(std::async(std::launch::async, drain));
			} catch (const std::system_error &e) {
				STOCKCOVERAGE_WARN("Could not start batch worker: {}; continuing with {} worker(s)", e.what(),
				                   workers.size() + 1);
				break;
			}
		}
		drain();
		for (auto &worker : workers) {
			worker.get();
		}

		// A repeated SKU keeps the outcome of its last occurrence.
		for (std::size_t k = 0; k < count; ++k) {
			const std::string &sku = inputs[begin + k].product.sku;
			if (outcomes[k]) {
				batch.errors.erase(sku);
				batch.results.insert_or_assign(sku, std::move(*outcomes[k]));
			} else {
				STOCKCOVERAGE_ERROR("Failed to calculate coverage for {}: {}", sku, failures[k]);
				batch.results.erase(sku);
				batch.errors.insert_or_assign(sku, failures[k]);
			}
		}

		STOCKCOVERAGE_DEBUG("Batch progress {}/{}", end, total);
		if (on_progress) {
			on_progress(end, total);
		}
	}

	STOCKCOVERAGE_INFO("Batch finished: {} succeeded, {} failed", batch.results.size(), batch.errors.size());
	return batch;
}

core::StockCoverageResultMap StockCoverageCalculator::calculateBatch(const std::vector<core::StockCoverageInput> &inputs,
                                                                     const ProgressCallback &on_progress) const {
	return std::move(calculateBatchDetailed(inputs, on_progress).results);
}

} // namespace stockcoverage::calculator
