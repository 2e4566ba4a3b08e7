#pragma once

#include "stock-coverage/config/config.hpp"
#include "stock-coverage/core/types.hpp"
#include "stock-coverage/models/weighted_moving_average.hpp"
#include "stock-coverage/preprocessing/data_preprocessor.hpp"
#include "stock-coverage/seasonality/seasonality_adjuster.hpp"
#include "stock-coverage/trend/trend_analyzer.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stockcoverage::calculator {

/// Demand projection for the forecast horizon.
struct DemandForecast {
	double demand_forecast = 0.0;
	double demand_std_dev = 0.0;
	/// Level after the (optional) trend projection, before seasonality.
	double adjusted_demand = 0.0;
	double seasonality_index = 1.0;
};

/// Coverage days under the low, median and high demand scenarios.
struct CoveragePercentiles {
	double p10 = 0.0;
	double p50 = 0.0;
	double p90 = 0.0;
};

struct Recommendations {
	double reorder_point = 0.0;
	double reorder_quantity = 0.0;
	double stockout_risk = 0.0;
};

/// Results of a batch run together with the messages of the SKUs that failed.
struct BatchCalculationResult {
	core::StockCoverageResultMap results;
	std::map<std::string, std::string> errors;
	/// True when the cancellation predicate stopped the run before the last chunk.
	bool cancelled = false;
};

/// Called after every chunk with (completed, total).
using ProgressCallback = std::function<void(std::size_t, std::size_t)>;
/// Polled between chunks; returning true stops the batch.
using CancellationPredicate = std::function<bool()>;

/**
 * @class StockCoverageCalculator
 * @brief Runs the full coverage pipeline for one SKU or a batch of SKUs.
 *
 * The configuration is merged, validated and frozen at construction. A
 * calculation reads nothing but its input and that configuration, so one
 * instance can serve concurrent callers.
 *
 * @code
 * calculator::StockCoverageCalculator calc(config::presetConfig(config::ConfigPreset::Balanced));
 * const auto result = calc.calculate(input);
 * @endcode
 */
class StockCoverageCalculator {
public:
	/// @throws core::StockCoverageCalculationError (InvalidConfiguration) listing every violated bound.
	explicit StockCoverageCalculator(const std::optional<config::PartialStockCoverageConfig> &config = std::nullopt);

	/**
	 * @brief Computes coverage, forecast and replenishment figures for one SKU.
	 * @throws core::StockCoverageCalculationError (InvalidInput) for malformed input.
	 */
	core::StockCoverageResult calculate(const core::StockCoverageInput &input) const;

	/**
	 * @brief Calculates every input, @c batch_size items at a time.
	 *
	 * Items of a chunk are shared out to at most one worker per hardware
	 * thread, the calling thread included, and chunks run one after another.
	 * A failing item is logged and reported in @c errors; it never aborts
	 * the batch. When a SKU appears more than once, its last occurrence
	 * decides whether it lands in @c results or in @c errors.
	 */
	BatchCalculationResult calculateBatchDetailed(const std::vector<core::StockCoverageInput> &inputs,
	                                              const ProgressCallback &on_progress = nullptr,
	                                              const CancellationPredicate &is_cancelled = nullptr) const;

	/// Successful results keyed by SKU; failures are only logged.
	core::StockCoverageResultMap calculateBatch(const std::vector<core::StockCoverageInput> &inputs,
	                                            const ProgressCallback &on_progress = nullptr) const;

	DemandForecast generateForecast(double base_demand, const core::TrendAnalysis &trend,
	                                const core::SeasonalityFactors &factors, core::TimePoint start_date) const;

	/// Returns 999 days for every scenario when demand is zero but stock remains.
	static CoveragePercentiles calculateCoverage(double current_stock, double demand_forecast, double demand_std_dev);

	Recommendations calculateRecommendations(const core::Product &product, double demand_forecast,
	                                         double demand_std_dev) const;

	/// Heuristic risk in [0, 1] of running out before a replenishment arrives.
	static double calculateStockoutProbability(double days_until_stockout, double lead_time_days,
	                                           double coefficient_of_variation);

	static double calculateOverallConfidence(const core::DataQualityScore &quality, double trend_confidence,
	                                         std::size_t points_used);

	const config::StockCoverageConfig &config() const {
		return config_;
	}

private:
	config::StockCoverageConfig config_;
	preprocessing::DataPreprocessor preprocessor_;
	seasonality::SeasonalityAdjuster seasonality_;
	trend::TrendAnalyzer trend_;
	models::WeightedMovingAverage weighted_average_;
};

} // namespace stockcoverage::calculator
