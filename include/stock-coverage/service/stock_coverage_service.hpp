#pragma once

#include "stock-coverage/calculator/stock_coverage_calculator.hpp"
#include "stock-coverage/service/isales_data_source.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stockcoverage::service {

/// Operational indicators derived from a coverage result and the last week of sales.
struct CoverageInsights {
	double recent_average_daily_sales = 0.0;
	/// Annualized turns at the recent sales rate; 0 without recent sales.
	double stock_turnover = 0.0;
	double days_of_supply = 0.0;
	bool is_overstocked = false;
	bool needs_reorder = false;
	double stockout_risk = 0.0;
};

struct CoverageWithInsights {
	core::Product product;
	core::StockCoverageResult coverage;
	CoverageInsights insights;
};

struct StockoutRiskEntry {
	core::Product product;
	core::StockCoverageResult coverage;
	std::int64_t days_until_stockout = 0;
};

/**
 * @class StockCoverageService
 * @brief Looks SKUs up in a data source and runs them through the calculator.
 */
class StockCoverageService {
public:
	/// @throws core::StockCoverageCalculationError (InvalidConfiguration) for an invalid @p config.
	explicit StockCoverageService(std::shared_ptr<const ISalesDataSource> source,
	                              const std::optional<config::PartialStockCoverageConfig> &config = std::nullopt);

	/// @throws core::StockCoverageCalculationError (InsufficientData) when the SKU is unknown.
	core::StockCoverageResult calculateCoverage(const std::string &sku) const;

	/// Calculates every distinct SKU once; unknown or failing SKUs land in @c failed with their message.
	core::BatchProcessingResult calculateBatchCoverage(const std::vector<std::string> &skus,
	                                                   const calculator::ProgressCallback &on_progress = nullptr) const;

	CoverageWithInsights getCoverageWithInsights(const std::string &sku) const;

	/// SKUs of the data source whose stockout risk is at least @p risk_threshold, riskiest first.
	std::vector<StockoutRiskEntry> getStockoutRiskProducts(double risk_threshold = 0.5) const;

	const calculator::StockCoverageCalculator &calculator() const {
		return calculator_;
	}

private:
	core::StockCoverageInput fetchOrThrow(const std::string &sku, int historical_days) const;

	std::shared_ptr<const ISalesDataSource> source_;
	calculator::StockCoverageCalculator calculator_;
};

} // namespace stockcoverage::service
