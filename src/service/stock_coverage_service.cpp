#include "stock-coverage/service/stock_coverage_service.hpp"
#include "stock-coverage/core/errors.hpp"
#include "stock-coverage/utils/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace stockcoverage::service {

namespace {

constexpr int kRecentSalesDays = 7;
constexpr double kDaysPerYear = 365.0;
constexpr double kOverstockedCoverageDays = 60.0;

} // namespace

StockCoverageService::StockCoverageService(std::shared_ptr<const ISalesDataSource> source,
                                           const std::optional<config::PartialStockCoverageConfig> &config)
    : source_(std::move(source)), calculator_(config) {
	if (!source_) {
		throw std::invalid_argument("StockCoverageService requires a data source");
	}
}

core::StockCoverageInput StockCoverageService::fetchOrThrow(const std::string &sku, int historical_days) const {
	auto input = source_->fetch(sku, historical_days);
	if (!input) {
		throw core::StockCoverageCalculationError(core::ErrorType::InsufficientData, "Product not found", sku);
	}
	return std::move(*input);
}

core::StockCoverageResult StockCoverageService::calculateCoverage(const std::string &sku) const {
	return calculator_.calculate(fetchOrThrow(sku, calculator_.config().historical_days));
}

core::BatchProcessingResult
StockCoverageService::calculateBatchCoverage(const std::vector<std::string> &skus,
                                             const calculator::ProgressCallback &on_progress) const {
	const auto started = std::chrono::steady_clock::now();
	core::BatchProcessingResult summary;

	std::vector<core::StockCoverageInput> inputs;
	inputs.reserve(skus.size());
	std::set<std::string> seen;
	for (const auto &sku : skus) {
		if (!seen.insert(sku).second) {
			STOCKCOVERAGE_DEBUG("Skipping repeated SKU {} in batch", sku);
			continue;
		}
		auto input = source_->fetch(sku, calculator_.config().historical_days);
		if (!input) {
			STOCKCOVERAGE_ERROR("Batch calculation failed for {}: product not found", sku);
			summary.failed.push_back(sku);
			summary.errors[sku] = "Product not found";
			continue;
		}
		inputs.push_back(std::move(*input));
	}

	const auto batch = calculator_.calculateBatchDetailed(inputs, on_progress);
	for (const auto &input : inputs) {
		const std::string &sku = input.product.sku;
		if (batch.results.count(sku) != 0) {
			summary.successful.push_back(sku);
			continue;
		}
		summary.failed.push_back(sku);
		const auto error = batch.errors.find(sku);
		summary.errors[sku] = error != batch.errors.end() ? error->second : "Unknown error";
	}

	summary.total_time_ms =
	    std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
	const std::size_t processed = summary.successful.size() + summary.failed.size();
	summary.average_time_per_sku_ms = processed > 0 ? summary.total_time_ms / static_cast<double>(processed) : 0.0;

	STOCKCOVERAGE_INFO("Coverage batch: {} successful, {} failed in {:.1f} ms", summary.successful.size(),
	                   summary.failed.size(), summary.total_time_ms);
	return summary;
}

CoverageWithInsights StockCoverageService::getCoverageWithInsights(const std::string &sku) const {
	CoverageWithInsights out;
	out.coverage = calculateCoverage(sku);

	const auto recent = fetchOrThrow(sku, kRecentSalesDays);
	out.product = recent.product;

	double recent_units = 0.0;
	for (const auto &record : recent.sales_history) {
		recent_units += record.units_sold;
	}
	auto &insights = out.insights;
	insights.recent_average_daily_sales = recent_units / kRecentSalesDays;
	if (insights.recent_average_daily_sales > 0.0 && out.product.current_stock > 0.0) {
		insights.stock_turnover = kDaysPerYear / (out.product.current_stock / insights.recent_average_daily_sales);
	}
	insights.days_of_supply = out.coverage.coverage_days;
	insights.is_overstocked = out.coverage.coverage_days > kOverstockedCoverageDays;
	insights.needs_reorder = out.product.current_stock <= out.product.minimum_stock;
	insights.stockout_risk = out.coverage.stockout_risk;
	return out;
}

std::vector<StockoutRiskEntry> StockCoverageService::getStockoutRiskProducts(double risk_threshold) const {
	std::vector<core::StockCoverageInput> inputs;
	for (const auto &sku : source_->listSkus()) {
		auto input = source_->fetch(sku, calculator_.config().historical_days);
		if (input) {
			inputs.push_back(std::move(*input));
		}
	}

	const auto batch = calculator_.calculateBatchDetailed(inputs);

	std::vector<StockoutRiskEntry> at_risk;
	for (const auto &input : inputs) {
		const auto it = batch.results.find(input.product.sku);
		if (it == batch.results.end() || it->second.stockout_risk < risk_threshold) {
			continue;
		}
		StockoutRiskEntry entry;
		entry.product = input.product;
		entry.coverage = it->second;
		entry.days_until_stockout = static_cast<std::int64_t>(std::floor(it->second.coverage_days));
		at_risk.push_back(std::move(entry));
	}

	std::stable_sort(at_risk.begin(), at_risk.end(), [](const StockoutRiskEntry &a, const StockoutRiskEntry &b) {
		return a.coverage.stockout_risk > b.coverage.stockout_risk;
	});
	STOCKCOVERAGE_DEBUG("{} of {} SKUs at or above stockout risk {:.2f}", at_risk.size(), inputs.size(),
	                    risk_threshold);
	return at_risk;
}

} // namespace stockcoverage::service
