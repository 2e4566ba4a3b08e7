#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "stock-coverage/core/errors.hpp"
#include "stock-coverage/service/in_memory_sales_data_source.hpp"
#include "stock-coverage/service/stock_coverage_service.hpp"
#include "common/stock_coverage_helpers.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using Catch::Approx;
using stockcoverage::core::ErrorType;
using stockcoverage::core::StockCoverageCalculationError;
using stockcoverage::service::InMemorySalesDataSource;
using stockcoverage::service::StockCoverageService;
namespace helpers = tests::helpers;

namespace {

std::shared_ptr<InMemorySalesDataSource> makeCatalogue() {
	auto source = std::make_shared<InMemorySalesDataSource>();
	// About half a day of stock left against a week of lead time.
	source->add(helpers::makeInput(std::vector<double>(60, 10.0), helpers::makeProduct("LOW", 5.0, 10.0, 400.0, 7.0)));
	// Two weeks of stock against a week of lead time.
	source->add(helpers::makeInput(std::vector<double>(60, 10.0), helpers::makeProduct("MID", 140.0, 10.0, 400.0, 7.0)));
	source->add(
	    helpers::makeInput(std::vector<double>(60, 10.0), helpers::makeProduct("HIGH", 10000.0, 10.0, 20000.0, 7.0)));
	return source;
}

} // namespace

TEST_CASE("In-memory source trims history to the requested window", "[service][datasource]") {
	const auto source = makeCatalogue();
	REQUIRE(source->size() == 3);
	REQUIRE(source->listSkus() == std::vector<std::string>{"HIGH", "LOW", "MID"});

	const auto week = source->fetch("LOW", 7);
	REQUIRE(week.has_value());
	REQUIRE(week->sales_history.size() == 7);
	REQUIRE(week->product.current_stock == 5.0);

	REQUIRE_FALSE(source->fetch("MISSING", 30).has_value());
}

TEST_CASE("Service calculates coverage for a known SKU", "[service]") {
	const StockCoverageService service(makeCatalogue());
	const auto result = service.calculateCoverage("MID");
	REQUIRE(result.coverage_days == Approx(14.0).epsilon(1e-6));
	REQUIRE(result.historical_days_used == 60);
}

TEST_CASE("Unknown SKUs raise INSUFFICIENT_DATA", "[service]") {
	const StockCoverageService service(makeCatalogue());
	try {
		(void)service.calculateCoverage("MISSING");
		FAIL("Expected an insufficient data error");
	} catch (const StockCoverageCalculationError &e) {
		REQUIRE(e.type() == ErrorType::InsufficientData);
		REQUIRE(e.sku() == std::optional<std::string>("MISSING"));
	}
}

TEST_CASE("Batch coverage summarizes successes and failures", "[service][batch]") {
	auto source = makeCatalogue();
	source->add(helpers::makeInput({1.0, 2.0}, helpers::makeProduct("BROKEN", 10.0, 50.0, 20.0)));
	const StockCoverageService service(source);

	std::size_t progress_calls = 0;
	const auto summary = service.calculateBatchCoverage({"LOW", "BROKEN", "MISSING", "HIGH"},
	                                                    [&](std::size_t, std::size_t) { ++progress_calls; });

	REQUIRE(summary.successful == std::vector<std::string>{"LOW", "HIGH"});
	REQUIRE(summary.failed.size() == 2);
	REQUIRE(summary.errors.at("MISSING") == "Product not found");
	REQUIRE(summary.errors.at("BROKEN").find("INVALID_INPUT") != std::string::npos);
	REQUIRE(summary.total_time_ms >= 0.0);
	REQUIRE(summary.average_time_per_sku_ms == Approx(summary.total_time_ms / 4.0));
	REQUIRE(progress_calls == 1);
}

TEST_CASE("Batch coverage reports a repeated SKU once", "[service][batch]") {
	const StockCoverageService service(makeCatalogue());
	const auto summary = service.calculateBatchCoverage({"MID", "LOW", "MID"});

	REQUIRE(summary.successful == std::vector<std::string>{"MID", "LOW"});
	REQUIRE(summary.failed.empty());
	REQUIRE(summary.average_time_per_sku_ms == Approx(summary.total_time_ms / 2.0));
}

TEST_CASE("Insights combine coverage with recent sales", "[service][insights]") {
	const StockCoverageService service(makeCatalogue());
	const auto low = service.getCoverageWithInsights("LOW");

	REQUIRE(low.product.sku == "LOW");
	REQUIRE(low.insights.recent_average_daily_sales == Approx(10.0));
	REQUIRE(low.insights.stock_turnover == Approx(365.0 / 0.5));
	REQUIRE(low.insights.needs_reorder);
	REQUIRE_FALSE(low.insights.is_overstocked);
	REQUIRE(low.insights.days_of_supply == Approx(low.coverage.coverage_days));
	REQUIRE(low.insights.stockout_risk == low.coverage.stockout_risk);

	const auto high = service.getCoverageWithInsights("HIGH");
	REQUIRE(high.insights.is_overstocked);
	REQUIRE_FALSE(high.insights.needs_reorder);
}

TEST_CASE("Stockout risk report lists risky SKUs first", "[service][risk]") {
	const StockCoverageService service(makeCatalogue());

	const auto all = service.getStockoutRiskProducts(0.0);
	REQUIRE(all.size() == 3);
	for (std::size_t i = 1; i < all.size(); ++i) {
		REQUIRE(all[i - 1].coverage.stockout_risk >= all[i].coverage.stockout_risk);
	}
	REQUIRE(all.front().product.sku == "LOW");

	const auto risky = service.getStockoutRiskProducts(0.5);
	REQUIRE(risky.size() == 1);
	REQUIRE(risky.front().product.sku == "LOW");
	REQUIRE(risky.front().days_until_stockout == 0);
	REQUIRE(risky.front().coverage.stockout_risk >= 0.5);
}

TEST_CASE("Service requires a data source", "[service]") {
	REQUIRE_THROWS_AS(StockCoverageService(nullptr), std::invalid_argument);
}
