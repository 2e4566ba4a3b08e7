#include <catch2/catch_test_macros.hpp>

#include "stock-coverage/calculator/stock_coverage_calculator.hpp"
#include "stock-coverage/utils/logging.hpp"
#include "common/stock_coverage_helpers.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using stockcoverage::calculator::StockCoverageCalculator;
using stockcoverage::config::PartialStockCoverageConfig;
using stockcoverage::core::StockCoverageInput;
using stockcoverage::utils::Logging;
namespace helpers = tests::helpers;

namespace {

std::vector<StockCoverageInput> threeInputsWithInvalidSecond() {
	std::vector<StockCoverageInput> inputs;
	inputs.push_back(helpers::makeInput(std::vector<double>(30, 5.0), helpers::makeProduct("SKU-1", 80.0)));
	inputs.push_back(helpers::makeInput(std::vector<double>(30, 5.0), helpers::makeProduct("SKU-2", -1.0)));
	inputs.push_back(helpers::makeInput(std::vector<double>(30, 9.0), helpers::makeProduct("SKU-3", 40.0)));
	return inputs;
}

// Captures everything the shared logger writes while in scope.
class LogCapture {
public:
	LogCapture() : sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_)) {
		auto &logger = Logging::getLogger();
		previous_level_ = logger->level();
		logger->set_level(spdlog::level::info);
		logger->sinks().push_back(sink_);
	}

	~LogCapture() {
		auto &logger = Logging::getLogger();
		auto &sinks = logger->sinks();
		sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
		logger->set_level(previous_level_);
	}

	std::string text() const {
		return stream_.str();
	}

private:
	std::ostringstream stream_;
	std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
	spdlog::level::level_enum previous_level_ = spdlog::level::info;
};

} // namespace

TEST_CASE("Batch skips and logs an invalid item", "[calculator][batch]") {
	const StockCoverageCalculator calculator;
	LogCapture capture;

	stockcoverage::core::StockCoverageResultMap results;
	REQUIRE_NOTHROW(results = calculator.calculateBatch(threeInputsWithInvalidSecond()));

	REQUIRE(results.size() == 2);
	REQUIRE(results.count("SKU-1") == 1);
	REQUIRE(results.count("SKU-3") == 1);
	REQUIRE(results.count("SKU-2") == 0);

	const auto log = capture.text();
	REQUIRE(log.find("SKU-2") != std::string::npos);
	REQUIRE(log.find("INVALID_INPUT") != std::string::npos);
}

TEST_CASE("Detailed batch reports per-SKU errors", "[calculator][batch]") {
	const StockCoverageCalculator calculator;
	const auto batch = calculator.calculateBatchDetailed(threeInputsWithInvalidSecond());

	REQUIRE(batch.results.size() == 2);
	REQUIRE(batch.errors.size() == 1);
	REQUIRE(batch.errors.at("SKU-2").find("currentStock") != std::string::npos);
	REQUIRE_FALSE(batch.cancelled);
}

TEST_CASE("Batch results match single calculations", "[calculator][batch]") {
	const StockCoverageCalculator calculator;
	const auto inputs = threeInputsWithInvalidSecond();
	const auto results = calculator.calculateBatch(inputs);

	const auto single = calculator.calculate(inputs[2]);
	REQUIRE(results.at("SKU-3").coverage_days == single.coverage_days);
	REQUIRE(results.at("SKU-3").demand_forecast == single.demand_forecast);
}

TEST_CASE("Progress is reported after every chunk", "[calculator][batch]") {
	PartialStockCoverageConfig partial;
	partial.batch_size = 2;
	const StockCoverageCalculator calculator(partial);

	std::vector<std::pair<std::size_t, std::size_t>> progress;
	calculator.calculateBatch(threeInputsWithInvalidSecond(),
	                          [&progress](std::size_t done, std::size_t total) { progress.emplace_back(done, total); });

	REQUIRE(progress.size() == 2);
	REQUIRE(progress[0] == std::pair<std::size_t, std::size_t>(2, 3));
	REQUIRE(progress[1] == std::pair<std::size_t, std::size_t>(3, 3));
}

TEST_CASE("Cancellation is honoured between chunks", "[calculator][batch]") {
	PartialStockCoverageConfig partial;
	partial.batch_size = 2;
	const StockCoverageCalculator calculator(partial);

	std::size_t chunks_done = 0;
	const auto batch = calculator.calculateBatchDetailed(
	    threeInputsWithInvalidSecond(), [&chunks_done](std::size_t, std::size_t) { ++chunks_done; },
	    [&chunks_done]() { return chunks_done >= 1; });

	REQUIRE(batch.cancelled);
	REQUIRE(chunks_done == 1);
	REQUIRE(batch.results.size() == 1);
	REQUIRE(batch.results.count("SKU-1") == 1);
	REQUIRE(batch.errors.count("SKU-2") == 1);
}

TEST_CASE("A chunk larger than the worker pool completes every item", "[calculator][batch]") {
	PartialStockCoverageConfig partial;
	partial.batch_size = 1000;
	const StockCoverageCalculator calculator(partial);

	std::vector<StockCoverageInput> inputs;
	for (int i = 0; i < 200; ++i) {
		const double stock = i % 10 == 0 ? -1.0 : 50.0 + i;
		inputs.push_back(helpers::makeInput(std::vector<double>(30, 4.0),
		                                    helpers::makeProduct("SKU-" + std::to_string(i), stock)));
	}

	std::vector<std::pair<std::size_t, std::size_t>> progress;
	const auto batch = calculator.calculateBatchDetailed(
	    inputs, [&progress](std::size_t done, std::size_t total) { progress.emplace_back(done, total); });

	REQUIRE(batch.results.size() == 180);
	REQUIRE(batch.errors.size() == 20);
	REQUIRE(batch.errors.count("SKU-190") == 1);
	REQUIRE(batch.results.at("SKU-7").coverage_days == calculator.calculate(inputs[7]).coverage_days);
	REQUIRE(progress.size() == 1);
	REQUIRE(progress[0] == std::pair<std::size_t, std::size_t>(200, 200));
}

TEST_CASE("A repeated SKU keeps the outcome of its last occurrence", "[calculator][batch]") {
	const StockCoverageCalculator calculator;
	const auto valid = helpers::makeInput(std::vector<double>(30, 5.0), helpers::makeProduct("SKU-1", 80.0));
	const auto invalid = helpers::makeInput(std::vector<double>(30, 5.0), helpers::makeProduct("SKU-1", -1.0));

	const auto failed_last = calculator.calculateBatchDetailed({valid, invalid});
	REQUIRE(failed_last.results.empty());
	REQUIRE(failed_last.errors.count("SKU-1") == 1);

	const auto succeeded_last = calculator.calculateBatchDetailed({invalid, valid});
	REQUIRE(succeeded_last.results.count("SKU-1") == 1);
	REQUIRE(succeeded_last.errors.empty());
}

TEST_CASE("Empty batch returns an empty map", "[calculator][batch]") {
	const StockCoverageCalculator calculator;
	bool called = false;
	const auto results = calculator.calculateBatch({}, [&called](std::size_t, std::size_t) { called = true; });
	REQUIRE(results.empty());
	REQUIRE_FALSE(called);
}
