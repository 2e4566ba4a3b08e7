#include <catch2/catch_test_macros.hpp>

#include "stock-coverage/config/config.hpp"
#include "stock-coverage/config/config_validator.hpp"
#include "stock-coverage/core/errors.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

using stockcoverage::config::ConfigPreset;
using stockcoverage::config::ConfigValidator;
using stockcoverage::config::PartialStockCoverageConfig;
using stockcoverage::config::StockCoverageConfig;
using stockcoverage::core::ErrorType;
using stockcoverage::core::StockCoverageCalculationError;

namespace {

bool hasViolation(const std::vector<stockcoverage::core::ConfigViolation> &violations, const std::string &field) {
	return std::any_of(violations.begin(), violations.end(),
	                   [&](const auto &violation) { return violation.field == field; });
}

} // namespace

TEST_CASE("Default configuration is valid", "[config]") {
	const StockCoverageConfig defaults;
	REQUIRE(ConfigValidator::validate(defaults).empty());
	REQUIRE(defaults.historical_days == 90);
	REQUIRE(defaults.forecast_horizon == 7);
	REQUIRE(defaults.service_level == 0.95);

	const auto result = ConfigValidator::safeValidate(defaults);
	REQUIRE(result.ok());
	REQUIRE(result.violations.empty());
}

TEST_CASE("historicalDays bounds are inclusive", "[config][bounds]") {
	StockCoverageConfig config;

	config.historical_days = 6;
	auto violations = ConfigValidator::validate(config);
	REQUIRE(violations.size() == 1);
	REQUIRE(violations.front().field == "historicalDays");
	REQUIRE(violations.front().value == "6");
	REQUIRE(violations.front().constraint == "must be at least 7");

	config.historical_days = 7;
	REQUIRE(ConfigValidator::validate(config).empty());

	config.historical_days = 365;
	REQUIRE(ConfigValidator::validate(config).empty());

	config.historical_days = 366;
	REQUIRE(hasViolation(ConfigValidator::validate(config), "historicalDays"));
}

TEST_CASE("halfLife excludes zero but accepts ninety", "[config][bounds]") {
	StockCoverageConfig config;
	config.half_life = 0.0;
	auto violations = ConfigValidator::validate(config);
	REQUIRE(violations.size() == 1);
	REQUIRE(violations.front().constraint == "must be greater than 0");

	config.half_life = 90.0;
	REQUIRE(ConfigValidator::validate(config).empty());

	config.half_life = std::numeric_limits<double>::quiet_NaN();
	violations = ConfigValidator::validate(config);
	REQUIRE(violations.size() == 1);
	REQUIRE(violations.front().constraint == "must be a finite number");
}

TEST_CASE("Every violated field is reported together", "[config]") {
	StockCoverageConfig config;
	config.historical_days = 1;
	config.forecast_horizon = 0;
	config.min_availability_factor = 2.0;
	config.batch_size = 5000;
	config.service_level = 0.3;

	const auto violations = ConfigValidator::validate(config);
	REQUIRE(violations.size() == 5);
	REQUIRE(hasViolation(violations, "historicalDays"));
	REQUIRE(hasViolation(violations, "forecastHorizon"));
	REQUIRE(hasViolation(violations, "minAvailabilityFactor"));
	REQUIRE(hasViolation(violations, "batchSize"));
	REQUIRE(hasViolation(violations, "serviceLevel"));

	const auto result = ConfigValidator::safeValidate(config);
	REQUIRE_FALSE(result.ok());
	REQUIRE(result.violations.size() == 5);

	const auto lines = ConfigValidator::formatErrors(violations);
	REQUIRE(lines.size() == 5);
	REQUIRE(lines.at(3) == "batchSize: cannot exceed 1000 (got 5000)");
}

TEST_CASE("mergeAndValidate overlays partial values", "[config][merge]") {
	PartialStockCoverageConfig partial;
	partial.forecast_horizon = 14;
	partial.enable_seasonality = false;

	const auto merged = ConfigValidator::mergeAndValidate(partial);
	REQUIRE(merged.forecast_horizon == 14);
	REQUIRE_FALSE(merged.enable_seasonality);
	REQUIRE(merged.historical_days == 90);

	const auto defaults_only = ConfigValidator::mergeAndValidate(std::nullopt);
	REQUIRE(defaults_only.forecast_horizon == 7);
}

TEST_CASE("mergeAndValidate rejects invalid overrides atomically", "[config][merge]") {
	PartialStockCoverageConfig partial;
	partial.historical_days = 6;
	partial.safety_stock_days = 31.0;

	try {
		(void)ConfigValidator::mergeAndValidate(partial);
		FAIL("Expected an invalid configuration error");
	} catch (const StockCoverageCalculationError &e) {
		REQUIRE(e.type() == ErrorType::InvalidConfiguration);
		REQUIRE(e.violations().size() == 2);
		REQUIRE(std::string(e.what()).rfind("INVALID_CONFIGURATION", 0) == 0);
	}
}

TEST_CASE("Presets pass validation when merged with defaults", "[config][presets]") {
	for (const auto preset : {ConfigPreset::Conservative, ConfigPreset::Balanced, ConfigPreset::Aggressive,
	                          ConfigPreset::Minimal}) {
		INFO("preset " << stockcoverage::config::toString(preset));
		REQUIRE_NOTHROW(ConfigValidator::mergeAndValidate(stockcoverage::config::presetConfig(preset)));
	}

	const auto conservative = ConfigValidator::mergeAndValidate(presetConfig(ConfigPreset::Conservative));
	REQUIRE(conservative.historical_days == 120);
	REQUIRE(conservative.service_level == 0.99);
	REQUIRE(conservative.safety_stock_days == 7.0);

	const auto minimal = ConfigValidator::mergeAndValidate(presetConfig(ConfigPreset::Minimal));
	REQUIRE(minimal.historical_days == 14);
	REQUIRE(minimal.half_life == 3.0);
}

TEST_CASE("Presets are addressable by name", "[config][presets]") {
	REQUIRE(stockcoverage::config::presetFromName("Aggressive") == ConfigPreset::Aggressive);
	REQUIRE(stockcoverage::config::presetFromName("BALANCED") == ConfigPreset::Balanced);
	REQUIRE_FALSE(stockcoverage::config::presetFromName("reckless").has_value());
	REQUIRE(stockcoverage::config::toString(ConfigPreset::Minimal) == "minimal");
}
