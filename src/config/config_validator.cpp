#include "stock-coverage/config/config_validator.hpp"
#include "stock-coverage/utils/logging.hpp"

#include <cmath>
#include <sstream>
#include <type_traits>

namespace stockcoverage::config {

namespace {

template <typename T>
std::string formatValue(T value) {
	std::ostringstream oss;
	oss << value;
	return oss.str();
}

template <typename T>
void checkRange(std::vector<core::ConfigViolation> &out, const char *field, T value, T min, T max,
                bool min_exclusive = false) {
	if constexpr (std::is_floating_point_v<T>) {
		if (!std::isfinite(value)) {
			out.push_back({field, formatValue(value), "must be a finite number"});
			return;
		}
	}
	const bool below = min_exclusive ? value <= min : value < min;
	if (below) {
		std::ostringstream constraint;
		constraint << "must be " << (min_exclusive ? "greater than " : "at least ") << min;
		out.push_back({field, formatValue(value), constraint.str()});
		return;
	}
	if (value > max) {
		std::ostringstream constraint;
		constraint << "cannot exceed " << max;
		out.push_back({field, formatValue(value), constraint.str()});
	}
}

} // namespace

std::vector<core::ConfigViolation> ConfigValidator::validate(const StockCoverageConfig &config) {
	std::vector<core::ConfigViolation> violations;
	checkRange(violations, "historicalDays", config.historical_days, 7, 365);
	checkRange(violations, "forecastHorizon", config.forecast_horizon, 1, 90);
	checkRange(violations, "halfLife", config.half_life, 0.0, 90.0, true);
	checkRange(violations, "minAvailabilityFactor", config.min_availability_factor, 0.1, 1.0);
	checkRange(violations, "outlierCapMultiplier", config.outlier_cap_multiplier, 1.0, 10.0);
	checkRange(violations, "cacheTimeoutSeconds", config.cache_timeout_seconds, 60, 86400);
	checkRange(violations, "batchSize", config.batch_size, 1, 1000);
	checkRange(violations, "serviceLevel", config.service_level, 0.5, 0.999);
	checkRange(violations, "safetyStockDays", config.safety_stock_days, 0.0, 30.0);
	return violations;
}

ValidationResult ConfigValidator::safeValidate(const StockCoverageConfig &config) {
	ValidationResult result;
	result.violations = validate(config);
	if (result.violations.empty()) {
		result.config = config;
	}
	return result;
}

const StockCoverageConfig &ConfigValidator::validateOrThrow(const StockCoverageConfig &config) {
	auto violations = validate(config);
	if (!violations.empty()) {
		STOCKCOVERAGE_WARN("Rejected configuration with {} violation(s).", violations.size());
		throw core::StockCoverageCalculationError("Invalid configuration provided", std::move(violations));
	}
	return config;
}

StockCoverageConfig ConfigValidator::mergeAndValidate(const std::optional<PartialStockCoverageConfig> &partial,
                                                      const StockCoverageConfig &defaults) {
	const StockCoverageConfig merged = partial ? merge(*partial, defaults) : defaults;
	validateOrThrow(merged);
	return merged;
}

std::vector<std::string> ConfigValidator::formatErrors(const std::vector<core::ConfigViolation> &violations) {
	std::vector<std::string> lines;
	lines.reserve(violations.size());
	for (const auto &violation : violations) {
		lines.push_back(violation.describe());
	}
	return lines;
}

} // namespace stockcoverage::config
