#pragma once

#include "stock-coverage/config/config.hpp"
#include "stock-coverage/core/errors.hpp"

#include <optional>
#include <string>
#include <vector>

namespace stockcoverage::config {

/**
 * @struct ValidationResult
 * @brief Outcome of a non-throwing validation.
 */
struct ValidationResult {
	std::optional<StockCoverageConfig> config;
	std::vector<core::ConfigViolation> violations;

	bool ok() const {
		return config.has_value();
	}
};

/**
 * @class ConfigValidator
 * @brief Checks every configuration field against its documented bound.
 *
 * All fields are checked independently and every violation is reported;
 * validation never stops at the first failure and never applies a
 * partially valid configuration.
 */
class ConfigValidator {
public:
	/// Returns every violated bound; empty when the configuration is valid.
	static std::vector<core::ConfigViolation> validate(const StockCoverageConfig &config);

	/// Non-throwing variant carrying either the configuration or the violations.
	static ValidationResult safeValidate(const StockCoverageConfig &config);

	/// @throws core::StockCoverageCalculationError (InvalidConfiguration) listing every violation.
	static const StockCoverageConfig &validateOrThrow(const StockCoverageConfig &config);

	/**
	 * @brief Overlays @p partial on @p defaults and validates the result.
	 * @throws core::StockCoverageCalculationError (InvalidConfiguration) listing every violation.
	 */
	static StockCoverageConfig mergeAndValidate(const std::optional<PartialStockCoverageConfig> &partial,
	                                            const StockCoverageConfig &defaults = {});

	/// Human-readable "field: constraint (got value)" lines.
	static std::vector<std::string> formatErrors(const std::vector<core::ConfigViolation> &violations);
};

} // namespace stockcoverage::config
