#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace stockcoverage::core {

/**
 * @brief Failure categories reported by the calculator.
 */
enum class ErrorType {
	InsufficientData,
	InvalidConfiguration,
	InvalidInput,
	CalculationError
};

/// Stable code for an error type, e.g. "INVALID_CONFIGURATION".
std::string toString(ErrorType type);

/**
 * @struct ConfigViolation
 * @brief One configuration field that failed its bound.
 */
struct ConfigViolation {
	std::string field;
	std::string value;
	std::string constraint;

	/// "field: constraint (got value)"
	std::string describe() const;
};

/**
 * @class StockCoverageCalculationError
 * @brief Structured exception thrown for invalid configuration or input.
 */
class StockCoverageCalculationError : public std::runtime_error {
public:
	StockCoverageCalculationError(ErrorType type, const std::string &message,
	                              std::optional<std::string> sku = std::nullopt);

	StockCoverageCalculationError(const std::string &message, std::vector<ConfigViolation> violations);

	ErrorType type() const noexcept {
		return type_;
	}

	const std::optional<std::string> &sku() const noexcept {
		return sku_;
	}

	/// Every violated configuration bound; empty for other error types.
	const std::vector<ConfigViolation> &violations() const noexcept {
		return violations_;
	}

private:
	ErrorType type_;
	std::optional<std::string> sku_;
	std::vector<ConfigViolation> violations_;
};

} // namespace stockcoverage::core
