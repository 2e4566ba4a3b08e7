#include "stock-coverage/core/errors.hpp"

#include <sstream>
#include <utility>

namespace stockcoverage::core {

namespace {

std::string composeMessage(ErrorType type, const std::string &message, const std::optional<std::string> &sku) {
	std::ostringstream oss;
	oss << toString(type) << ": " << message;
	if (sku) {
		oss << " (sku " << *sku << ")";
	}
	return oss.str();
}

std::string composeMessage(const std::string &message, const std::vector<ConfigViolation> &violations) {
	std::ostringstream oss;
	oss << toString(ErrorType::InvalidConfiguration) << ": " << message;
	for (std::size_t i = 0; i < violations.size(); ++i) {
		oss << (i == 0 ? " [" : "; ") << violations[i].describe();
	}
	if (!violations.empty()) {
		oss << "]";
	}
	return oss.str();
}

} // namespace

std::string toString(ErrorType type) {
	switch (type) {
	case ErrorType::InsufficientData:
		return "INSUFFICIENT_DATA";
	case ErrorType::InvalidConfiguration:
		return "INVALID_CONFIGURATION";
	case ErrorType::InvalidInput:
		return "INVALID_INPUT";
	case ErrorType::CalculationError:
		return "CALCULATION_ERROR";
	}
	return "CALCULATION_ERROR";
}

std::string ConfigViolation::describe() const {
	return field + ": " + constraint + " (got " + value + ")";
}

StockCoverageCalculationError::StockCoverageCalculationError(ErrorType type, const std::string &message,
                                                             std::optional<std::string> sku)
    : std::runtime_error(composeMessage(type, message, sku)), type_(type), sku_(std::move(sku)) {
}

StockCoverageCalculationError::StockCoverageCalculationError(const std::string &message,
                                                             std::vector<ConfigViolation> violations)
    : std::runtime_error(composeMessage(message, violations)), type_(ErrorType::InvalidConfiguration),
      violations_(std::move(violations)) {
}

} // namespace stockcoverage::core
