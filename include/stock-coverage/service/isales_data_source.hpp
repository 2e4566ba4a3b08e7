#pragma once

#include "stock-coverage/core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace stockcoverage::service {

/**
 * @class ISalesDataSource
 * @brief Supplies the product and sales history of a SKU to the service layer.
 *
 * Implementations wrap whatever store holds the history. The calculator
 * never talks to a data source itself; callers inject one into
 * StockCoverageService.
 */
class ISalesDataSource {
public:
	virtual ~ISalesDataSource() = default;

	/**
	 * @brief Loads the input for @p sku restricted to its last @p historical_days days.
	 * @return std::nullopt when the SKU is unknown.
	 */
	virtual std::optional<core::StockCoverageInput> fetch(const std::string &sku, int historical_days) const = 0;

	/// Every SKU the source can serve.
	virtual std::vector<std::string> listSkus() const = 0;
};

} // namespace stockcoverage::service
