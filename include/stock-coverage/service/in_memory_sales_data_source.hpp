#pragma once

#include "stock-coverage/service/isales_data_source.hpp"

#include <map>

namespace stockcoverage::service {

/**
 * @class InMemorySalesDataSource
 * @brief Fixed catalogue held in memory, used by tests and examples.
 *
 * Populate it before sharing; concurrent fetches are safe, concurrent
 * add() calls are not.
 */
class InMemorySalesDataSource : public ISalesDataSource {
public:
	InMemorySalesDataSource() = default;

	/// Stores @p input under its product SKU, replacing an earlier entry.
	void add(core::StockCoverageInput input);

	std::optional<core::StockCoverageInput> fetch(const std::string &sku, int historical_days) const override;

	std::vector<std::string> listSkus() const override;

	std::size_t size() const {
		return inputs_.size();
	}

private:
	std::map<std::string, core::StockCoverageInput> inputs_;
};

} // namespace stockcoverage::service
