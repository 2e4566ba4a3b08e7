#include "stock-coverage/service/in_memory_sales_data_source.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <utility>

namespace stockcoverage::service {

namespace {

template <typename Record>
std::vector<Record> lastDays(const std::vector<Record> &records, std::int64_t first_day, std::int64_t last_day) {
	std::vector<Record> kept;
	std::copy_if(records.begin(), records.end(), std::back_inserter(kept), [&](const Record &record) {
		const std::int64_t day = core::calendar::dayNumber(record.date);
		return day >= first_day && day <= last_day;
	});
	return kept;
}

} // namespace

void InMemorySalesDataSource::add(core::StockCoverageInput input) {
	std::string sku = input.product.sku;
	inputs_.insert_or_assign(std::move(sku), std::move(input));
}

std::optional<core::StockCoverageInput> InMemorySalesDataSource::fetch(const std::string &sku,
                                                                       int historical_days) const {
	const auto it = inputs_.find(sku);
	if (it == inputs_.end()) {
		return std::nullopt;
	}

	core::StockCoverageInput input = it->second;
	const core::TimePoint today = input.current_date.value_or(std::chrono::system_clock::now());
	const std::int64_t last_day = core::calendar::dayNumber(today);
	const std::int64_t first_day = last_day - std::max(historical_days, 1) + 1;

	input.sales_history = lastDays(input.sales_history, first_day, last_day);
	input.stock_availability = lastDays(input.stock_availability, first_day, last_day);
	return input;
}

std::vector<std::string> InMemorySalesDataSource::listSkus() const {
	std::vector<std::string> skus;
	skus.reserve(inputs_.size());
	for (const auto &entry : inputs_) {
		skus.push_back(entry.first);
	}
	return skus;
}

} // namespace stockcoverage::service
