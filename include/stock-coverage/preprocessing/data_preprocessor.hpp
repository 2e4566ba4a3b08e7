#pragma once

#include "stock-coverage/config/config.hpp"
#include "stock-coverage/core/types.hpp"

#include <cstddef>
#include <vector>

namespace stockcoverage::preprocessing {

/**
 * @class DataPreprocessor
 * @brief Turns a raw daily sales history into cleaned ProcessedDataPoints.
 *
 * The preprocessor restricts the history to the configured window, corrects
 * for stock availability, caps outliers and normalizes promotional days.
 * Only observed days produce points; missing days are reflected in the
 * data quality score instead of being filled in.
 */
class DataPreprocessor {
public:
	explicit DataPreprocessor(const config::StockCoverageConfig &config);

	/**
	 * @brief Cleans the history of @p input relative to @p reference_date.
	 * @throws core::StockCoverageCalculationError (InvalidInput) for malformed input.
	 */
	std::vector<core::ProcessedDataPoint> preprocess(const core::StockCoverageInput &input,
	                                                 core::TimePoint reference_date) const;

	/// Uses input.current_date, or the current time when unset.
	std::vector<core::ProcessedDataPoint> preprocess(const core::StockCoverageInput &input) const;

	/**
	 * @brief Scores completeness, consistency, availability and outliers.
	 *
	 * Ratios are taken over the configured window length, so a short history
	 * lowers completeness rather than failing.
	 */
	core::DataQualityScore calculateDataQuality(const std::vector<core::ProcessedDataPoint> &data) const;

	/// Mean demand multiplier applied to available days; 1.0 when there are none.
	double availabilityAdjustment(const std::vector<core::ProcessedDataPoint> &data) const;

	/// @throws core::StockCoverageCalculationError (InvalidInput) describing the first malformed field.
	static void validateInput(const core::StockCoverageInput &input);

private:
	void adjustForAvailability(std::vector<core::ProcessedDataPoint> &data) const;
	double imputeDemand(const std::vector<core::ProcessedDataPoint> &data, std::size_t index,
	                    double fallback_median) const;
	void detectOutliers(std::vector<core::ProcessedDataPoint> &data) const;
	void adjustForPromotions(std::vector<core::ProcessedDataPoint> &data) const;

	config::StockCoverageConfig config_;
};

} // namespace stockcoverage::preprocessing
