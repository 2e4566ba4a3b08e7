#pragma once

#include "stock-coverage/config/config.hpp"
#include "stock-coverage/core/types.hpp"

#include <cstddef>
#include <vector>

namespace stockcoverage::trend {

/**
 * @class TrendAnalyzer
 * @brief Weighted log-linear trend estimation over deseasonalized demand.
 *
 * log(demand + 0.1) is regressed on the day offset using the recency
 * weights of the points, so trend_factor = e^slope is a per-day
 * multiplicative growth rate. Zero-demand days are left out of the fit.
 */
class TrendAnalyzer {
public:
    explicit TrendAnalyzer(const config::StockCoverageConfig& config);

    /**
     * @brief Fits the trend.
     *
     * Returns the flat default (factor 1, confidence 0.5) when trend
     * correction is disabled or fewer than 7 positive points exist.
     */
    core::TrendAnalysis analyze(const std::vector<core::ProcessedDataPoint>& data) const;

    /// Indices where the trend factor of the next two weeks differs from the previous two by more than 30%.
    std::vector<std::size_t> detectChangePoints(const std::vector<core::ProcessedDataPoint>& data) const;

    /// Daily demand for days 1..days_ahead; damped by 1% per day after the first week.
    std::vector<double> projectTrend(const core::TrendAnalysis& trend, int days_ahead) const;

private:
    core::TrendAnalysis defaultTrend(const std::vector<core::ProcessedDataPoint>& data) const;

    config::StockCoverageConfig config_;
};

} // namespace stockcoverage::trend
