#pragma once

#include "stock-coverage/config/config.hpp"
#include "stock-coverage/core/types.hpp"

#include <array>
#include <vector>

namespace stockcoverage::seasonality {

struct WeeklyPattern {
    bool has_weekly_pattern = false;
    /// Coefficient of variation of the seven factors.
    double pattern_strength = 0.0;
    std::vector<int> peak_days;
    std::vector<int> low_days;
};

/// Multiplicative month-of-year factors, index 0 = January.
using MonthlyFactors = std::array<double, 12>;

/**
 * @class SeasonalityAdjuster
 * @brief Multiplicative day-of-week seasonality model.
 *
 * Each weekday factor is that weekday's weighted average demand divided by
 * the average across weekdays. Factors stay neutral (1.0) when seasonality
 * is disabled, when fewer than two weeks of points are available, or for
 * a weekday without usable observations.
 */
class SeasonalityAdjuster {
public:
    explicit SeasonalityAdjuster(const config::StockCoverageConfig& config);

    core::SeasonalityFactors calculateSeasonalityFactors(const std::vector<core::ProcessedDataPoint>& data) const;

    /// Divides each point's demand by its weekday factor; returns new points.
    std::vector<core::ProcessedDataPoint> deseasonalize(const std::vector<core::ProcessedDataPoint>& data,
                                                        const core::SeasonalityFactors& factors) const;

    /// Demand on @p target_date given a deseasonalized @p base_demand.
    double applySeasonality(double base_demand, core::TimePoint target_date,
                            const core::SeasonalityFactors& factors) const;

    /// Mean factor over @p horizon consecutive days starting at @p start.
    double averageFactor(core::TimePoint start, int horizon, const core::SeasonalityFactors& factors) const;

    WeeklyPattern detectWeeklyPatterns(const std::vector<core::ProcessedDataPoint>& data) const;

    /// Needs at least 90 points; neutral otherwise.
    MonthlyFactors calculateMonthlySeasonality(const std::vector<core::ProcessedDataPoint>& data) const;

    /// Normalizes demand on @p holidays when their average uplift exceeds 20%.
    std::vector<core::ProcessedDataPoint> adjustForHolidays(const std::vector<core::ProcessedDataPoint>& data,
                                                            const std::vector<core::TimePoint>& holidays) const;

    /// Softens factors outside [1 - max_deviation, 1 + max_deviation].
    static double smoothFactor(double factor, double max_deviation = 0.5);

private:
    config::StockCoverageConfig config_;
};

} // namespace stockcoverage::seasonality
