#include "stock-coverage/seasonality/seasonality_adjuster.hpp"
#include "stock-coverage/utils/logging.hpp"
#include "stock-coverage/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <unordered_set>

namespace {

constexpr std::size_t kMinPointsForWeekly = 14;
constexpr std::size_t kMinPointsForMonthly = 90;
constexpr double kMinFactor = 0.1;
constexpr double kPatternThreshold = 0.15;
constexpr double kPeakThreshold = 0.1;
constexpr double kHolidayUpliftThreshold = 1.2;

bool usable(const stockcoverage::core::ProcessedDataPoint& point) {
    return point.adjusted_demand > 0.0 && !point.is_outlier;
}

} // namespace

namespace stockcoverage::seasonality {

namespace calendar = core::calendar;

SeasonalityAdjuster::SeasonalityAdjuster(const config::StockCoverageConfig& config) : config_(config) {}

core::SeasonalityFactors SeasonalityAdjuster::calculateSeasonalityFactors(
    const std::vector<core::ProcessedDataPoint>& data) const {
    if (!config_.enable_seasonality || data.size() < kMinPointsForWeekly) {
        return core::SeasonalityFactors::neutral();
    }

    std::array<double, calendar::kDaysPerWeek> weighted_sum{};
    std::array<double, calendar::kDaysPerWeek> weight_sum{};
    for (const auto& point : data) {
        if (!usable(point)) continue;
        const auto dow = static_cast<std::size_t>(point.day_of_week);
        weighted_sum[dow] += point.adjusted_demand * point.weight;
        weight_sum[dow] += point.weight;
    }

    std::array<double, calendar::kDaysPerWeek> average{};
    double total = 0.0;
    int observed_days = 0;
    for (std::size_t dow = 0; dow < average.size(); ++dow) {
        if (weight_sum[dow] > 0.0) {
            average[dow] = weighted_sum[dow] / weight_sum[dow];
            total += average[dow];
            ++observed_days;
        }
    }
    const double overall = observed_days > 0 ? total / observed_days : 0.0;

    auto factors = core::SeasonalityFactors::neutral();
    if (overall <= 0.0) {
        return factors;
    }
    for (std::size_t dow = 0; dow < average.size(); ++dow) {
        if (weight_sum[dow] > 0.0) {
            factors[dow] = smoothFactor(average[dow] / overall);
        }
    }

    STOCKCOVERAGE_DEBUG("Weekday factors: sun={:.3f} mon={:.3f} tue={:.3f} wed={:.3f} thu={:.3f} fri={:.3f} sat={:.3f}",
                        factors.sunday(), factors.monday(), factors.tuesday(), factors.wednesday(),
                        factors.thursday(), factors.friday(), factors.saturday());
    return factors;
}

std::vector<core::ProcessedDataPoint> SeasonalityAdjuster::deseasonalize(
    const std::vector<core::ProcessedDataPoint>& data, const core::SeasonalityFactors& factors) const {
    std::vector<core::ProcessedDataPoint> result(data);
    if (!config_.enable_seasonality) {
        return result;
    }
    for (auto& point : result) {
        point.adjusted_demand /= factors[static_cast<std::size_t>(point.day_of_week)];
    }
    return result;
}

double SeasonalityAdjuster::applySeasonality(double base_demand, core::TimePoint target_date,
                                             const core::SeasonalityFactors& factors) const {
    if (!config_.enable_seasonality) {
        return base_demand;
    }
    return base_demand * factors[static_cast<std::size_t>(calendar::dayOfWeek(target_date))];
}

double SeasonalityAdjuster::averageFactor(core::TimePoint start, int horizon,
                                          const core::SeasonalityFactors& factors) const {
    if (!config_.enable_seasonality || horizon <= 0) {
        return 1.0;
    }
    double sum = 0.0;
    for (int i = 0; i < horizon; ++i) {
        sum += factors[static_cast<std::size_t>(calendar::dayOfWeek(calendar::addDays(start, i)))];
    }
    return sum / horizon;
}

WeeklyPattern SeasonalityAdjuster::detectWeeklyPatterns(const std::vector<core::ProcessedDataPoint>& data) const {
    const auto factors = calculateSeasonalityFactors(data);
    const std::vector<double> values(factors.values.begin(), factors.values.end());

    WeeklyPattern pattern;
    const double mean = utils::statistics::mean(values);
    pattern.pattern_strength = mean > 0.0 ? std::sqrt(utils::statistics::variance(values)) / mean : 0.0;
    pattern.has_weekly_pattern = pattern.pattern_strength > kPatternThreshold;

    for (int dow = 0; dow < calendar::kDaysPerWeek; ++dow) {
        const double factor = factors[static_cast<std::size_t>(dow)];
        if (factor > 1.0 + kPeakThreshold) {
            pattern.peak_days.push_back(dow);
        } else if (factor < 1.0 - kPeakThreshold) {
            pattern.low_days.push_back(dow);
        }
    }
    return pattern;
}

MonthlyFactors SeasonalityAdjuster::calculateMonthlySeasonality(
    const std::vector<core::ProcessedDataPoint>& data) const {
    MonthlyFactors factors;
    factors.fill(1.0);
    if (data.size() < kMinPointsForMonthly) {
        return factors;
    }

    std::array<double, 12> sum{};
    std::array<std::size_t, 12> count{};
    double overall_sum = 0.0;
    std::size_t overall_count = 0;
    for (const auto& point : data) {
        if (!usable(point)) continue;
        const auto month = static_cast<std::size_t>(calendar::monthOfYear(point.date));
        sum[month] += point.adjusted_demand;
        ++count[month];
        overall_sum += point.adjusted_demand;
        ++overall_count;
    }
    if (overall_count == 0) {
        return factors;
    }

    const double overall = overall_sum / static_cast<double>(overall_count);
    for (std::size_t month = 0; month < factors.size(); ++month) {
        if (count[month] > 0) {
            factors[month] = smoothFactor((sum[month] / static_cast<double>(count[month])) / overall);
        }
    }
    return factors;
}

std::vector<core::ProcessedDataPoint> SeasonalityAdjuster::adjustForHolidays(
    const std::vector<core::ProcessedDataPoint>& data, const std::vector<core::TimePoint>& holidays) const {
    std::unordered_set<std::int64_t> holiday_days;
    for (const auto& holiday : holidays) {
        holiday_days.insert(calendar::dayNumber(holiday));
    }

    double holiday_sum = 0.0;
    double normal_sum = 0.0;
    std::size_t holiday_count = 0;
    std::size_t normal_count = 0;
    for (const auto& point : data) {
        if (holiday_days.count(calendar::dayNumber(point.date)) > 0) {
            holiday_sum += point.adjusted_demand;
            ++holiday_count;
        } else {
            normal_sum += point.adjusted_demand;
            ++normal_count;
        }
    }

    std::vector<core::ProcessedDataPoint> result(data);
    if (holiday_count == 0 || normal_count == 0 || normal_sum == 0.0) {
        return result;
    }

    const double holiday_factor =
        (holiday_sum / static_cast<double>(holiday_count)) / (normal_sum / static_cast<double>(normal_count));
    if (holiday_factor <= kHolidayUpliftThreshold) {
        return result;
    }
    for (auto& point : result) {
        if (holiday_days.count(calendar::dayNumber(point.date)) > 0) {
            point.adjusted_demand /= holiday_factor;
        }
    }
    return result;
}

double SeasonalityAdjuster::smoothFactor(double factor, double max_deviation) {
    const double min_factor = 1.0 - max_deviation;
    const double max_factor = 1.0 + max_deviation;

    double smoothed = factor;
    if (factor < min_factor) {
        smoothed = min_factor * (1.0 + std::log(factor / min_factor) * 0.1);
    } else if (factor > max_factor) {
        smoothed = max_factor * (1.0 + std::log(factor / max_factor) * 0.1);
    }
    // Deseasonalization divides by the factor.
    return std::max(kMinFactor, smoothed);
}

} // namespace stockcoverage::seasonality
