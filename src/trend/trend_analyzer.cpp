#include "stock-coverage/trend/trend_analyzer.hpp"
#include "stock-coverage/utils/logging.hpp"
#include "stock-coverage/utils/statistics.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace {

using stockcoverage::core::ProcessedDataPoint;

constexpr std::size_t kMinPoints = 7;
constexpr double kLogEpsilon = 0.1;
constexpr double kDefaultConfidence = 0.5;
// Confidence blend: fit quality, share of usable days, volume against two weeks.
constexpr double kRSquaredWeight = 0.5;
constexpr double kCompletenessWeight = 0.3;
constexpr double kVolumeWeight = 0.2;
constexpr double kVolumeTarget = 14.0;

constexpr std::size_t kChangePointWindow = 14;
constexpr double kChangePointThreshold = 0.3;
constexpr int kUndampedDays = 7;
constexpr double kDailyDampening = 0.01;

struct RegressionFit {
    double intercept = 0.0;
    double slope = 0.0;
    double r_squared = 0.0;
};

RegressionFit weightedLinearRegression(const std::vector<double>& x, const std::vector<double>& y,
                                       const std::vector<double>& w) {
    const auto n = static_cast<Eigen::Index>(x.size());
    Eigen::MatrixXd design(n, 2);
    Eigen::VectorXd target(n);
    double sum_w = 0.0;
    double sum_wy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        const auto row = static_cast<Eigen::Index>(i);
        const double sw = std::sqrt(w[i]);
        design(row, 0) = sw;
        design(row, 1) = sw * x[i];
        target(row) = sw * y[i];
        sum_w += w[i];
        sum_wy += w[i] * y[i];
    }

    RegressionFit fit;
    if (sum_w <= 0.0) {
        return fit;
    }

    const auto qr = design.colPivHouseholderQr();
    if (qr.rank() < 2) {
        STOCKCOVERAGE_WARN("Trend regression is rank deficient; using a flat trend.");
        fit.intercept = sum_wy / sum_w;
        return fit;
    }
    const Eigen::VectorXd coefficients = qr.solve(target);
    fit.intercept = coefficients(0);
    fit.slope = coefficients(1);

    const double mean_y = sum_wy / sum_w;
    double ss_total = 0.0;
    double ss_residual = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        const double residual = y[i] - (fit.intercept + fit.slope * x[i]);
        const double deviation = y[i] - mean_y;
        ss_residual += w[i] * residual * residual;
        ss_total += w[i] * deviation * deviation;
    }
    fit.r_squared = ss_total > 0.0 ? std::clamp(1.0 - ss_residual / ss_total, 0.0, 1.0) : 0.0;
    return fit;
}

} // namespace

namespace stockcoverage::trend {

namespace calendar = core::calendar;

TrendAnalyzer::TrendAnalyzer(const config::StockCoverageConfig& config) : config_(config) {}

core::TrendAnalysis TrendAnalyzer::analyze(const std::vector<ProcessedDataPoint>& data) const {
    if (!config_.enable_trend_correction || data.size() < kMinPoints) {
        return defaultTrend(data);
    }

    std::vector<const ProcessedDataPoint*> valid;
    valid.reserve(data.size());
    for (const auto& point : data) {
        if (point.adjusted_demand > 0.0) {
            valid.push_back(&point);
        }
    }
    if (valid.size() < kMinPoints) {
        STOCKCOVERAGE_DEBUG("Only {} positive points; trend fit skipped.", valid.size());
        return defaultTrend(data);
    }

    const std::int64_t first_day = calendar::dayNumber(valid.front()->date);
    std::vector<double> x;
    std::vector<double> y;
    std::vector<double> w;
    x.reserve(valid.size());
    y.reserve(valid.size());
    w.reserve(valid.size());
    for (const auto* point : valid) {
        x.push_back(static_cast<double>(calendar::dayNumber(point->date) - first_day + 1));
        y.push_back(std::log(point->adjusted_demand + kLogEpsilon));
        w.push_back(point->weight);
    }

    const RegressionFit fit = weightedLinearRegression(x, y, w);

    core::TrendAnalysis analysis;
    analysis.intercept = fit.intercept;
    analysis.slope = fit.slope;
    analysis.r_squared = fit.r_squared;
    analysis.trend_factor = std::exp(fit.slope);
    analysis.current_level = std::max(0.0, std::exp(fit.intercept + fit.slope * x.back()) - kLogEpsilon);

    const double completeness = static_cast<double>(valid.size()) / static_cast<double>(data.size());
    const double volume = std::min(1.0, static_cast<double>(valid.size()) / kVolumeTarget);
    analysis.confidence = utils::statistics::clampUnit(kRSquaredWeight * fit.r_squared +
                                                       kCompletenessWeight * completeness +
                                                       kVolumeWeight * volume);

    STOCKCOVERAGE_DEBUG("Trend fit: slope={:.5f} factor={:.4f} r2={:.3f} confidence={:.3f}", analysis.slope,
                        analysis.trend_factor, analysis.r_squared, analysis.confidence);
    return analysis;
}

core::TrendAnalysis TrendAnalyzer::defaultTrend(const std::vector<ProcessedDataPoint>& data) const {
    std::vector<double> positive;
    positive.reserve(data.size());
    for (const auto& point : data) {
        if (point.adjusted_demand > 0.0) {
            positive.push_back(point.adjusted_demand);
        }
    }
    const double average = utils::statistics::mean(positive);

    core::TrendAnalysis analysis;
    analysis.intercept = std::log(std::max(kLogEpsilon, average));
    analysis.slope = 0.0;
    analysis.r_squared = 0.0;
    analysis.trend_factor = 1.0;
    analysis.current_level = average;
    analysis.confidence = kDefaultConfidence;
    return analysis;
}

std::vector<std::size_t> TrendAnalyzer::detectChangePoints(const std::vector<ProcessedDataPoint>& data) const {
    std::vector<std::size_t> change_points;
    if (data.size() < kChangePointWindow * 2) {
        return change_points;
    }

    for (std::size_t i = kChangePointWindow; i < data.size() - kChangePointWindow; ++i) {
        const std::vector<ProcessedDataPoint> before(data.begin() + static_cast<std::ptrdiff_t>(i - kChangePointWindow),
                                                     data.begin() + static_cast<std::ptrdiff_t>(i));
        const std::vector<ProcessedDataPoint> after(data.begin() + static_cast<std::ptrdiff_t>(i),
                                                    data.begin() + static_cast<std::ptrdiff_t>(i + kChangePointWindow));
        const double before_factor = analyze(before).trend_factor;
        const double after_factor = analyze(after).trend_factor;
        if (std::abs((after_factor - before_factor) / before_factor) > kChangePointThreshold) {
            change_points.push_back(i);
        }
    }
    return change_points;
}

std::vector<double> TrendAnalyzer::projectTrend(const core::TrendAnalysis& trend, int days_ahead) const {
    std::vector<double> projections;
    if (days_ahead <= 0) {
        return projections;
    }
    projections.reserve(static_cast<std::size_t>(days_ahead));

    for (int day = 1; day <= days_ahead; ++day) {
        double projection = 0.0;
        if (day <= kUndampedDays) {
            projection = trend.current_level * std::pow(trend.trend_factor, day);
        } else {
            // Growth regresses towards flat as the horizon lengthens.
            const double dampening = 1.0 / (1.0 + kDailyDampening * day);
            const double damped_factor = 1.0 + (trend.trend_factor - 1.0) * dampening;
            projection = trend.current_level * std::pow(damped_factor, day);
        }
        projections.push_back(std::max(0.0, projection));
    }
    return projections;
}

} // namespace stockcoverage::trend
