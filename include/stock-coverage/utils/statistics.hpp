#pragma once

#include <vector>

namespace stockcoverage::utils {

/**
 * @brief Small descriptive-statistics helpers shared by the pipeline stages.
 *
 * upperMedian takes its argument by value because it partially reorders
 * the data.
 */
namespace statistics {

/**
 * @brief Upper median: the element at index n/2 of the sorted sample.
 *
 * Used where the outlier rules were calibrated against the element at the
 * midpoint rather than an interpolated median.
 * @throws std::invalid_argument If @p data is empty.
 */
double upperMedian(std::vector<double> data);

/// Arithmetic mean; 0 for an empty sample.
double mean(const std::vector<double> &data);

/// Population variance; 0 for fewer than two values.
double variance(const std::vector<double> &data);

/// Population standard deviation divided by the mean; 1 when the mean is not positive.
double coefficientOfVariation(const std::vector<double> &data);

/**
 * @brief Quantile of the standard normal distribution (Acklam's approximation).
 * @param p Probability in (0, 1).
 * @throws std::invalid_argument If @p p lies outside (0, 1).
 */
double normalQuantile(double p);

/// Clamps @p value into [0, 1]; NaN maps to 0.
double clampUnit(double value);

} // namespace statistics
} // namespace stockcoverage::utils
