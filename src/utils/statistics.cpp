#include "stock-coverage/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace stockcoverage::utils::statistics {

double upperMedian(std::vector<double> data) {
	if (data.empty()) {
		throw std::invalid_argument("Cannot compute median of empty vector");
	}
	const std::size_t mid = data.size() / 2;
	std::nth_element(data.begin(), data.begin() + mid, data.end());
	return data[mid];
}

double mean(const std::vector<double> &data) {
	if (data.empty()) {
		return 0.0;
	}
	return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
}

double variance(const std::vector<double> &data) {
	if (data.size() < 2) {
		return 0.0;
	}
	const double mu = mean(data);
	double accum = 0.0;
	for (double v : data) {
		const double diff = v - mu;
		accum += diff * diff;
	}
	return accum / static_cast<double>(data.size());
}

double coefficientOfVariation(const std::vector<double> &data) {
	const double mu = mean(data);
	if (!(mu > 0.0)) {
		return 1.0;
	}
	return std::sqrt(variance(data)) / mu;
}

double normalQuantile(double p) {
	if (!(p > 0.0 && p < 1.0)) {
		throw std::invalid_argument("Normal quantile requires a probability strictly between 0 and 1.");
	}
	if (std::abs(p - 0.5) < 1e-10) {
		return 0.0;
	}

	static const double a[] = {-3.969683028665376e1, 2.209460984245205e2,  -2.759285104469687e2,
	                           1.38357751867269e2,   -3.066479806614716e1, 2.506628277459239};
	static const double b[] = {-5.447609879822406e1, 1.615858368580409e2, -1.556989798598866e2, 6.680131188771972e1,
	                           -1.328068155288572e1};
	static const double c[] = {-7.784894002430293e-3, -3.223964580411365e-1, -2.400758277161838,
	                           -2.549732539343734,    4.374664141464968,     2.938163982698783};
	static const double d[] = {7.784695709041462e-3, 3.224671290700398e-1, 2.445134137142996, 3.754408661907416};
	constexpr double p_low = 0.02425;
	constexpr double p_high = 1.0 - p_low;

	if (p < p_low) {
		const double q = std::sqrt(-2.0 * std::log(p));
		return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
		       ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
	}
	if (p <= p_high) {
		const double q = p - 0.5;
		const double r = q * q;
		return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
		       (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
	}

	const double q = std::sqrt(-2.0 * std::log(1.0 - p));
	return -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
	       ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
}

double clampUnit(double value) {
	if (std::isnan(value)) {
		return 0.0;
	}
	return std::clamp(value, 0.0, 1.0);
}

} // namespace stockcoverage::utils::statistics
