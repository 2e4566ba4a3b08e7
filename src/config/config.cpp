#include "stock-coverage/config/config.hpp"

#include <algorithm>
#include <cctype>

namespace stockcoverage::config {

namespace {

template <typename T>
void overlay(T &target, const std::optional<T> &value) {
	if (value) {
		target = *value;
	}
}

PartialStockCoverageConfig makePreset(int historical_days, int forecast_horizon, double half_life,
                                      double min_availability_factor, double outlier_cap_multiplier,
                                      double service_level, double safety_stock_days) {
	PartialStockCoverageConfig partial;
	partial.historical_days = historical_days;
	partial.forecast_horizon = forecast_horizon;
	partial.half_life = half_life;
	partial.min_availability_factor = min_availability_factor;
	partial.outlier_cap_multiplier = outlier_cap_multiplier;
	partial.service_level = service_level;
	partial.safety_stock_days = safety_stock_days;
	return partial;
}

} // namespace

StockCoverageConfig merge(const PartialStockCoverageConfig &partial, const StockCoverageConfig &defaults) {
	StockCoverageConfig merged = defaults;
	overlay(merged.historical_days, partial.historical_days);
	overlay(merged.forecast_horizon, partial.forecast_horizon);
	overlay(merged.half_life, partial.half_life);
	overlay(merged.min_availability_factor, partial.min_availability_factor);
	overlay(merged.outlier_cap_multiplier, partial.outlier_cap_multiplier);
	overlay(merged.enable_seasonality, partial.enable_seasonality);
	overlay(merged.enable_trend_correction, partial.enable_trend_correction);
	overlay(merged.enable_promotion_adjustment, partial.enable_promotion_adjustment);
	overlay(merged.enable_cache, partial.enable_cache);
	overlay(merged.cache_timeout_seconds, partial.cache_timeout_seconds);
	overlay(merged.batch_size, partial.batch_size);
	overlay(merged.service_level, partial.service_level);
	overlay(merged.safety_stock_days, partial.safety_stock_days);
	return merged;
}

PartialStockCoverageConfig presetConfig(ConfigPreset preset) {
	switch (preset) {
	case ConfigPreset::Conservative:
		return makePreset(120, 14, 21.0, 0.7, 2.5, 0.99, 7.0);
	case ConfigPreset::Balanced:
		return makePreset(90, 7, 14.0, 0.6, 3.0, 0.95, 3.0);
	case ConfigPreset::Aggressive:
		return makePreset(60, 5, 7.0, 0.5, 4.0, 0.90, 1.0);
	case ConfigPreset::Minimal:
		return makePreset(14, 3, 3.0, 0.4, 5.0, 0.85, 0.0);
	}
	return {};
}

std::optional<ConfigPreset> presetFromName(const std::string &name) {
	std::string lowered(name);
	std::transform(lowered.begin(), lowered.end(), lowered.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	if (lowered == "conservative") {
		return ConfigPreset::Conservative;
	}
	if (lowered == "balanced") {
		return ConfigPreset::Balanced;
	}
	if (lowered == "aggressive") {
		return ConfigPreset::Aggressive;
	}
	if (lowered == "minimal") {
		return ConfigPreset::Minimal;
	}
	return std::nullopt;
}

std::string toString(ConfigPreset preset) {
	switch (preset) {
	case ConfigPreset::Conservative:
		return "conservative";
	case ConfigPreset::Balanced:
		return "balanced";
	case ConfigPreset::Aggressive:
		return "aggressive";
	case ConfigPreset::Minimal:
		return "minimal";
	}
	return "unknown";
}

} // namespace stockcoverage::config
