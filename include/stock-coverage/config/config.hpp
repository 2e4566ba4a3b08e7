#pragma once

#include <optional>
#include <string>

namespace stockcoverage::config {

/**
 * @struct StockCoverageConfig
 * @brief Tuning parameters of the coverage pipeline.
 *
 * Default member values are the library defaults. Instances held by a
 * calculator have passed ConfigValidator and are never mutated.
 */
struct StockCoverageConfig {
	// Data window
	int historical_days = 90;      // [7, 365]
	int forecast_horizon = 7;      // [1, 90]

	// Weighted moving average
	double half_life = 14.0;       // (0, 90], days

	// Availability and outlier handling
	double min_availability_factor = 0.6; // [0.1, 1]
	double outlier_cap_multiplier = 3.0;  // [1, 10]

	// Feature flags
	bool enable_seasonality = true;
	bool enable_trend_correction = true;
	bool enable_promotion_adjustment = true;

	// Result caching (honoured by callers through expires_at)
	bool enable_cache = true;
	int cache_timeout_seconds = 3600; // [60, 86400]
	int batch_size = 100;             // [1, 1000]

	// Service levels
	double service_level = 0.95;      // [0.5, 0.999]
	double safety_stock_days = 3.0;   // [0, 30]
};

/**
 * @struct PartialStockCoverageConfig
 * @brief Overrides layered on top of a base configuration.
 */
struct PartialStockCoverageConfig {
	std::optional<int> historical_days;
	std::optional<int> forecast_horizon;
	std::optional<double> half_life;
	std::optional<double> min_availability_factor;
	std::optional<double> outlier_cap_multiplier;
	std::optional<bool> enable_seasonality;
	std::optional<bool> enable_trend_correction;
	std::optional<bool> enable_promotion_adjustment;
	std::optional<bool> enable_cache;
	std::optional<int> cache_timeout_seconds;
	std::optional<int> batch_size;
	std::optional<double> service_level;
	std::optional<double> safety_stock_days;
};

/// Overlays every field set in @p partial onto @p defaults.
StockCoverageConfig merge(const PartialStockCoverageConfig &partial, const StockCoverageConfig &defaults = {});

/**
 * @brief Named tuning profiles.
 */
enum class ConfigPreset {
	Conservative, // critical items: long memory, high service level
	Balanced,     // the defaults
	Aggressive,   // fast movers: short memory, lean stock
	Minimal       // short histories and tests
};

/// Partial configuration of a preset.
PartialStockCoverageConfig presetConfig(ConfigPreset preset);

/// Case-insensitive lookup ("conservative", "balanced", ...).
std::optional<ConfigPreset> presetFromName(const std::string &name);

std::string toString(ConfigPreset preset);

} // namespace stockcoverage::config
