#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace stockcoverage::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * A single named logger is shared by every pipeline stage and by the batch
 * workers, so the level configured at startup applies everywhere.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace stockcoverage::utils

// --- Logger Macros for convenient access ---
#define STOCKCOVERAGE_TRACE(...)    stockcoverage::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define STOCKCOVERAGE_DEBUG(...)    stockcoverage::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define STOCKCOVERAGE_INFO(...)     stockcoverage::utils::Logging::getLogger()->info(__VA_ARGS__)
#define STOCKCOVERAGE_WARN(...)     stockcoverage::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define STOCKCOVERAGE_ERROR(...)    stockcoverage::utils::Logging::getLogger()->error(__VA_ARGS__)
#define STOCKCOVERAGE_CRITICAL(...) stockcoverage::utils::Logging::getLogger()->critical(__VA_ARGS__)
