#include "stock-coverage/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace stockcoverage::utils {

namespace {
// Batch workers may hit the lazy initialization concurrently.
std::mutex &loggerMutex() {
	static std::mutex mutex;
	return mutex;
}
} // namespace

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	std::lock_guard<std::mutex> lock(loggerMutex());
	if (!logger_) {
		logger_ = spdlog::get("stock-coverage");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("stock-coverage");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	{
		std::lock_guard<std::mutex> lock(loggerMutex());
		if (logger_) {
			return logger_;
		}
	}
	// Initialize with default level if not already done.
	init();
	return logger_;
}

} // namespace stockcoverage::utils
