#include <catch2/catch_test_macros.hpp>

#include "stock-coverage/utils/logging.hpp"

#include <spdlog/spdlog.h>

#include <future>
#include <vector>

using stockcoverage::utils::Logging;

TEST_CASE("Logging initializes singleton logger", "[utils][logging]") {
	auto &logger_ref = Logging::getLogger();
	REQUIRE(logger_ref);
	REQUIRE(logger_ref->name() == "stock-coverage");

	const auto first_level = logger_ref->level();

	Logging::init(spdlog::level::debug);
	auto &logger_after_init = Logging::getLogger();

	REQUIRE(logger_ref.get() == logger_after_init.get());
	REQUIRE(logger_after_init->level() == spdlog::level::debug);
	REQUIRE(logger_after_init->flush_level() == spdlog::level::debug);

	// Restore to original level for downstream tests
	logger_after_init->set_level(first_level);
	logger_after_init->flush_on(first_level);
}

TEST_CASE("Logging hands the same logger to concurrent callers", "[utils][logging]") {
	std::vector<std::future<spdlog::logger *>> futures;
	for (int i = 0; i < 8; ++i) {
		futures.push_back(std::async(std::launch::async, [] { return Logging::getLogger().get(); }));
	}
	spdlog::logger *expected = Logging::getLogger().get();
	for (auto &future : futures) {
		REQUIRE(future.get() == expected);
	}
}

TEST_CASE("Logging macros respect the configured level", "[utils][logging]") {
	auto &logger = Logging::getLogger();
	const auto original = logger->level();

	Logging::init(spdlog::level::off);
	REQUIRE_NOTHROW(STOCKCOVERAGE_ERROR("suppressed {}", 1));
	REQUIRE_FALSE(logger->should_log(spdlog::level::critical));

	Logging::init(original);
	REQUIRE(logger->level() == original);
}
