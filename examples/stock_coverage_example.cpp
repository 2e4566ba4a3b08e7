#include "stock-coverage/calculator/stock_coverage_calculator.hpp"
#include "stock-coverage/config/config.hpp"
#include "stock-coverage/core/errors.hpp"
#include "stock-coverage/service/in_memory_sales_data_source.hpp"
#include "stock-coverage/service/stock_coverage_service.hpp"
#include "stock-coverage/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace stockcoverage;

namespace {

struct CatalogueItem {
    std::string sku;
    double base_demand;
    double daily_growth;
    double weekend_uplift;
    double stockout_probability;
    core::Product product;
};

// Poisson daily sales with a weekend uplift, growth, occasional promotions and partial stockouts.
core::StockCoverageInput generateHistory(const CatalogueItem& item, core::TimePoint today, int days,
                                         unsigned int seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    core::StockCoverageInput input;
    input.product = item.product;
    input.current_date = today;

    for (int age = days - 1; age >= 0; --age) {
        const auto date = core::calendar::addDays(today, -age);
        const int dow = core::calendar::dayOfWeek(date);
        const bool weekend = dow == 0 || dow == 6;
        const bool promotion = unit(gen) < 0.05;

        double lambda = item.base_demand * std::pow(1.0 + item.daily_growth, days - age);
        if (weekend) {
            lambda *= item.weekend_uplift;
        }
        if (promotion) {
            lambda *= 1.6;
        }

        double minutes = core::kMinutesPerDay;
        if (unit(gen) < item.stockout_probability) {
            minutes = core::kMinutesPerDay * unit(gen) * 0.5;
            lambda *= minutes / core::kMinutesPerDay;
        }

        std::poisson_distribution<int> poisson(std::max(lambda, 1e-6));
        input.sales_history.push_back({date, static_cast<double>(poisson(gen)), promotion});
        input.stock_availability.push_back({date, minutes});
    }
    return input;
}

void printResult(const std::string& sku, const core::StockCoverageResult& r) {
    std::cout << std::left << std::setw(10) << sku << std::right << std::fixed << std::setprecision(1)
              << std::setw(9) << r.coverage_days_p10 << std::setw(9) << r.coverage_days << std::setw(9)
              << r.coverage_days_p90 << std::setw(10) << std::setprecision(2) << r.demand_forecast << std::setw(8)
              << r.trend_factor << std::setw(9) << std::setprecision(0) << r.reorder_point << std::setw(9)
              << r.reorder_quantity << std::setw(8) << std::setprecision(2) << r.stockout_risk << std::setw(8)
              << r.confidence << "\n";
}

void printHeader() {
    std::cout << std::left << std::setw(10) << "SKU" << std::right << std::setw(9) << "P10" << std::setw(9) << "P50"
              << std::setw(9) << "P90" << std::setw(10) << "Demand" << std::setw(8) << "Trend" << std::setw(9)
              << "ROP" << std::setw(9) << "Qty" << std::setw(8) << "Risk" << std::setw(8) << "Conf" << "\n";
    std::cout << std::string(89, '-') << "\n";
}

} // namespace

int main() {
    utils::Logging::init(spdlog::level::warn);

    std::cout << "Stock coverage forecasting example\n\n";

    const auto today = core::calendar::makeDate(2024, 6, 30);
    const std::vector<CatalogueItem> catalogue = {
        {"SKU-1001", 12.0, 0.000, 1.4, 0.02, {"SKU-1001", 180.0, 50.0, 600.0, 7.0, 4.5}},
        {"SKU-1002", 3.0, 0.004, 1.1, 0.05, {"SKU-1002", 15.0, 20.0, 120.0, 14.0, 18.0}},
        {"SKU-1003", 40.0, -0.003, 1.8, 0.00, {"SKU-1003", 2400.0, 200.0, 3000.0, 5.0, 1.2}},
        {"SKU-1004", 0.5, 0.000, 1.0, 0.10, {"SKU-1004", 40.0, 5.0, 60.0, 21.0, 0.0}},
        {"SKU-1005", 25.0, 0.010, 1.2, 0.20, {"SKU-1005", 90.0, 100.0, 900.0, 10.0, 7.9}},
    };

    auto source = std::make_shared<service::InMemorySalesDataSource>();
    unsigned int seed = 7;
    for (const auto& item : catalogue) {
        source->add(generateHistory(item, today, 150, seed++));
    }

    // A product with a malformed stock level to show partial batch failure.
    core::StockCoverageInput broken = generateHistory(catalogue.front(), today, 30, 99);
    broken.product.sku = "SKU-9999";
    broken.product.current_stock = -5.0;
    source->add(broken);

    try {
        const auto preset = config::presetConfig(config::ConfigPreset::Balanced);
        service::StockCoverageService service(source, preset);

        std::cout << "Single calculation (balanced preset)\n";
        printHeader();
        printResult("SKU-1001", service.calculateCoverage("SKU-1001"));

        std::cout << "\nBatch calculation\n";
        const auto summary = service.calculateBatchCoverage(source->listSkus(), [](std::size_t done, std::size_t total) {
            std::cout << "  progress " << done << "/" << total << "\n";
        });
        std::cout << "  " << summary.successful.size() << " successful, " << summary.failed.size() << " failed, "
                  << std::setprecision(2) << summary.average_time_per_sku_ms << " ms per SKU\n";
        for (const auto& entry : summary.errors) {
            std::cout << "  " << entry.first << ": " << entry.second << "\n";
        }

        std::cout << "\nAll presets for SKU-1002\n";
        printHeader();
        for (const auto preset_kind : {config::ConfigPreset::Conservative, config::ConfigPreset::Balanced,
                                       config::ConfigPreset::Aggressive, config::ConfigPreset::Minimal}) {
            const calculator::StockCoverageCalculator calc(config::presetConfig(preset_kind));
            printResult(config::toString(preset_kind), calc.calculate(*source->fetch("SKU-1002", 365)));
        }

        std::cout << "\nProducts at risk (risk >= 0.3)\n";
        for (const auto& entry : service.getStockoutRiskProducts(0.3)) {
            std::cout << "  " << entry.product.sku << " risk " << std::setprecision(2) << entry.coverage.stockout_risk
                      << ", stockout in ~" << entry.days_until_stockout << " days\n";
        }

        const auto insights = service.getCoverageWithInsights("SKU-1003");
        std::cout << "\nInsights for SKU-1003\n"
                  << "  recent daily sales " << std::setprecision(1) << insights.insights.recent_average_daily_sales
                  << ", turnover " << insights.insights.stock_turnover << "/year"
                  << ", overstocked " << (insights.insights.is_overstocked ? "yes" : "no") << ", reorder "
                  << (insights.insights.needs_reorder ? "yes" : "no") << "\n";
    } catch (const core::StockCoverageCalculationError& e) {
        std::cerr << "Calculation failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
