#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include "alloc_ngin/backtest/backtest_config.hpp"
#include "alloc_ngin/backtest/backtest_csv_exporter.hpp"
#include "alloc_ngin/backtest/backtest_orchestrator.hpp"
#include "alloc_ngin/core/config_base.hpp"
#include "alloc_ngin/core/logger.hpp"
#include "alloc_ngin/data/returns_csv_loader.hpp"

using namespace alloc_ngin;
using namespace alloc_ngin::backtest;

namespace {

std::string format_optional(const std::optional<double>& value) {
    if (!value)
        return "n/a";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << *value;
    return oss.str();
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <config.json> <returns.csv> [output_dir]" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }
    const std::string config_path = argv[1];
    const std::string returns_path = argv[2];
    const std::string output_dir = argc > 3 ? argv[3] : "results";

    try {
        auto document = read_json_file(config_path);
        if (document.is_error()) {
            std::cerr << "Failed to read config: " << document.error()->to_string() << std::endl;
            return 1;
        }

        LoggerConfig logger_config;
        logger_config.min_level = LogLevel::INFO;
        logger_config.destination = LogDestination::BOTH;
        logger_config.log_directory = "logs";
        logger_config.filename_prefix = "bt_allocation";
        if (document.value().contains("logging")) {
            auto applied = logger_config.load_from_json(document.value().at("logging"));
            if (applied.is_error()) {
                std::cerr << "Failed to load logging config: " << applied.error()->to_string()
                          << std::endl;
                return 1;
            }
        }

        auto& logger = Logger::instance();
        logger.initialize(logger_config);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("bt_allocation");

        BacktestConfig config;
        auto loaded = config.load_from_json(document.value());
        if (loaded.is_error()) {
            std::cerr << "Failed to load config: " << loaded.error()->to_string() << std::endl;
            return 1;
        }
        INFO("Loaded configuration from " << config_path);

        ReturnsCSVLoader loader;
        auto returns = loader.load(returns_path);
        if (returns.is_error()) {
            std::cerr << "Failed to load returns: " << returns.error()->to_string() << std::endl;
            return 1;
        }

        BacktestOrchestrator orchestrator(config);
        auto results = orchestrator.run(returns.value());
        if (results.is_error()) {
            std::cerr << "Backtest failed: " << results.error()->to_string() << std::endl;
            return 1;
        }

        const BacktestResults& backtest = results.value();
        INFO("Consolidated results:");
        for (const auto& summary : backtest.summaries) {
            const auto& m = summary.metrics;
            INFO(std::left << std::setw(14) << strategy_to_string(summary.strategy) << std::fixed
                           << std::setprecision(4) << " return " << m.annual_return
                           << " vol " << m.annual_volatility << " sharpe "
                           << format_optional(m.sharpe_ratio) << " sortino "
                           << format_optional(m.sortino_ratio) << " max_dd " << m.max_drawdown
                           << " turnover " << summary.average_turnover << " degraded "
                           << summary.degraded_periods << "/" << summary.recorded_periods);
        }
        for (const auto& comparison : backtest.comparisons) {
            std::ostringstream line;
            line << strategy_to_string(comparison.strategy_a) << " vs "
                 << strategy_to_string(comparison.strategy_b) << ": "
                 << comparison_status_to_string(comparison.status);
            if (comparison.jobson_korkie) {
                line << " JK z=" << comparison.jobson_korkie->statistic
                     << " p=" << comparison.jobson_korkie->p_value;
            }
            if (comparison.bootstrap) {
                line << " bootstrap p=" << comparison.bootstrap->p_value << " CI ["
                     << comparison.bootstrap->ci_lower << ", " << comparison.bootstrap->ci_upper
                     << "]";
            }
            INFO(line.str());
        }

        BacktestCSVExporter exporter(output_dir);
        auto exported = exporter.export_results(backtest);
        if (exported.is_error()) {
            std::cerr << "Failed to export results: " << exported.error()->to_string()
                      << std::endl;
            return 1;
        }

        std::cout << "Results written to " << output_dir << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
