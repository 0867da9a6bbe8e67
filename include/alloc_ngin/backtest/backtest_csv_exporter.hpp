// include/alloc_ngin/backtest/backtest_csv_exporter.hpp

#pragma once

#include <fstream>
#include <string>
#include <vector>
#include "alloc_ngin/backtest/backtest_results.hpp"
#include "alloc_ngin/core/error.hpp"

namespace alloc_ngin {
namespace backtest {

/**
 * @brief One line of weights.csv
 */
struct WeightRow {
    size_t period{0};
    std::string strategy;
    std::string asset;
    double weight{0.0};
    bool degraded{false};
};

/**
 * @brief Writes backtest results as CSV files plus a JSON document
 *
 * Files: weights.csv, returns.csv, metrics.csv, significance.csv,
 * degraded.csv, skipped.csv and results.json. Doubles use 17 significant
 * digits so reading them back reproduces the written values.
 */
class BacktestCSVExporter {
public:
    explicit BacktestCSVExporter(const std::string& output_directory);

    Result<void> export_results(const BacktestResults& results) const;

    Result<void> write_weights(const BacktestResults& results) const;
    Result<void> write_returns(const BacktestResults& results) const;
    Result<void> write_metrics(const BacktestResults& results) const;
    Result<void> write_significance(const BacktestResults& results) const;
    Result<void> write_run_summary(const BacktestResults& results) const;
    Result<void> write_json(const BacktestResults& results) const;

    /**
     * @brief Read back a weights.csv written by write_weights
     */
    static Result<std::vector<WeightRow>> read_weights(const std::string& path);

    const std::string& output_directory() const {
        return output_directory_;
    }

private:
    Result<void> open_file(const std::string& name, std::ofstream& file) const;

    std::string output_directory_;
};

}  // namespace backtest
}  // namespace alloc_ngin
