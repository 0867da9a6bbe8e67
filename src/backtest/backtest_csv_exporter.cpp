// src/backtest/backtest_csv_exporter.cpp

#include "alloc_ngin/backtest/backtest_csv_exporter.hpp"
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include "alloc_ngin/core/logger.hpp"
#include "alloc_ngin/core/time_utils.hpp"

namespace alloc_ngin {
namespace backtest {

namespace {

constexpr int CSV_PRECISION = std::numeric_limits<double>::max_digits10;

std::string optional_to_csv(const std::optional<double>& value) {
    if (!value)
        return "";
    std::ostringstream oss;
    oss << std::setprecision(CSV_PRECISION) << *value;
    return oss.str();
}

// Quoted CSV field with embedded quotes doubled
std::string quote_csv(const std::string& text) {
    std::string quoted = "\"";
    for (char c : text) {
        if (c == '"')
            quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void write_metrics_row(std::ofstream& file, const std::string& strategy, const std::string& scope,
                       const PerformanceMetrics& m) {
    file << strategy << ',' << scope << ',' << m.num_periods << ',' << m.total_return << ','
         << m.annual_return << ',' << m.annual_volatility << ',' << m.annual_risk_free << ','
         << optional_to_csv(m.sharpe_ratio) << ',' << optional_to_csv(m.sortino_ratio) << ','
         << m.downside_deviation << ',' << m.max_drawdown << ',' << m.var_95 << ',' << m.cvar_95
         << '\n';
}

void write_comparison_row(std::ofstream& file, const std::string& scope,
                          const StrategyComparison& c) {
    file << scope << ',' << strategy_to_string(c.strategy_a) << ','
         << strategy_to_string(c.strategy_b) << ',' << comparison_status_to_string(c.status)
         << ',';
    if (c.jobson_korkie) {
        const auto& jk = *c.jobson_korkie;
        file << jk.sharpe_a << ',' << jk.sharpe_b << ',' << jk.difference << ',' << jk.statistic
             << ',' << jk.p_value << ',' << (jk.significant ? 1 : 0);
    } else {
        file << ",,,,,";
    }
    file << ',';
    if (c.bootstrap) {
        const auto& b = *c.bootstrap;
        file << b.bootstrap_std << ',' << b.ci_lower << ',' << b.ci_upper << ',' << b.p_value
             << ',' << (b.significant ? 1 : 0);
    } else {
        file << ",,,,";
    }
    file << '\n';
}

}  // namespace

BacktestCSVExporter::BacktestCSVExporter(const std::string& output_directory)
    : output_directory_(output_directory) {
    Logger::register_component("BacktestCSVExporter");
}

Result<void> BacktestCSVExporter::open_file(const std::string& name, std::ofstream& file) const {
    try {
        std::filesystem::create_directories(output_directory_);
        file.open(std::filesystem::path(output_directory_) / name);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open " + name + " for writing",
                                    "BacktestCSVExporter");
        }
        file << std::setprecision(CSV_PRECISION);
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Error creating " + name + ": " + e.what(),
                                "BacktestCSVExporter");
    }
}

Result<void> BacktestCSVExporter::export_results(const BacktestResults& results) const {
    using Writer = Result<void> (BacktestCSVExporter::*)(const BacktestResults&) const;
    const Writer writers[] = {&BacktestCSVExporter::write_weights,
                              &BacktestCSVExporter::write_returns,
                              &BacktestCSVExporter::write_metrics,
                              &BacktestCSVExporter::write_significance,
                              &BacktestCSVExporter::write_run_summary,
                              &BacktestCSVExporter::write_json};
    for (Writer writer : writers) {
        auto written = (this->*writer)(results);
        if (written.is_error()) {
            return written;
        }
    }
    INFO("Exported backtest results to " << output_directory_);
    return Result<void>();
}

Result<void> BacktestCSVExporter::write_weights(const BacktestResults& results) const {
    std::ofstream file;
    auto opened = open_file("weights.csv", file);
    if (opened.is_error())
        return opened;

    file << "period,strategy,asset,weight,degraded\n";
    for (const auto& record : results.periods) {
        if (record.state != PeriodState::RECORDED)
            continue;
        for (const auto& s : record.strategies) {
            const auto& weights = s.weights();
            for (size_t i = 0; i < weights.size(); ++i) {
                file << record.period.index + 1 << ',' << strategy_to_string(s.strategy) << ','
                     << weights.assets()[i] << ',' << weights[i] << ','
                     << (s.degraded() ? 1 : 0) << '\n';
            }
        }
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::write_returns(const BacktestResults& results) const {
    std::ofstream file;
    auto opened = open_file("returns.csv", file);
    if (opened.is_error())
        return opened;

    file << "date,period,strategy,return,risk_free\n";
    for (const auto& record : results.periods) {
        if (record.state != PeriodState::RECORDED)
            continue;
        for (const auto& s : record.strategies) {
            for (size_t t = 0; t < s.returns.size(); ++t) {
                file << core::format_iso_date(record.dates[t]) << ',' << record.period.index + 1
                     << ',' << strategy_to_string(s.strategy) << ',' << s.returns[t] << ','
                     << record.risk_free[t] << '\n';
            }
        }
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::write_metrics(const BacktestResults& results) const {
    std::ofstream file;
    auto opened = open_file("metrics.csv", file);
    if (opened.is_error())
        return opened;

    file << "strategy,scope,num_periods,total_return,annual_return,annual_volatility,"
         << "annual_risk_free,sharpe_ratio,sortino_ratio,downside_deviation,max_drawdown,"
         << "var_95,cvar_95\n";
    for (const auto& summary : results.summaries) {
        write_metrics_row(file, strategy_to_string(summary.strategy), "consolidated",
                          summary.metrics);
    }
    for (const auto& record : results.periods) {
        if (record.state != PeriodState::RECORDED)
            continue;
        for (const auto& s : record.strategies) {
            write_metrics_row(file, strategy_to_string(s.strategy),
                              "period_" + std::to_string(record.period.index + 1), s.metrics);
        }
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::write_significance(const BacktestResults& results) const {
    std::ofstream file;
    auto opened = open_file("significance.csv", file);
    if (opened.is_error())
        return opened;

    file << "scope,strategy_a,strategy_b,status,sharpe_a,sharpe_b,difference,jk_statistic,"
         << "jk_p_value,jk_significant,bootstrap_std,ci_lower,ci_upper,bootstrap_p_value,"
         << "bootstrap_significant\n";
    for (const auto& comparison : results.comparisons) {
        write_comparison_row(file, "consolidated", comparison);
    }
    for (const auto& record : results.periods) {
        for (const auto& comparison : record.comparisons) {
            write_comparison_row(file, "period_" + std::to_string(record.period.index + 1),
                                 comparison);
        }
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::write_run_summary(const BacktestResults& results) const {
    std::ofstream skipped;
    auto opened = open_file("skipped.csv", skipped);
    if (opened.is_error())
        return opened;
    skipped << "period,reason\n";
    for (const auto& skip : results.skipped) {
        skipped << quote_csv(skip.period) << ',' << quote_csv(skip.reason) << '\n';
    }

    std::ofstream degraded;
    opened = open_file("degraded.csv", degraded);
    if (opened.is_error())
        return opened;
    degraded << "period,strategy,kind,cause,message\n";
    for (const auto& entry : results.degraded) {
        degraded << quote_csv(entry.period) << ',' << strategy_to_string(entry.strategy) << ','
                 << warning_kind_to_string(entry.warning.kind) << ','
                 << error_code_to_string(entry.warning.cause) << ','
                 << quote_csv(entry.warning.message) << '\n';
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::write_json(const BacktestResults& results) const {
    std::ofstream file;
    auto opened = open_file("results.json", file);
    if (opened.is_error())
        return opened;
    try {
        file << std::setw(2) << results.to_json() << std::endl;
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::CONVERSION_ERROR,
                                std::string("Failed to serialize results: ") + e.what(),
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

Result<std::vector<WeightRow>> BacktestCSVExporter::read_weights(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<std::vector<WeightRow>>(ErrorCode::FILE_NOT_FOUND,
                                                  "Cannot open weights file: " + path,
                                                  "BacktestCSVExporter");
    }

    std::vector<WeightRow> rows;
    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (line_number == 1 || line.empty())
            continue;

        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string field;
        while (std::getline(ss, field, ',')) {
            fields.push_back(field);
        }
        if (fields.size() != 5) {
            return make_error<std::vector<WeightRow>>(
                ErrorCode::INVALID_DATA,
                path + ":" + std::to_string(line_number) + ": expected 5 fields",
                "BacktestCSVExporter");
        }

        WeightRow row;
        char* end = nullptr;
        errno = 0;
        row.period = static_cast<size_t>(std::strtoul(fields[0].c_str(), &end, 10));
        if (fields[0].empty() || fields[0].front() == '-' || *end != '\0' || errno != 0) {
            return make_error<std::vector<WeightRow>>(
                ErrorCode::INVALID_DATA,
                path + ":" + std::to_string(line_number) + ": invalid period",
                "BacktestCSVExporter");
        }
        row.strategy = fields[1];
        row.asset = fields[2];
        row.weight = std::strtod(fields[3].c_str(), &end);
        if (fields[3].empty() || *end != '\0' || errno != 0) {
            return make_error<std::vector<WeightRow>>(
                ErrorCode::INVALID_DATA,
                path + ":" + std::to_string(line_number) + ": invalid weight",
                "BacktestCSVExporter");
        }
        if (fields[4] != "0" && fields[4] != "1") {
            return make_error<std::vector<WeightRow>>(
                ErrorCode::INVALID_DATA,
                path + ":" + std::to_string(line_number) + ": degraded flag must be 0 or 1",
                "BacktestCSVExporter");
        }
        row.degraded = fields[4] == "1";
        rows.push_back(std::move(row));
    }
    return rows;
}

}  // namespace backtest
}  // namespace alloc_ngin
